/// contains SQLite wrappers and the read-only region dataset accessor

#pragma once

#include <sqlite3.h>

#include "config.hpp"
#include "private/geo_utils.hpp"


/// RAII wrapper for a prepared SQLite statement
struct SQLiteStatement {

    SQLiteStatement(sqlite3* pDatabase, const std::string& sSQL):
            m_pDatabase(pDatabase), m_pStatement(nullptr) {
        if(sqlite3_prepare_v2(pDatabase, sSQL.c_str(), -1, &m_pStatement, nullptr) != SQLITE_OK) {
            const std::string sError = sqlite3_errmsg(pDatabase);
            sqlite3_finalize(m_pStatement);
            throw StoreError("failed to prepare statement (" + sError + "): " + sSQL);
        }
    }

    ~SQLiteStatement() {
        sqlite3_finalize(m_pStatement);
    }

    SQLiteStatement(const SQLiteStatement&) = delete;
    SQLiteStatement& operator=(const SQLiteStatement&) = delete;

    void bindText(int nParamIdx, const std::string& sValue) {
        checkBind(sqlite3_bind_text(m_pStatement, nParamIdx, sValue.c_str(), (int)sValue.size(), SQLITE_TRANSIENT));
    }

    void bindDouble(int nParamIdx, double dValue) {
        checkBind(sqlite3_bind_double(m_pStatement, nParamIdx, dValue));
    }

    void bindInt64(int nParamIdx, int64_t nValue) {
        checkBind(sqlite3_bind_int64(m_pStatement, nParamIdx, (sqlite3_int64)nValue));
    }

    void bindBlob(int nParamIdx, const ByteArray& vValue) {
        checkBind(sqlite3_bind_blob(m_pStatement, nParamIdx, vValue.data(), (int)vValue.size(), SQLITE_TRANSIENT));
    }

    void bindNull(int nParamIdx) {
        checkBind(sqlite3_bind_null(m_pStatement, nParamIdx));
    }

    /// steps the statement and returns the raw SQLite result code (for callers handling constraints)
    int stepRaw() {
        return sqlite3_step(m_pStatement);
    }

    /// steps the statement; returns true if a row is available and false once done
    bool step() {
        const int nResult = stepRaw();
        if(nResult == SQLITE_ROW)
            return true;
        if(nResult == SQLITE_DONE)
            return false;
        throw StoreError("failed to step statement: " + std::string(sqlite3_errmsg(m_pDatabase)));
    }

    /// returns a text column value (NULL values are returned as empty strings)
    std::string getText(int nColIdx) const {
        const unsigned char* acText = sqlite3_column_text(m_pStatement, nColIdx);
        if(acText == nullptr)
            return std::string();
        return std::string(reinterpret_cast<const char*>(acText), (size_t)sqlite3_column_bytes(m_pStatement, nColIdx));
    }

    double getDouble(int nColIdx) const {
        return sqlite3_column_double(m_pStatement, nColIdx);
    }

    int64_t getInt64(int nColIdx) const {
        return (int64_t)sqlite3_column_int64(m_pStatement, nColIdx);
    }

    ByteArray getBlob(int nColIdx) const {
        const auto* aData = static_cast<const uint8_t*>(sqlite3_column_blob(m_pStatement, nColIdx));
        const int nSize = sqlite3_column_bytes(m_pStatement, nColIdx);
        if(aData == nullptr || nSize <= 0)
            return ByteArray();
        return ByteArray(aData, aData + nSize);
    }

private:

    void checkBind(int nResult) {
        if(nResult != SQLITE_OK)
            throw StoreError("failed to bind parameter: " + std::string(sqlite3_errmsg(m_pDatabase)));
    }

    sqlite3* m_pDatabase;
    sqlite3_stmt* m_pStatement;
};

/// RAII wrapper for an SQLite database connection
struct SQLiteDatabase {

    SQLiteDatabase(const std::string& sPath, int nOpenFlags):
            m_pDatabase(nullptr) {
        if(sqlite3_open_v2(sPath.c_str(), &m_pDatabase, nOpenFlags, nullptr) != SQLITE_OK) {
            const std::string sError = m_pDatabase ? sqlite3_errmsg(m_pDatabase) : "out of memory";
            sqlite3_close(m_pDatabase);
            throw StoreError("failed to open database '" + sPath + "': " + sError);
        }
    }

    ~SQLiteDatabase() {
        sqlite3_close(m_pDatabase);
    }

    SQLiteDatabase(const SQLiteDatabase&) = delete;
    SQLiteDatabase& operator=(const SQLiteDatabase&) = delete;

    /// executes one or more statements that return no rows
    void execute(const std::string& sSQL) {
        char* acError = nullptr;
        if(sqlite3_exec(m_pDatabase, sSQL.c_str(), nullptr, nullptr, &acError) != SQLITE_OK) {
            const std::string sError = acError ? acError : sqlite3_errmsg(m_pDatabase);
            sqlite3_free(acError);
            throw StoreError("failed to execute statement (" + sError + "): " + sSQL);
        }
    }

    void setBusyTimeout(int nTimeoutMsec) {
        sqlite3_busy_timeout(m_pDatabase, nTimeoutMsec);
    }

    sqlite3* get() const {
        return m_pDatabase;
    }

private:
    sqlite3* m_pDatabase;
};

/// returns the read-only/immutable URI used to open a GeoPackage file
inline std::string getReadOnlyDatasetURI(const std::string& sPath) {
    std::string sEscapedPath;
    sEscapedPath.reserve(sPath.size());
    for(char c : sPath) {
        if(c == '%')
            sEscapedPath += "%25";
        else if(c == '?')
            sEscapedPath += "%3f";
        else if(c == '#')
            sEscapedPath += "%23";
        else
            sEscapedPath += c;
    }
    return "file:" + sEscapedPath + "?mode=ro&immutable=1";
}

/// region row fetched by code (used to build node information)
struct RegionRecord {
    HierarchyNode oNode;
    ByteArray vGeometryBlob;
};

/// read-only access to the region table and its spatial index, serialized on one connection
struct RegionDataset {

    explicit RegionDataset(const RegionLookupConfig& oConfig):
            m_oDatabase(
                    getReadOnlyDatasetURI(oConfig.sDatasetPath),
                    SQLITE_OPEN_READONLY | SQLITE_OPEN_URI | SQLITE_OPEN_NOMUTEX),
            m_nCandidateLimit(RegionLookupConfig::sanitizeCandidateLimit(oConfig.nCandidateLimit)) {
        if(!isSafeIdentifier(oConfig.sTableName) || !isSafeIdentifier(oConfig.sGeometryColumn))
            throw StoreError("invalid region table/geometry column name");
        m_oDatabase.setBusyTimeout(5000);
        buildQueries(oConfig.sTableName, oConfig.sGeometryColumn, oConfig.getSpatialIndexTableName());
        // preparing the candidate query validates the table/index/column layout up front
        SQLiteStatement oCheck(m_oDatabase.get(), m_sCandidateSQL);
    }

    /// returns the rows whose spatial index box contains the point, in index scan order
    RegionCandidateArray findCandidates(const GeoPoint& oPoint) {
        RegionCandidateArray vCandidates;
        const std::lock_guard<std::mutex> oLock(m_oConnectionMutex);
        SQLiteStatement oQuery(m_oDatabase.get(), m_sCandidateSQL);
        oQuery.bindDouble(1, oPoint.dLongitude);
        oQuery.bindDouble(2, oPoint.dLongitude);
        oQuery.bindDouble(3, oPoint.dLatitude);
        oQuery.bindDouble(4, oPoint.dLatitude);
        oQuery.bindInt64(5, m_nCandidateLimit);
        while(oQuery.step()) {
            RegionCandidate oCandidate;
            oCandidate.nRowID = oQuery.getInt64(0);
            oCandidate.oEnvelope = GeomEnvelope(
                    oQuery.getDouble(1), oQuery.getDouble(2), oQuery.getDouble(3), oQuery.getDouble(4));
            for(size_t nLevelIdx = 0u; nLevelIdx < level::s_nLevelCount; ++nLevelIdx) {
                oCandidate.asCodes[nLevelIdx] = oQuery.getText(int(5u + nLevelIdx));
                oCandidate.asNames[nLevelIdx] = oQuery.getText(int(5u + level::s_nLevelCount + nLevelIdx));
            }
            oCandidate.vGeometryBlob = oQuery.getBlob(int(5u + 2u * level::s_nLevelCount));
            vCandidates.push_back(std::move(oCandidate));
        }
        return vCandidates;
    }

    /// returns whether at least one row carries the code in the column of the given level
    bool hasCodeAtLevel(const RegionCode& sCode, RegionLevel eLevel) {
        const std::lock_guard<std::mutex> oLock(m_oConnectionMutex);
        SQLiteStatement oQuery(m_oDatabase.get(), m_asLevelProbeSQL[level::toIndex(eLevel)]);
        oQuery.bindText(1, sCode);
        return oQuery.step();
    }

    /// returns the distinct direct children of a region, sorted case-insensitively by name
    HierarchyNodeArray queryChildren(const RegionCode& sParentCode, RegionLevel eParentLevel) {
        HierarchyNodeArray vChildren;
        if(level::isLeaf(eParentLevel))
            return vChildren;
        const RegionLevel eChildLevel = level::getChildLevel(eParentLevel);
        const std::lock_guard<std::mutex> oLock(m_oConnectionMutex);
        SQLiteStatement oQuery(m_oDatabase.get(), m_asChildrenSQL[level::toIndex(eParentLevel)]);
        oQuery.bindText(1, sParentCode);
        while(oQuery.step())
            vChildren.emplace_back(oQuery.getText(0), oQuery.getText(1), sParentCode, eChildLevel);
        return vChildren;
    }

    /// returns the first row holding the code at the given level (throws if there is none)
    RegionRecord fetchRegion(const RegionCode& sCode, RegionLevel eLevel) {
        const std::lock_guard<std::mutex> oLock(m_oConnectionMutex);
        SQLiteStatement oQuery(m_oDatabase.get(), m_asRegionSQL[level::toIndex(eLevel)]);
        oQuery.bindText(1, sCode);
        if(!oQuery.step())
            throw NotFoundError("region code '" + sCode + "'");
        RegionRecord oRecord;
        oRecord.oNode = HierarchyNode(oQuery.getText(0), oQuery.getText(1), oQuery.getText(2), eLevel);
        oRecord.vGeometryBlob = oQuery.getBlob(3);
        return oRecord;
    }

    /// returns the maximum number of candidates returned by spatial index queries
    int getCandidateLimit() const {
        return m_nCandidateLimit;
    }

private:

    void buildQueries(const std::string& sTable, const std::string& sGeomCol, const std::string& sIndexTable) {
        std::stringstream ssCandidateSQL;
        ssCandidateSQL << "SELECT r.id, r.minx, r.maxx, r.miny, r.maxy";
        for(RegionLevel eLevel : level::s_aeAllLevels)
            ssCandidateSQL << ", a." << level::getCodeColumn(eLevel);
        for(RegionLevel eLevel : level::s_aeAllLevels)
            ssCandidateSQL << ", a." << level::getNameColumn(eLevel);
        ssCandidateSQL << ", a." << sGeomCol
                       << " FROM " << sTable << " AS a JOIN " << sIndexTable << " AS r ON a.rowid = r.id"
                       << " WHERE r.minx <= ? AND r.maxx >= ? AND r.miny <= ? AND r.maxy >= ?"
                       << " LIMIT ?;";
        m_sCandidateSQL = ssCandidateSQL.str();
        for(RegionLevel eLevel : level::s_aeAllLevels) {
            const size_t nLevelIdx = level::toIndex(eLevel);
            const std::string sCodeCol = level::getCodeColumn(eLevel);
            const std::string sNameCol = level::getNameColumn(eLevel);
            m_asLevelProbeSQL[nLevelIdx] =
                    "SELECT 1 FROM " + sTable + " WHERE " + sCodeCol + " = ? LIMIT 1;";
            const std::string sParentCol =
                    level::isRoot(eLevel) ? "NULL" : level::getCodeColumn(level::getParentLevel(eLevel));
            m_asRegionSQL[nLevelIdx] =
                    "SELECT " + sCodeCol + ", " + sNameCol + ", " + sParentCol + ", " + sGeomCol +
                    " FROM " + sTable + " WHERE " + sCodeCol + " = ? LIMIT 1;";
            if(level::isLeaf(eLevel))
                continue;
            const RegionLevel eChildLevel = level::getChildLevel(eLevel);
            const std::string sChildCodeCol = level::getCodeColumn(eChildLevel);
            const std::string sChildNameCol = level::getNameColumn(eChildLevel);
            m_asChildrenSQL[nLevelIdx] =
                    "SELECT DISTINCT " + sChildCodeCol + ", " + sChildNameCol + " FROM " + sTable +
                    " WHERE " + sCodeCol + " = ? AND " + sChildCodeCol + " IS NOT NULL AND " +
                    sChildCodeCol + " <> '' AND " + sChildNameCol + " IS NOT NULL" +
                    " ORDER BY " + sChildNameCol + " COLLATE NOCASE, " + sChildCodeCol + ";";
        }
    }

    std::mutex m_oConnectionMutex;
    SQLiteDatabase m_oDatabase;
    const int m_nCandidateLimit;
    std::string m_sCandidateSQL;
    std::array<std::string, level::s_nLevelCount> m_asLevelProbeSQL;
    std::array<std::string, level::s_nLevelCount> m_asRegionSQL;
    std::array<std::string, level::s_nLevelCount - 1u> m_asChildrenSQL;
};
