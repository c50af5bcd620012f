/// contains the elevation cache and the external elevation provider interface

#pragma once

#include "gpkg_utils.hpp"

/// elevation returned for regions whose elevation could not be fetched
#define DEFAULT_ELEVATION 0.0

/// external source of point elevations (implementations throw ProviderError on failure)
struct ElevationProvider {

    virtual ~ElevationProvider() = default;

    /// returns the elevation (in meters) at the given location
    virtual double fetchElevation(double dLatitude, double dLongitude) = 0;
};

using ElevationProviderPtr = std::shared_ptr<ElevationProvider>;

/// parses a provider response body ({results:[{elevation}], status, error_message?})
double parseElevationResponse(const std::string& sResponseBody);

/// elevation provider backed by the Google Elevation HTTP API
struct GoogleElevationProvider: ElevationProvider {

    GoogleElevationProvider(std::string sApiKey, std::string sApiUrl, long nTimeoutSec);

    double fetchElevation(double dLatitude, double dLongitude) override;

    /// returns the request URL for a location (the API key is URL-escaped)
    std::string buildRequestUrl(double dLatitude, double dLongitude) const;

private:
    const std::string m_sApiKey;
    const std::string m_sApiUrl;
    const long m_nTimeoutSec;
};

/// write-once elevation cache persisted in its own SQLite database (separate from the dataset)
struct ElevationCache {

    /// opens (and creates if needed) the elevation store; the provider may be null
    ElevationCache(const std::string& sStorePath, ElevationProviderPtr pProvider):
            m_oDatabase(
                    sStorePath,
                    SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX),
            m_pProvider(std::move(pProvider)) {
        m_oDatabase.setBusyTimeout(5000);
        m_oDatabase.execute(
                "CREATE TABLE IF NOT EXISTS elevations ("
                "gid TEXT PRIMARY KEY, "
                "elevation REAL NOT NULL);");
    }

    /// looks up a cached elevation; returns false on a cache miss (throws StoreError on failure)
    bool getCachedElevation(const RegionCode& sCode, double& dElevation) {
        SQLiteStatement oQuery(m_oDatabase.get(), "SELECT elevation FROM elevations WHERE gid = ?;");
        oQuery.bindText(1, sCode);
        if(!oQuery.step())
            return false;
        dElevation = oQuery.getDouble(0);
        return true;
    }

    /// returns the cached elevation of a region, fetching and persisting it on a cache miss
    double getOrFetchElevation(const RegionCode& sCode, double dLatitude, double dLongitude) {
        double dElevation = DEFAULT_ELEVATION;
        if(getCachedElevation(sCode, dElevation))
            return dElevation;
        try {
            if(!m_pProvider)
                throw ProviderError("no elevation provider configured");
            dElevation = m_pProvider->fetchElevation(dLatitude, dLongitude);
        }
        catch(const ProviderError& oError) {
            // failures are not persisted so that the next request retries the provider
            spdlog::warn("failed to fetch elevation for {}: {}", sCode, oError.what());
            return DEFAULT_ELEVATION;
        }
        spdlog::info("fetched elevation for {}: {}", sCode, dElevation);
        storeElevation(sCode, dElevation);
        return dElevation;
    }

    /// inserts an elevation; returns false if the code was already cached (e.g. by a concurrent fetch)
    bool storeElevation(const RegionCode& sCode, double dElevation) {
        try {
            SQLiteStatement oInsert(m_oDatabase.get(), "INSERT INTO elevations (gid, elevation) VALUES (?, ?);");
            oInsert.bindText(1, sCode);
            oInsert.bindDouble(2, dElevation);
            const int nResult = oInsert.stepRaw();
            if(nResult == SQLITE_DONE)
                return true;
            if((nResult & 0xFF) == SQLITE_CONSTRAINT) {
                spdlog::debug("elevation for {} was already cached", sCode);
                return false;
            }
            spdlog::error("failed to save elevation for {}: {}", sCode, sqlite3_errmsg(m_oDatabase.get()));
        }
        catch(const StoreError& oError) {
            spdlog::error("failed to save elevation for {}: {}", sCode, oError.what());
        }
        return false;
    }

private:
    SQLiteDatabase m_oDatabase;
    const ElevationProviderPtr m_pProvider;
};
