/// contains the runtime configuration of the region lookup API

#pragma once

#include "private/generic_utils.hpp"

#define DEFAULT_ROUND_PLACES 4
#define MAX_ROUND_PLACES 6
#define DEFAULT_CANDIDATE_LIMIT 200
#define DEFAULT_ELEVATION_TIMEOUT_SEC 10L
#define DEFAULT_ELEVATION_API_URL "https://maps.googleapis.com/maps/api/elevation/json"

/// region lookup configuration; defaults match the reference GADM GeoPackage layout
struct RegionLookupConfig {

    /// constructs a configuration filled with default values
    RegionLookupConfig():
            sDatasetPath("data/gadm_410.gpkg"),
            sTableName("gadm_410"),
            sGeometryColumn("geom"),
            nRoundPlaces(DEFAULT_ROUND_PLACES),
            nCandidateLimit(DEFAULT_CANDIDATE_LIMIT),
            sElevationStorePath("data/elevations.db"),
            sElevationApiUrl(DEFAULT_ELEVATION_API_URL),
            nElevationTimeoutSec(DEFAULT_ELEVATION_TIMEOUT_SEC),
            sDefaultParentCode("IDN") {}

    /// constructs a configuration from the process environment (unset variables keep defaults)
    static RegionLookupConfig fromEnvironment() {
        RegionLookupConfig oConfig;
        oConfig.sDatasetPath = getEnvOrDefault("GPKG_PATH", oConfig.sDatasetPath);
        oConfig.sTableName = getEnvOrDefault("GPKG_TABLE", oConfig.sTableName);
        oConfig.sGeometryColumn = getEnvOrDefault("GPKG_GEOM_COL", oConfig.sGeometryColumn);
        oConfig.nRoundPlaces = sanitizeRoundPlaces(
                parseIntOrDefault(getEnvOrDefault("ROUND_PLACES", ""), DEFAULT_ROUND_PLACES));
        oConfig.nCandidateLimit = sanitizeCandidateLimit(
                parseIntOrDefault(getEnvOrDefault("CANDIDATE_LIMIT", ""), DEFAULT_CANDIDATE_LIMIT));
        oConfig.sElevationStorePath = getEnvOrDefault("ELEVATION_DB_PATH", oConfig.sElevationStorePath);
        oConfig.sElevationApiKey = getEnvOrDefault("GOOGLE_API_KEY", "");
        oConfig.sElevationApiUrl = getEnvOrDefault("ELEVATION_API_URL", oConfig.sElevationApiUrl);
        const int nTimeoutSec = parseIntOrDefault(getEnvOrDefault("ELEVATION_TIMEOUT_SEC", ""), 0);
        if(nTimeoutSec > 0)
            oConfig.nElevationTimeoutSec = nTimeoutSec;
        oConfig.sDefaultParentCode = getEnvOrDefault("GPKG_PARENT_CODE", oConfig.sDefaultParentCode);
        return oConfig;
    }

    /// returns the name of the R-tree table indexing the geometry column of the region table
    std::string getSpatialIndexTableName() const {
        return "rtree_" + sTableName + "_" + sGeometryColumn;
    }

    /// rounding precision outside of [0,6] falls back to the default (4 places, ~11m)
    static int sanitizeRoundPlaces(int nRoundPlaces) {
        if(nRoundPlaces < 0 || nRoundPlaces > MAX_ROUND_PLACES)
            return DEFAULT_ROUND_PLACES;
        return nRoundPlaces;
    }

    /// non-positive candidate limits fall back to the default
    static int sanitizeCandidateLimit(int nCandidateLimit) {
        if(nCandidateLimit <= 0)
            return DEFAULT_CANDIDATE_LIMIT;
        return nCandidateLimit;
    }

    /// path to the read-only GeoPackage holding the region table
    std::string sDatasetPath;
    /// name of the region table (GID_0..5, NAME_0..5, geometry)
    std::string sTableName;
    /// name of the geometry column of the region table
    std::string sGeometryColumn;
    /// number of decimal places kept when rounding query coordinates
    int nRoundPlaces;
    /// maximum number of spatial index candidates examined per reverse lookup
    int nCandidateLimit;
    /// path to the read/write SQLite database caching elevations
    std::string sElevationStorePath;
    /// credential of the external elevation provider (empty = fetches always fail)
    std::string sElevationApiKey;
    /// base URL of the external elevation provider
    std::string sElevationApiUrl;
    /// timeout of a single elevation provider request
    long nElevationTimeoutSec;
    /// region code used by front ends when none is provided
    std::string sDefaultParentCode;

private:

    static int parseIntOrDefault(const std::string& sValue, int nDefault) {
        if(sValue.empty())
            return nDefault;
        char* pEnd = nullptr;
        errno = 0;
        const long nValue = std::strtol(sValue.c_str(), &pEnd, 10);
        if(pEnd == sValue.c_str() || *pEnd != '\0' || errno == ERANGE)
            return nDefault;
        if(nValue < (long)std::numeric_limits<int>::min() || nValue > (long)std::numeric_limits<int>::max())
            return nDefault;
        return (int)nValue;
    }
};
