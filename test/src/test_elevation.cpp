#include "gtest/gtest.h"
#include "fixture_utils.hpp"

inline std::string getFreshStorePath(const std::string& sName) {
    return getTestFilePath("_" + sName + ".db");
}

TEST(region_reverse_geo_elevation, response_parsing) {
    ASSERT_DOUBLE_EQ(
            parseElevationResponse(R"({"results":[{"elevation":12.75,"resolution":9.5}],"status":"OK"})"), 12.75);
    ASSERT_DOUBLE_EQ(parseElevationResponse(R"({"results":[{"elevation":-3}],"status":"OK"})"), -3.0);
    ASSERT_THROW(
            parseElevationResponse(R"({"results":[],"status":"REQUEST_DENIED","error_message":"bad key"})"),
            ProviderError);
    ASSERT_THROW(parseElevationResponse(R"({"results":[],"status":"OK"})"), ProviderError);
    ASSERT_THROW(parseElevationResponse(R"({"status":"OK"})"), ProviderError);
    ASSERT_THROW(parseElevationResponse(R"({"results":[{"resolution":1}],"status":"OK"})"), ProviderError);
    ASSERT_THROW(parseElevationResponse(R"({"results":[{"elevation":"high"}],"status":"OK"})"), ProviderError);
    ASSERT_THROW(parseElevationResponse("[1, 2]"), ProviderError);
    ASSERT_THROW(parseElevationResponse("<html>oops</html>"), ProviderError);
    try {
        parseElevationResponse(R"({"results":[],"status":"OVER_QUERY_LIMIT","error_message":"slow down"})");
        FAIL() << "expected a provider error";
    }
    catch(const ProviderError& oError) {
        ASSERT_NE(std::string(oError.what()).find("slow down"), std::string::npos);
    }
}

TEST(region_reverse_geo_elevation, google_provider_requests) {
    GoogleElevationProvider oProvider("abc def", "https://elevation.invalid/json", 5);
    ASSERT_EQ(
            oProvider.buildRequestUrl(-6.1938, 106.7994),
            "https://elevation.invalid/json?locations=-6.193800,106.799400&key=abc%20def");
    // no credential: fails without touching the network
    GoogleElevationProvider oKeylessProvider("", "https://elevation.invalid/json", 5);
    ASSERT_THROW(oKeylessProvider.fetchElevation(0.0, 0.0), ProviderError);
}

TEST(region_reverse_geo_elevation, cache_hit_after_fetch) {
    auto pProvider = std::make_shared<CountingElevationProvider>(42.5);
    ElevationCache oCache(getFreshStorePath("cache_hit"), pProvider);
    double dElevation = -1.0;
    ASSERT_FALSE(oCache.getCachedElevation("IDN.1_1", dElevation));
    ASSERT_DOUBLE_EQ(oCache.getOrFetchElevation("IDN.1_1", -6.9, 107.6), 42.5);
    ASSERT_EQ(pProvider->nCallCount, 1u);
    ASSERT_DOUBLE_EQ(pProvider->dLastLatitude, -6.9);
    ASSERT_DOUBLE_EQ(pProvider->dLastLongitude, 107.6);
    pProvider->dElevation = 99.0;
    ASSERT_DOUBLE_EQ(oCache.getOrFetchElevation("IDN.1_1", -6.9, 107.6), 42.5);
    ASSERT_EQ(pProvider->nCallCount, 1u);
    ASSERT_TRUE(oCache.getCachedElevation("IDN.1_1", dElevation));
    ASSERT_DOUBLE_EQ(dElevation, 42.5);
}

TEST(region_reverse_geo_elevation, failures_are_not_cached) {
    auto pProvider = std::make_shared<CountingElevationProvider>(7.0, true);
    ElevationCache oCache(getFreshStorePath("failures"), pProvider);
    ASSERT_DOUBLE_EQ(oCache.getOrFetchElevation("IDN.2_1", 0.0, 0.0), DEFAULT_ELEVATION);
    double dElevation = -1.0;
    ASSERT_FALSE(oCache.getCachedElevation("IDN.2_1", dElevation));
    pProvider->bFail = false;
    ASSERT_DOUBLE_EQ(oCache.getOrFetchElevation("IDN.2_1", 0.0, 0.0), 7.0);
    ASSERT_EQ(pProvider->nCallCount, 2u);
    ElevationCache oProviderlessCache(getFreshStorePath("no_provider"), nullptr);
    ASSERT_DOUBLE_EQ(oProviderlessCache.getOrFetchElevation("IDN.2_1", 0.0, 0.0), DEFAULT_ELEVATION);
    ASSERT_FALSE(oProviderlessCache.getCachedElevation("IDN.2_1", dElevation));
}

TEST(region_reverse_geo_elevation, first_write_wins) {
    ElevationCache oCache(getFreshStorePath("first_write"), nullptr);
    ASSERT_TRUE(oCache.storeElevation("IDN.3_1", 1500.0));
    ASSERT_FALSE(oCache.storeElevation("IDN.3_1", 1.0));
    double dElevation = -1.0;
    ASSERT_TRUE(oCache.getCachedElevation("IDN.3_1", dElevation));
    ASSERT_DOUBLE_EQ(dElevation, 1500.0);
}

TEST(region_reverse_geo_elevation, shared_store) {
    const std::string sStorePath = getFreshStorePath("shared");
    auto pProvider = std::make_shared<CountingElevationProvider>(321.0);
    ElevationCache oFirstCache(sStorePath, pProvider);
    ElevationCache oSecondCache(sStorePath, pProvider);
    ASSERT_DOUBLE_EQ(oFirstCache.getOrFetchElevation("IDN.4_1", 1.0, 2.0), 321.0);
    ASSERT_DOUBLE_EQ(oSecondCache.getOrFetchElevation("IDN.4_1", 1.0, 2.0), 321.0);
    ASSERT_EQ(pProvider->nCallCount, 1u);
}
