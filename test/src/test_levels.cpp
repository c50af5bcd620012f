#include "gtest/gtest.h"
#include "private/level_utils.hpp"


TEST(region_reverse_geo_levels, index_conversions) {
    for(size_t nLevelIdx = 0u; nLevelIdx < level::s_nLevelCount; ++nLevelIdx)
        ASSERT_EQ(level::toIndex(level::fromIndex(nLevelIdx)), nLevelIdx);
    ASSERT_EQ(level::fromIndex(0u), RegionLevel::Country);
    ASSERT_EQ(level::fromIndex(5u), RegionLevel::SubVillage);
    ASSERT_THROW(level::fromIndex(6u), std::out_of_range);
}

TEST(region_reverse_geo_levels, root_and_leaf) {
    ASSERT_TRUE(level::isRoot(RegionLevel::Country));
    ASSERT_FALSE(level::isRoot(RegionLevel::Province));
    ASSERT_TRUE(level::isLeaf(RegionLevel::SubVillage));
    ASSERT_FALSE(level::isLeaf(RegionLevel::Village));
    ASSERT_EQ(level::getChildLevel(RegionLevel::Country), RegionLevel::Province);
    ASSERT_EQ(level::getChildLevel(RegionLevel::Village), RegionLevel::SubVillage);
    ASSERT_THROW(level::getChildLevel(RegionLevel::SubVillage), std::out_of_range);
    ASSERT_EQ(level::getParentLevel(RegionLevel::District), RegionLevel::City);
    ASSERT_THROW(level::getParentLevel(RegionLevel::Country), std::out_of_range);
}

TEST(region_reverse_geo_levels, columns_and_labels) {
    ASSERT_STREQ(level::getCodeColumn(RegionLevel::Country), "GID_0");
    ASSERT_STREQ(level::getCodeColumn(RegionLevel::SubVillage), "GID_5");
    ASSERT_STREQ(level::getNameColumn(RegionLevel::City), "NAME_2");
    // the country level has no dedicated label
    ASSERT_STREQ(level::getLabel(RegionLevel::Country), "LEVEL_UNSPECIFIED");
    ASSERT_STREQ(level::getLabel(RegionLevel::Province), "PROVINCE");
    ASSERT_STREQ(level::getLabel(RegionLevel::City), "CITY");
    ASSERT_STREQ(level::getLabel(RegionLevel::District), "DISTRICT");
    ASSERT_STREQ(level::getLabel(RegionLevel::Village), "VILLAGE");
    ASSERT_STREQ(level::getLabel(RegionLevel::SubVillage), "SUBVILLAGE");
}

TEST(region_reverse_geo_levels, hierarchy_chain) {
    const std::array<RegionCode, level::s_nLevelCount> asCodes = {{
            "IDN", "IDN.7_1", "IDN.7.3_1", "IDN.7.3.2_1", "", ""}};
    const std::array<std::string, level::s_nLevelCount> asNames = {{
            "Indonesia", "Jakarta Raya", "Jakarta Barat", "Kebon Jeruk", "", ""}};
    const RegionHierarchy oHierarchy = buildRegionHierarchy(asCodes, asNames);
    ASSERT_EQ(oHierarchy.vChain.size(), size_t(4));
    ASSERT_EQ(oHierarchy.vChain[0].sCode, "IDN");
    ASSERT_EQ(oHierarchy.vChain[0].sParentCode, "");
    ASSERT_EQ(oHierarchy.vChain[0].eLevel, RegionLevel::Country);
    for(size_t nNodeIdx = 1u; nNodeIdx < oHierarchy.vChain.size(); ++nNodeIdx) {
        ASSERT_EQ(oHierarchy.vChain[nNodeIdx].sParentCode, oHierarchy.vChain[nNodeIdx - 1u].sCode);
        ASSERT_EQ(level::toIndex(oHierarchy.vChain[nNodeIdx].eLevel), nNodeIdx);
    }
    ASSERT_EQ(oHierarchy.vChain[3].sName, "Kebon Jeruk");
    ASSERT_EQ(oHierarchy.asCodes[4], "");
}

TEST(region_reverse_geo_levels, hierarchy_chain_with_gaps) {
    // a missing intermediate code is skipped; the next node points to the last non-empty code
    const std::array<RegionCode, level::s_nLevelCount> asCodes = {{"IDN", "IDN.1_1", "", "IDN.1.1.1_1", "", ""}};
    const std::array<std::string, level::s_nLevelCount> asNames = {{"Indonesia", "A", "", "B", "", ""}};
    const RegionHierarchy oHierarchy = buildRegionHierarchy(asCodes, asNames);
    ASSERT_EQ(oHierarchy.vChain.size(), size_t(3));
    ASSERT_EQ(oHierarchy.vChain[2].sParentCode, "IDN.1_1");
    ASSERT_EQ(oHierarchy.vChain[2].eLevel, RegionLevel::District);
}

TEST(region_reverse_geo_levels, generic_helpers) {
    ASSERT_EQ(trimString("  IDN.1_1 \t"), "IDN.1_1");
    ASSERT_EQ(trimString("   "), "");
    ASSERT_TRUE(isSafeIdentifier("gadm_410"));
    ASSERT_FALSE(isSafeIdentifier(""));
    ASSERT_FALSE(isSafeIdentifier("gadm; DROP TABLE x"));
    ASSERT_DOUBLE_EQ(roundCoordinate(-6.19386, 4), -6.1939);
    ASSERT_DOUBLE_EQ(roundCoordinate(106.79944, 4), 106.7994);
    const double dRounded = roundCoordinate(106.123456789, 4);
    ASSERT_DOUBLE_EQ(roundCoordinate(dRounded, 4), dRounded);
    ASSERT_DOUBLE_EQ(roundCoordinate(1.6, 0), 2.0);
}
