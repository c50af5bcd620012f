/// contains hierarchy level-related utilities

#pragma once

#include "private/generic_utils.hpp"

// NOTES:
//   the dataset nests regions over six administrative levels (country to sub-village)
//   each dataset row carries one code/name column pair per level (GID_<n>/NAME_<n>)
//   (codes of levels below the row's own depth are null or empty)

/// administrative hierarchy level of a region (the numeric value is the column suffix)
enum class RegionLevel : uint8_t {
    Country = 0,
    Province = 1,
    City = 2,
    District = 3,
    Village = 4,
    SubVillage = 5,
};

using RegionCode = std::string;
using RegionCodeArray = std::vector<RegionCode>;

namespace level {

/// number of hierarchy levels held by the dataset
constexpr size_t s_nLevelCount = 6u;

/// all levels in increasing depth order (i.e. the level probing order)
constexpr std::array<RegionLevel, s_nLevelCount> s_aeAllLevels = {{
        RegionLevel::Country, RegionLevel::Province, RegionLevel::City,
        RegionLevel::District, RegionLevel::Village, RegionLevel::SubVillage}};

/// returns the zero-based index of a level (used to address level-indexed tables)
constexpr size_t toIndex(RegionLevel eLevel) {
    return static_cast<size_t>(eLevel);
}

/// returns the level associated with a zero-based index (throws if out of range)
inline RegionLevel fromIndex(size_t nLevelIdx) {
    if(nLevelIdx >= s_nLevelCount)
        throw std::out_of_range("invalid hierarchy level index: " + std::to_string(nLevelIdx));
    return s_aeAllLevels[nLevelIdx];
}

/// returns whether the level is the deepest one (i.e. its regions have no children)
constexpr bool isLeaf(RegionLevel eLevel) {
    return eLevel == RegionLevel::SubVillage;
}

/// returns whether the level is the topmost one (i.e. its regions have no parent)
constexpr bool isRoot(RegionLevel eLevel) {
    return eLevel == RegionLevel::Country;
}

/// returns the level directly below the given one (throws for the leaf level)
inline RegionLevel getChildLevel(RegionLevel eLevel) {
    if(isLeaf(eLevel))
        throw std::out_of_range("the sub-village level has no child level");
    return fromIndex(toIndex(eLevel) + 1u);
}

/// returns the level directly above the given one (throws for the root level)
inline RegionLevel getParentLevel(RegionLevel eLevel) {
    if(isRoot(eLevel))
        throw std::out_of_range("the country level has no parent level");
    return fromIndex(toIndex(eLevel) - 1u);
}

/// returns the name of the dataset column holding region codes for a level
inline const char* getCodeColumn(RegionLevel eLevel) {
    static const std::array<const char*, s_nLevelCount> s_aacCodeColumns = {{
            "GID_0", "GID_1", "GID_2", "GID_3", "GID_4", "GID_5"}};
    return s_aacCodeColumns[toIndex(eLevel)];
}

/// returns the name of the dataset column holding region names for a level
inline const char* getNameColumn(RegionLevel eLevel) {
    static const std::array<const char*, s_nLevelCount> s_aacNameColumns = {{
            "NAME_0", "NAME_1", "NAME_2", "NAME_3", "NAME_4", "NAME_5"}};
    return s_aacNameColumns[toIndex(eLevel)];
}

/// returns the label used to identify a level in query results
inline const char* getLabel(RegionLevel eLevel) {
    static const std::array<const char*, s_nLevelCount> s_aacLabels = {{
            "LEVEL_UNSPECIFIED", "PROVINCE", "CITY", "DISTRICT", "VILLAGE", "SUBVILLAGE"}};
    return s_aacLabels[toIndex(eLevel)];
}

} // namespace level

/// a single node of the administrative hierarchy (immutable once read from the dataset)
struct HierarchyNode {

    HierarchyNode():
            eLevel(RegionLevel::Country) {}

    HierarchyNode(RegionCode sCode_, std::string sName_, RegionCode sParentCode_, RegionLevel eLevel_):
            sCode(std::move(sCode_)), sName(std::move(sName_)),
            sParentCode(std::move(sParentCode_)), eLevel(eLevel_) {}

    /// the region code (e.g. "IDN.8.1_1")
    RegionCode sCode;
    /// the display name of the region
    std::string sName;
    /// the code of the parent region (empty at the country level)
    RegionCode sParentCode;
    /// the hierarchy level of the region
    RegionLevel eLevel;
};

using HierarchyNodeArray = std::vector<HierarchyNode>;

/// full hierarchy chain of a single dataset row (as returned by reverse lookups)
struct RegionHierarchy {
    /// the region codes of the row, indexed by level (empty if the row stops above that level)
    std::array<RegionCode, level::s_nLevelCount> asCodes;
    /// the region names of the row, indexed by level
    std::array<std::string, level::s_nLevelCount> asNames;
    /// the chain of nodes with a non-empty code, from the country level downwards
    HierarchyNodeArray vChain;
};

/// builds the hierarchy chain of a row given its level-indexed codes and names
inline RegionHierarchy buildRegionHierarchy(
        const std::array<RegionCode, level::s_nLevelCount>& asCodes,
        const std::array<std::string, level::s_nLevelCount>& asNames) {
    RegionHierarchy oHierarchy;
    oHierarchy.asCodes = asCodes;
    oHierarchy.asNames = asNames;
    oHierarchy.vChain.reserve(level::s_nLevelCount);
    RegionCode sParentCode;
    for(RegionLevel eLevel : level::s_aeAllLevels) {
        const size_t nLevelIdx = level::toIndex(eLevel);
        if(asCodes[nLevelIdx].empty())
            continue;
        oHierarchy.vChain.emplace_back(asCodes[nLevelIdx], asNames[nLevelIdx], sParentCode, eLevel);
        sParentCode = asCodes[nLevelIdx];
    }
    return oHierarchy;
}
