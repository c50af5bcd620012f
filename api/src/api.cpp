#include "api.hpp"


namespace {

RegionCode normalizeCode(const RegionCode& sCode) {
    const RegionCode sTrimmedCode = trimString(sCode);
    if(sTrimmedCode.empty())
        throw NotFoundError("empty region code");
    return sTrimmedCode;
}

} // namespace

RegionLookupService::RegionLookupService(const RegionLookupConfig& oConfig):
        RegionLookupService(
                oConfig,
                std::make_shared<GoogleElevationProvider>(
                        oConfig.sElevationApiKey, oConfig.sElevationApiUrl, oConfig.nElevationTimeoutSec)) {}

RegionLookupService::RegionLookupService(
        const RegionLookupConfig& oConfig, ElevationProviderPtr pElevationProvider):
        m_oConfig(oConfig),
        m_oDataset(oConfig),
        m_oElevationCache(oConfig.sElevationStorePath, std::move(pElevationProvider)) {
    spdlog::debug(
            "opened region dataset '{}' (table: {}, rounding: {} places, candidate limit: {})",
            m_oConfig.sDatasetPath, m_oConfig.sTableName,
            RegionLookupConfig::sanitizeRoundPlaces(m_oConfig.nRoundPlaces), m_oDataset.getCandidateLimit());
}

GeoPoint RegionLookupService::roundQueryPoint(double dLatitude, double dLongitude) const {
    const int nRoundPlaces = RegionLookupConfig::sanitizeRoundPlaces(m_oConfig.nRoundPlaces);
    return GeoPoint{roundCoordinate(dLongitude, nRoundPlaces), roundCoordinate(dLatitude, nRoundPlaces)};
}

RegionHierarchy RegionLookupService::reverseLookup(double dLatitude, double dLongitude) {
    const GeoPoint oQueryPoint = roundQueryPoint(dLatitude, dLongitude);
    const RegionCandidateArray vCandidates = m_oDataset.findCandidates(oQueryPoint);
    spdlog::debug(
            "reverse lookup at ({}, {}): {} candidate(s)",
            oQueryPoint.dLatitude, oQueryPoint.dLongitude, vCandidates.size());
    const RegionCandidate* pMatch = findContainingCandidate(vCandidates, oQueryPoint);
    if(pMatch == nullptr)
        throw NotFoundError(
                "no region contains (" + std::to_string(oQueryPoint.dLatitude) + ", " +
                std::to_string(oQueryPoint.dLongitude) + ")");
    return pMatch->getHierarchy();
}

RegionLevel RegionLookupService::detectLevel(const RegionCode& sCode) {
    const RegionCode sTrimmedCode = normalizeCode(sCode);
    // probing in increasing depth order: a code present at two levels resolves to the shallower one
    for(RegionLevel eLevel : level::s_aeAllLevels) {
        if(m_oDataset.hasCodeAtLevel(sTrimmedCode, eLevel))
            return eLevel;
    }
    throw NotFoundError("region code '" + sTrimmedCode + "' does not exist at any level");
}

HierarchyNodeArray RegionLookupService::childrenOf(const RegionCode& sCode) {
    const RegionCode sTrimmedCode = normalizeCode(sCode);
    const RegionLevel eLevel = detectLevel(sTrimmedCode);
    if(level::isLeaf(eLevel))
        return HierarchyNodeArray();
    return m_oDataset.queryChildren(sTrimmedCode, eLevel);
}

RegionNodeInfo RegionLookupService::nodeInfo(const RegionCode& sCode) {
    const RegionCode sTrimmedCode = normalizeCode(sCode);
    const RegionLevel eLevel = detectLevel(sTrimmedCode);
    RegionRecord oRecord = m_oDataset.fetchRegion(sTrimmedCode, eLevel);
    const MultiPolygonPtr pGeometry = readRegionGeometry(oRecord.vGeometryBlob);
    const GeoPoint oCentroid = computeCentroid(*pGeometry);
    RegionNodeInfo oInfo;
    oInfo.oNode = std::move(oRecord.oNode);
    oInfo.dCentroidLatitude = oCentroid.dLatitude;
    oInfo.dCentroidLongitude = oCentroid.dLongitude;
    oInfo.dElevation = m_oElevationCache.getOrFetchElevation(
            oInfo.oNode.sCode, oCentroid.dLatitude, oCentroid.dLongitude);
    return oInfo;
}
