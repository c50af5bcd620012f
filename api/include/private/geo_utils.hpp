/// contains GEOS and geo-related classes and utilities

#pragma once

#include "geos_utils.hpp"

#include "private/level_utils.hpp"

using Geometry = geos::geom::Geometry::Ptr;
using GeomEnvelope = geos::geom::Envelope;
using GeomArray = std::vector<Geometry>;
using MultiPolygonPtr = std::unique_ptr<geos::geom::MultiPolygon>;

/// number of leading bytes in a GeoPackage geometry header (magic, version, flags, SRID)
constexpr size_t s_nGeoPackageFixedHeaderSize = 8u;
/// range of spatial reference identifiers considered plausible when resolving byte order
constexpr int32_t s_nMinPlausibleSRID = -1;
constexpr int32_t s_nMaxPlausibleSRID = 1000000;

/// point expressed in longitude/latitude (degrees)
struct GeoPoint {
    double dLongitude;
    double dLatitude;
};

/// decoded GeoPackage binary header of a stored geometry blob
struct GeometryEnvelopeHeader {

    GeometryEnvelopeHeader():
            bHasGeoPackageHeader(false), nVersion(0u), nFlags(0u), nEnvelopeIndicator(0u),
            nSRID(0), nPayloadOffset(0u) {}

    /// returns whether the header/envelope fields were stored in little-endian order
    bool isLittleEndian() const {
        return (nFlags & 0x01u) != 0u;
    }

    /// returns whether the empty-geometry flag is raised
    bool isEmptyGeometry() const {
        return (nFlags & 0x10u) != 0u;
    }

    /// false if the blob was already a bare geometry payload without any header
    bool bHasGeoPackageHeader;
    /// the header version byte
    uint8_t nVersion;
    /// the raw flags byte (byte order, envelope indicator, empty flag)
    uint8_t nFlags;
    /// the 3-bit envelope contents indicator extracted from the flags
    uint8_t nEnvelopeIndicator;
    /// the spatial reference identifier, resolved despite unreliable byte order labeling
    int32_t nSRID;
    /// the envelope values stored in the header (minx, maxx, miny, maxy[, minz, maxz][, minm, maxm])
    std::vector<double> vdEnvelope;
    /// offset of the geometry payload in the stored blob
    size_t nPayloadOffset;
};

/// bare geometry payload (WKB) extracted from a stored geometry blob
struct GeometryPayload {
    GeometryEnvelopeHeader oHeader;
    ByteArray vWKB;
};

/// returns the number of envelope values implied by a GeoPackage envelope indicator
inline size_t getEnvelopeElementCount(uint8_t nEnvelopeIndicator) {
    switch(nEnvelopeIndicator) {
        case 0u: return 0u;
        case 1u: return 4u;
        case 2u: return 6u;
        case 3u: return 6u;
        case 4u: return 8u;
        // reserved indicators are read as 'no envelope', like the dataset producer does
        default: return 0u;
    }
}

/// returns the offset of the WKB payload for a given GeoPackage envelope indicator
inline size_t getPayloadOffset(uint8_t nEnvelopeIndicator) {
    return s_nGeoPackageFixedHeaderSize + getEnvelopeElementCount(nEnvelopeIndicator) * 8u;
}

/// resolves the spatial reference identifier stored in a header of ambiguous byte order
inline int32_t resolveSRID(const uint8_t* aSRIDBytes) {
    const auto nBigEndianSRID = static_cast<int32_t>(readUInt32BigEndian(aSRIDBytes));
    const auto nLittleEndianSRID = static_cast<int32_t>(readUInt32LittleEndian(aSRIDBytes));
    if(nBigEndianSRID >= s_nMinPlausibleSRID && nBigEndianSRID <= s_nMaxPlausibleSRID)
        return nBigEndianSRID;
    return nLittleEndianSRID;
}

/// strips the GeoPackage binary header from a geometry blob, returning the bare WKB payload
inline GeometryPayload decodeGeometryBlob(const uint8_t* aBlob, size_t nBlobSize) {
    if(aBlob == nullptr || nBlobSize < s_nGeoPackageFixedHeaderSize)
        throw FormatError("geometry blob too short (" + std::to_string(nBlobSize) + " bytes)");
    GeometryPayload oPayload;
    if(aBlob[0] != 'G' || aBlob[1] != 'P') {
        // no magic prefix: the blob is already a bare WKB payload with an unknown SRID
        oPayload.vWKB.assign(aBlob, aBlob + nBlobSize);
        return oPayload;
    }
    GeometryEnvelopeHeader& oHeader = oPayload.oHeader;
    oHeader.bHasGeoPackageHeader = true;
    oHeader.nVersion = aBlob[2];
    oHeader.nFlags = aBlob[3];
    oHeader.nEnvelopeIndicator = uint8_t((oHeader.nFlags >> 1) & 0x07u);
    oHeader.nSRID = resolveSRID(aBlob + 4);
    oHeader.nPayloadOffset = getPayloadOffset(oHeader.nEnvelopeIndicator);
    if(nBlobSize <= oHeader.nPayloadOffset)
        throw FormatError(
                "invalid geometry header/envelope (payload offset " +
                std::to_string(oHeader.nPayloadOffset) + ", blob size " + std::to_string(nBlobSize) + ")");
    const size_t nEnvelopeElementCount = getEnvelopeElementCount(oHeader.nEnvelopeIndicator);
    oHeader.vdEnvelope.reserve(nEnvelopeElementCount);
    for(size_t nElemIdx = 0u; nElemIdx < nEnvelopeElementCount; ++nElemIdx) {
        const uint8_t* aElemBytes = aBlob + s_nGeoPackageFixedHeaderSize + nElemIdx * 8u;
        oHeader.vdEnvelope.push_back(readFloat64(aElemBytes, oHeader.isLittleEndian()));
    }
    oPayload.vWKB.assign(aBlob + oHeader.nPayloadOffset, aBlob + nBlobSize);
    return oPayload;
}

/// strips the GeoPackage binary header from a geometry blob, returning the bare WKB payload
inline GeometryPayload decodeGeometryBlob(const ByteArray& vBlob) {
    return decodeGeometryBlob(vBlob.data(), vBlob.size());
}

/// parses a WKB payload into a multipolygon (bare polygons are wrapped into a multipolygon)
inline MultiPolygonPtr parseMultiPolygon(const uint8_t* aWKB, size_t nWKBSize) {
    Geometry pGeometry;
    try {
        BufferStream ssBuffer(aWKB, aWKB + nWKBSize);
        std::istream ssInputStream(&ssBuffer);
        geos::io::WKBReader oWKBReader;
        pGeometry = oWKBReader.read(ssInputStream);
    }
    catch(const geos::util::GEOSException& oException) {
        throw FormatError(std::string("invalid WKB payload: ") + oException.what());
    }
    if(!pGeometry)
        throw FormatError("invalid WKB payload: no geometry");
    const geos::geom::GeometryTypeId eTypeId = pGeometry->getGeometryTypeId();
    if(eTypeId == geos::geom::GEOS_MULTIPOLYGON)
        return MultiPolygonPtr(static_cast<geos::geom::MultiPolygon*>(pGeometry.release()));
    if(eTypeId == geos::geom::GEOS_POLYGON) {
        const geos::geom::GeometryFactory* pGeomFact = pGeometry->getFactory();
        GeomArray vPolygons;
        vPolygons.push_back(std::move(pGeometry));
        return pGeomFact->createMultiPolygon(std::move(vPolygons));
    }
    throw FormatError("unsupported geometry type: " + pGeometry->getGeometryType());
}

/// parses a WKB payload into a multipolygon (bare polygons are wrapped into a multipolygon)
inline MultiPolygonPtr parseMultiPolygon(const ByteArray& vWKB) {
    return parseMultiPolygon(vWKB.data(), vWKB.size());
}

/// decodes a stored geometry blob and parses its payload into a multipolygon
inline MultiPolygonPtr readRegionGeometry(const ByteArray& vBlob) {
    const GeometryPayload oPayload = decodeGeometryBlob(vBlob);
    return parseMultiPolygon(oPayload.vWKB);
}

/// returns whether a point lies inside a polygon (inside its shell, outside all of its holes)
inline bool isPointInPolygon(const geos::geom::Polygon& oPolygon, const geos::geom::Coordinate& oPoint) {
    // tie-break: a point on the shell is inside, a point on a hole boundary is outside
    if(oPolygon.isEmpty() || !oPolygon.getEnvelopeInternal()->covers(oPoint.x, oPoint.y))
        return false;
    const geos::geom::LinearRing* pShell = oPolygon.getExteriorRing();
    if(geos::algorithm::PointLocation::locateInRing(oPoint, *pShell->getCoordinatesRO()) ==
            geos::geom::Location::EXTERIOR)
        return false;
    for(size_t nHoleIdx = 0u; nHoleIdx < oPolygon.getNumInteriorRing(); ++nHoleIdx) {
        const geos::geom::LinearRing* pHole = oPolygon.getInteriorRingN(nHoleIdx);
        if(geos::algorithm::PointLocation::locateInRing(oPoint, *pHole->getCoordinatesRO()) !=
                geos::geom::Location::EXTERIOR)
            return false;
    }
    return true;
}

/// returns whether a point lies inside any of the polygons of a multipolygon
inline bool isPointInMultiPolygon(const geos::geom::MultiPolygon& oMultiPolygon, const geos::geom::Coordinate& oPoint) {
    for(size_t nPolyIdx = 0u; nPolyIdx < oMultiPolygon.getNumGeometries(); ++nPolyIdx) {
        const auto* pPolygon = static_cast<const geos::geom::Polygon*>(oMultiPolygon.getGeometryN(nPolyIdx));
        if(isPointInPolygon(*pPolygon, oPoint))
            return true;
    }
    return false;
}

/// returns the area-weighted centroid of a multipolygon, treating lon/lat as planar coordinates
inline GeoPoint computeCentroid(const geos::geom::MultiPolygon& oMultiPolygon) {
    // planar approximation: fine at regional scale, not curvature-correct for huge polygons
    std::unique_ptr<geos::geom::Point> pCentroid;
    try {
        pCentroid = oMultiPolygon.getCentroid();
    }
    catch(const geos::util::GEOSException& oException) {
        throw FormatError(std::string("cannot compute the centroid: ") + oException.what());
    }
    if(!pCentroid || pCentroid->isEmpty())
        throw FormatError("cannot compute the centroid of an empty geometry");
    return GeoPoint{pCentroid->getX(), pCentroid->getY()};
}

/// candidate region row returned by the spatial index prefilter
struct RegionCandidate {

    RegionCandidate():
            nRowID(0) {}

    /// returns the hierarchy chain described by the candidate's codes/names
    RegionHierarchy getHierarchy() const {
        return buildRegionHierarchy(asCodes, asNames);
    }

    /// the row identifier shared by the region table and its spatial index
    int64_t nRowID;
    /// the envelope (or bounding box) stored in the spatial index for this row
    GeomEnvelope oEnvelope;
    /// the region codes of the row, indexed by level
    std::array<RegionCode, level::s_nLevelCount> asCodes;
    /// the region names of the row, indexed by level
    std::array<std::string, level::s_nLevelCount> asNames;
    /// the raw geometry blob of the row (GeoPackage header + WKB)
    ByteArray vGeometryBlob;
};

using RegionCandidateArray = std::vector<RegionCandidate>;

/// returns the first candidate whose geometry contains the point (or nullptr if none does)
inline const RegionCandidate* findContainingCandidate(
        const RegionCandidateArray& vCandidates, const GeoPoint& oPoint) {
    const geos::geom::Coordinate oCoord(oPoint.dLongitude, oPoint.dLatitude);
    for(const RegionCandidate& oCandidate : vCandidates) {
        MultiPolygonPtr pMultiPolygon;
        try {
            pMultiPolygon = readRegionGeometry(oCandidate.vGeometryBlob);
        }
        catch(const FormatError& oError) {
            // a broken candidate geometry never aborts the whole lookup
            spdlog::debug("skipping candidate row {}: {}", oCandidate.nRowID, oError.what());
            continue;
        }
        if(isPointInMultiPolygon(*pMultiPolygon, oCoord))
            return &oCandidate;
    }
    return nullptr;
}
