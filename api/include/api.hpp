#pragma once

#include <memory>
#include <string>

#include "config.hpp"
#include "elevation_utils.hpp"
#include "gpkg_utils.hpp"

/*
 * Note on usage:
 *   A RegionLookupService wraps a read-only GeoPackage holding the administrative region table
 *   (GID_0..GID_5 codes, NAME_0..NAME_5 names, one geometry column) along with the R-tree table
 *   that indexes its geometries, and a separate read/write SQLite file caching region elevations.
 *
 *   All dataset queries are serialized on a single connection; the service itself can be shared
 *   between threads. Elevations are fetched from the external provider only on cache misses.
 *
 *   Errors are reported via exceptions (see "errors.hpp"):
 *     - NotFoundError: no region contains the point, or the code exists at no level
 *     - FormatError: the geometry of the requested region is malformed (node info only;
 *       malformed candidates are skipped by reverse lookups)
 *     - StoreError: the dataset or the elevation store is unavailable or corrupt
 *
 *   A typical usage sequence is detailed below:
 *     1) build a configuration via "RegionLookupConfig::fromEnvironment()" (or by hand)
 *     2) create the service with that configuration
 *     3) call "reverseLookup" with (pre-validated) lat/lon coordinates to get a hierarchy chain
 *     4) call "childrenOf" or "nodeInfo" with region codes from that chain
 */

/// information about a single region (as returned by node info queries)
struct RegionNodeInfo {
    /// the region code, name, parent code, and level
    HierarchyNode oNode;
    /// the latitude of the region's planar area-weighted centroid
    double dCentroidLatitude;
    /// the longitude of the region's planar area-weighted centroid
    double dCentroidLongitude;
    /// the elevation (in meters) at the centroid, or 0 if it could not be fetched
    double dElevation;
};

/// reverse geocoding service answering region containment/hierarchy/centroid queries
struct RegionLookupService {

    /// opens the dataset and the elevation store, using the Google elevation provider
    explicit RegionLookupService(const RegionLookupConfig& oConfig);

    /// opens the dataset and the elevation store, using the given elevation provider
    RegionLookupService(const RegionLookupConfig& oConfig, ElevationProviderPtr pElevationProvider);

    /// returns the hierarchy chain of the first region containing the (rounded) point
    RegionHierarchy reverseLookup(double dLatitude, double dLongitude);

    /// returns the children of a region code, sorted by name (empty for sub-villages)
    HierarchyNodeArray childrenOf(const RegionCode& sCode);

    /// returns the name, parent, level, centroid and elevation of a region code
    RegionNodeInfo nodeInfo(const RegionCode& sCode);

    /// returns the lowest hierarchy level at which the code appears
    RegionLevel detectLevel(const RegionCode& sCode);

    /// returns the query point rounded to the configured precision
    GeoPoint roundQueryPoint(double dLatitude, double dLongitude) const;

    const RegionLookupConfig& getConfig() const {
        return m_oConfig;
    }

private:
    const RegionLookupConfig m_oConfig;
    RegionDataset m_oDataset;
    ElevationCache m_oElevationCache;
};
