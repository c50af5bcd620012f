/// contains the exception types thrown by the region lookup API

#pragma once

#include <stdexcept>
#include <string>

/// base class of all errors thrown by the region lookup API
struct RegionLookupError: std::runtime_error {
    explicit RegionLookupError(const std::string& sMessage):
            std::runtime_error(sMessage) {}
};

/// thrown when a geometry blob/header or a WKB payload is malformed or unsupported
struct FormatError: RegionLookupError {
    explicit FormatError(const std::string& sMessage):
            RegionLookupError("format error: " + sMessage) {}
};

/// thrown when no region contains a point, or when a region code exists at no level
struct NotFoundError: RegionLookupError {
    explicit NotFoundError(const std::string& sMessage):
            RegionLookupError("not found: " + sMessage) {}
};

/// thrown by elevation providers when a fetch fails (never escapes the elevation cache)
struct ProviderError: RegionLookupError {
    explicit ProviderError(const std::string& sMessage):
            RegionLookupError("elevation provider error: " + sMessage) {}
};

/// thrown when the spatial dataset or the elevation store cannot be opened or queried
struct StoreError: RegionLookupError {
    explicit StoreError(const std::string& sMessage):
            RegionLookupError("store error: " + sMessage) {}
};
