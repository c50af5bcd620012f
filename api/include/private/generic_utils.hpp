/// contains generic C++ utility functions/defines

#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <sys/stat.h>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "errors.hpp"

using ByteArray = std::vector<uint8_t>;

/// read-only stream buffer wrapper used to feed byte arrays to istream-based readers
struct BufferStream: std::streambuf {
    BufferStream(const uint8_t* pBegin, const uint8_t* pEnd) {
        this->setg((char*)pBegin, (char*)pBegin, (char*)pEnd);
    }
};

inline bool checkPathExists(const std::string& sFilePath) {
    struct stat oBuffer;
    return (stat(sFilePath.c_str(), &oBuffer) == 0);
}

/// returns the value of an environment variable, or the provided default if unset/empty
inline std::string getEnvOrDefault(const char* acName, const std::string& sDefault) {
    const char* acValue = std::getenv(acName);
    if(acValue == nullptr || acValue[0] == '\0')
        return sDefault;
    return acValue;
}

/// returns a copy of the string without leading/trailing whitespace
inline std::string trimString(const std::string& sInput) {
    const auto iBegin = std::find_if_not(sInput.begin(), sInput.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    const auto iEnd = std::find_if_not(sInput.rbegin(), sInput.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();
    if(iBegin >= iEnd)
        return std::string();
    return std::string(iBegin, iEnd);
}

/// returns whether the string can be used as-is as an SQL table/column identifier
inline bool isSafeIdentifier(const std::string& sName) {
    if(sName.empty())
        return false;
    return std::all_of(sName.begin(), sName.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

/// rounds a coordinate value to the given number of decimal places
inline double roundCoordinate(double dValue, int nDecimalPlaces) {
    const double dScale = std::pow(10.0, nDecimalPlaces);
    return std::round(dValue * dScale) / dScale;
}

/// reads a 32-bit unsigned integer from a byte array using big-endian ordering
inline uint32_t readUInt32BigEndian(const uint8_t* aBytes) {
    return (uint32_t(aBytes[0]) << 24) | (uint32_t(aBytes[1]) << 16) |
           (uint32_t(aBytes[2]) << 8) | uint32_t(aBytes[3]);
}

/// reads a 32-bit unsigned integer from a byte array using little-endian ordering
inline uint32_t readUInt32LittleEndian(const uint8_t* aBytes) {
    return (uint32_t(aBytes[3]) << 24) | (uint32_t(aBytes[2]) << 16) |
           (uint32_t(aBytes[1]) << 8) | uint32_t(aBytes[0]);
}

/// reads an IEEE-754 double from a byte array using the specified byte ordering
inline double readFloat64(const uint8_t* aBytes, bool bLittleEndian) {
    uint64_t nBits = 0u;
    for(size_t nByteIdx = 0u; nByteIdx < 8u; ++nByteIdx) {
        const size_t nSrcIdx = bLittleEndian ? (7u - nByteIdx) : nByteIdx;
        nBits = (nBits << 8) | uint64_t(aBytes[nSrcIdx]);
    }
    double dValue;
    std::memcpy(&dValue, &nBits, sizeof(dValue));
    return dValue;
}
