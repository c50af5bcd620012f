/// contains command-line parsing and JSON response builders for the region lookup front end

#pragma once

#include <cmath>
#include <cstdlib>
#include <string>
#include <vector>

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "api.hpp"

using json = nlohmann::json;

struct CommandLineOptions {
    bool bVerbose = false;
    bool bHelp = false;
    std::string sLogFile;
    std::string sCommand;
    std::vector<std::string> vsArgs;
};

inline cxxopts::Options makeCommandLineParser() {
    cxxopts::Options oParser(
            "region_lookup",
            "Administrative region lookup over a GADM GeoPackage\n"
            "  commands: reverse <lat> <lon> | reverse <lat,lon> | children [code] | latlng [code] | health\n"
            "  use '--' before negative coordinates (e.g. region_lookup reverse -- -6.19 106.8)\n"
            "  configuration is read from the environment (GPKG_PATH, GPKG_TABLE, GPKG_GEOM_COL, ROUND_PLACES,\n"
            "  CANDIDATE_LIMIT, ELEVATION_DB_PATH, GOOGLE_API_KEY, ELEVATION_API_URL, ELEVATION_TIMEOUT_SEC,\n"
            "  GPKG_PARENT_CODE)");
    oParser.positional_help("<command> [args...]");
    oParser.add_options()
        ("v,verbose", "Verbose output", cxxopts::value<bool>()->default_value("false"))
        ("log-file", "Log file path", cxxopts::value<std::string>())
        ("h,help", "Print usage")
        ("command", "Command to run", cxxopts::value<std::string>())
        ("args", "Command arguments", cxxopts::value<std::vector<std::string>>());
    oParser.parse_positional({"command", "args"});
    return oParser;
}

/// parses the command line; returns false (with an error message) if it is malformed or has no command
inline bool parseCommandLine(int argc, char* argv[], CommandLineOptions& oOptions, std::string& sError) {
    cxxopts::Options oParser = makeCommandLineParser();
    try {
        auto oResult = oParser.parse(argc, argv);
        oOptions.bHelp = oResult.count("help") > 0u;
        oOptions.bVerbose = oResult["verbose"].as<bool>();
        if(oResult.count("log-file"))
            oOptions.sLogFile = oResult["log-file"].as<std::string>();
        if(oResult.count("command"))
            oOptions.sCommand = oResult["command"].as<std::string>();
        if(oResult.count("args"))
            oOptions.vsArgs = oResult["args"].as<std::vector<std::string>>();
    }
    catch(const std::exception& oException) {
        sError = oException.what();
        return false;
    }
    if(oOptions.sCommand.empty() && !oOptions.bHelp) {
        sError = "a command is required";
        return false;
    }
    return true;
}

inline bool isKnownCommand(const std::string& sCommand) {
    return sCommand == "reverse" || sCommand == "children" || sCommand == "latlng" || sCommand == "health";
}

inline bool parseDouble(const std::string& sValue, double& dValue) {
    const std::string sTrimmed = trimString(sValue);
    if(sTrimmed.empty())
        return false;
    char* pEnd = nullptr;
    dValue = std::strtod(sTrimmed.c_str(), &pEnd);
    return pEnd != nullptr && *pEnd == '\0' && std::isfinite(dValue);
}

/// parses either "<lat> <lon>" or "<lat,lon>" from the command arguments, and checks the coordinate ranges
inline bool parseLatLon(
        const std::vector<std::string>& vsArgs, double& dLatitude, double& dLongitude, std::string& sError) {
    std::string sLatitude, sLongitude;
    if(vsArgs.size() == 1u) {
        const size_t nCommaPos = vsArgs[0].find(',');
        if(nCommaPos == std::string::npos || vsArgs[0].find(',', nCommaPos + 1u) != std::string::npos) {
            sError = "invalid latlng, use 'lat,lon'";
            return false;
        }
        sLatitude = vsArgs[0].substr(0u, nCommaPos);
        sLongitude = vsArgs[0].substr(nCommaPos + 1u);
    }
    else if(vsArgs.size() == 2u) {
        sLatitude = vsArgs[0];
        sLongitude = vsArgs[1];
    }
    else {
        sError = "latitude/longitude or latlng are required";
        return false;
    }
    if(!parseDouble(sLatitude, dLatitude) || !parseDouble(sLongitude, dLongitude)) {
        sError = "invalid latitude/longitude values";
        return false;
    }
    if(dLatitude < -90.0 || dLatitude > 90.0 || dLongitude < -180.0 || dLongitude > 180.0) {
        sError = "lat/lon out of range";
        return false;
    }
    return true;
}

inline json makeNodeJson(const HierarchyNode& oNode) {
    return json{
            {"code", oNode.sCode},
            {"name", oNode.sName},
            {"parentCode", oNode.sParentCode},
            {"level", level::getLabel(oNode.eLevel)}};
}

inline json makeSuccessResponse(json oData) {
    return json{{"code", 200}, {"msg", "success"}, {"data", std::move(oData)}};
}

inline json makeErrorResponse(int nCode, const std::string& sMessage) {
    return json{{"code", nCode}, {"msg", sMessage}, {"data", nullptr}};
}

/// returns the reverse lookup payload (levelNCode/levelNName keys, level0Name always present, and the chain)
inline json makeReverseData(const RegionHierarchy& oHierarchy) {
    json oData = json::object();
    for(RegionLevel eLevel : level::s_aeAllLevels) {
        const size_t nLevelIdx = level::toIndex(eLevel);
        const std::string sSuffix = std::to_string(nLevelIdx);
        if(!oHierarchy.asCodes[nLevelIdx].empty())
            oData["level" + sSuffix + "Code"] = oHierarchy.asCodes[nLevelIdx];
        if(level::isRoot(eLevel) || !oHierarchy.asNames[nLevelIdx].empty())
            oData["level" + sSuffix + "Name"] = oHierarchy.asNames[nLevelIdx];
    }
    json oList = json::array();
    for(const HierarchyNode& oNode : oHierarchy.vChain)
        oList.push_back(makeNodeJson(oNode));
    oData["list"] = std::move(oList);
    return oData;
}

inline json makeNodeInfoData(const RegionNodeInfo& oInfo) {
    return json{
            {"code", oInfo.oNode.sCode},
            {"latitude", oInfo.dCentroidLatitude},
            {"longitude", oInfo.dCentroidLongitude},
            {"name", oInfo.oNode.sName},
            {"parentCode", oInfo.oNode.sParentCode},
            {"level", level::getLabel(oInfo.oNode.eLevel)},
            {"elevation", oInfo.dElevation}};
}

/// serializes a response on one line (invalid UTF-8 from the dataset is replaced, never thrown)
inline std::string dumpResponse(const json& oResponse) {
    return oResponse.dump(-1, ' ', false, json::error_handler_t::replace);
}

inline int getExitCode(const json& oResponse) {
    return oResponse.at("code").get<int>() == 200 ? 0 : 1;
}

/// runs a reverse/children/latlng command against the service and returns its response (never throws)
inline json runQueryCommand(
        RegionLookupService& oService, const std::string& sCommand, const std::vector<std::string>& vsArgs) {
    const std::string sCodeArg = vsArgs.empty() ? std::string() : trimString(vsArgs[0]);
    const RegionCode sCode = sCodeArg.empty() ? oService.getConfig().sDefaultParentCode : sCodeArg;
    try {
        if(sCommand == "reverse") {
            double dLatitude = 0.0, dLongitude = 0.0;
            std::string sError;
            if(!parseLatLon(vsArgs, dLatitude, dLongitude, sError))
                return makeErrorResponse(400, sError);
            return makeSuccessResponse(makeReverseData(oService.reverseLookup(dLatitude, dLongitude)));
        }
        if(sCommand == "children") {
            json oList = json::array();
            try {
                for(const HierarchyNode& oChild : oService.childrenOf(sCode))
                    oList.push_back(makeNodeJson(oChild));
            }
            catch(const NotFoundError& oError) {
                // unknown parents are answered with an empty list
                spdlog::debug("{}", oError.what());
            }
            return makeSuccessResponse(json{{"list", std::move(oList)}});
        }
        if(sCommand == "latlng")
            return makeSuccessResponse(makeNodeInfoData(oService.nodeInfo(sCode)));
        return makeErrorResponse(400, "unknown command: " + sCommand);
    }
    catch(const NotFoundError&) {
        return makeErrorResponse(404, "not found");
    }
    catch(const RegionLookupError& oError) {
        spdlog::error("{} error: {}", sCommand, oError.what());
        return makeErrorResponse(500, "internal error");
    }
    catch(const std::exception& oException) {
        spdlog::error("{} failed: {}", sCommand, oException.what());
        return makeErrorResponse(500, "internal error");
    }
}
