/// command-line front end running region lookup queries and printing JSON responses

#include <iostream>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "cli_utils.hpp"

namespace {

void setupLogging(const CommandLineOptions& oOptions) {
    // responses go to stdout, so logs go to stderr
    std::vector<spdlog::sink_ptr> vSinks;
    auto pConsoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    pConsoleSink->set_level(oOptions.bVerbose ? spdlog::level::debug : spdlog::level::info);
    vSinks.push_back(pConsoleSink);
    if(!oOptions.sLogFile.empty()) {
        auto pFileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(oOptions.sLogFile, false);
        pFileSink->set_level(spdlog::level::trace);
        vSinks.push_back(pFileSink);
    }
    auto pLogger = std::make_shared<spdlog::logger>("region_lookup", vSinks.begin(), vSinks.end());
    pLogger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(pLogger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
}

int printResponse(const json& oResponse) {
    std::cout << dumpResponse(oResponse) << std::endl;
    return getExitCode(oResponse);
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLineOptions oOptions;
    std::string sError;
    if(!parseCommandLine(argc, argv, oOptions, sError)) {
        std::cerr << "error: " << sError << "\n" << makeCommandLineParser().help() << std::endl;
        return 2;
    }
    if(oOptions.bHelp) {
        std::cout << makeCommandLineParser().help() << std::endl;
        return 0;
    }
    if(!isKnownCommand(oOptions.sCommand)) {
        std::cerr << "error: unknown command '" << oOptions.sCommand << "'\n"
                  << makeCommandLineParser().help() << std::endl;
        return 2;
    }
    try {
        setupLogging(oOptions);
        if(oOptions.sCommand == "reverse") {
            // malformed coordinates are rejected before the dataset is opened
            double dLatitude = 0.0, dLongitude = 0.0;
            if(!parseLatLon(oOptions.vsArgs, dLatitude, dLongitude, sError))
                return printResponse(makeErrorResponse(400, sError));
        }
        RegionLookupService oService(RegionLookupConfig::fromEnvironment());
        if(oOptions.sCommand == "health") {
            std::cout << "ok" << std::endl;
            return 0;
        }
        return printResponse(runQueryCommand(oService, oOptions.sCommand, oOptions.vsArgs));
    }
    catch(const RegionLookupError& oError) {
        spdlog::error("{} error: {}", oOptions.sCommand, oError.what());
        return printResponse(makeErrorResponse(500, "internal error"));
    }
    catch(const std::exception& oException) {
        std::cerr << oOptions.sCommand << " failed: " << oException.what() << std::endl;
        return printResponse(makeErrorResponse(500, "internal error"));
    }
}
