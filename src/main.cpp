#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <CommandLine.hpp>
#include <ConfigManager.hpp>
#include <InputReader.hpp>
#include <LogCompat.hpp>
#include <LogSinks.hpp>
#include <cstdio>
#include <cstdlib>
#include <hash/sha256.hpp>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

enum ExitCode : int {
    kExitOk = EXIT_SUCCESS,
    kExitReadFailure = EXIT_FAILURE,
    kExitUsage = 2,
};

constexpr std::string_view kStdinName = "-";

void printDigest(const SHA256::result_type& digest, const std::string_view label,
                 const bool binary) {
    if (binary) {
        std::cout.write(reinterpret_cast<const char*>(digest.data()),
                        static_cast<std::streamsize>(digest.size()));
    } else {
        std::cout << fmt::format("{}  {}\n", SHA256::toHex(digest), label);
    }
}

// Hashes one named input, returns false if it could not be read.
bool hashInput(const std::string& name, const bool binary) {
    auto data = name == kStdinName ? InputReader::readStream(std::cin)
                                   : InputReader::readFile(name);
    if (!data.ok()) {
        LOG(ERROR) << data.status().message();
        return false;
    }
    printDigest(SHA256::compute(*data), name, binary);
    return true;
}

}  // namespace

int app_main(int argc, char** argv) {
    std::unique_ptr<ConfigManager> configPtr;
    try {
        configPtr = std::make_unique<ConfigManager>(CommandLine{argc, argv});
    } catch (const std::invalid_argument& e) {
        LOG(ERROR) << "Cannot parse command line: " << e.what();
        return kExitUsage;
    }
    const ConfigManager& config = *configPtr;

    if (!config.valid()) {
        ConfigManager::serializeHelpToOStream(std::cerr);
        return kExitUsage;
    }

    if (config.isSet(ConfigManager::Configs::HELP)) {
        std::cout << "Usage: " << argv[0] << " [options] [file...]\n";
        ConfigManager::serializeHelpToOStream(std::cout);
        return kExitOk;
    }

    if (config.isSet(ConfigManager::Configs::VERBOSE)) {
        spdlog::set_level(spdlog::level::debug);
    }

    RAIILogSink<LogFileSink> logFileSink;
    if (const auto it = config.get(ConfigManager::Configs::LOG_FILE); it) {
        try {
            logFileSink = std::make_shared<LogFileSink>(*it);
        } catch (const spdlog::spdlog_ex& e) {
            LOG(ERROR) << "Couldn't open log file " << *it << ": " << e.what();
        }
    }

    const bool binary = config.isSet(ConfigManager::Configs::BINARY);

    if (const auto text = config.get(ConfigManager::Configs::STRING); text) {
        if (!config.inputs().empty()) {
            LOG(WARNING) << "Ignoring " << config.inputs().size()
                         << " input file(s) because a string was given";
        }
        printDigest(SHA256::compute(std::string_view(*text)),
                    fmt::format("\"{}\"", *text), binary);
        return kExitOk;
    }

    if (config.inputs().empty()) {
        return hashInput(std::string(kStdinName), binary) ? kExitOk
                                                          : kExitReadFailure;
    }

    int ret = kExitOk;
    for (const auto& input : config.inputs()) {
        if (!hashInput(input, binary)) {
            ret = kExitReadFailure;
        }
    }
    return ret;
}
