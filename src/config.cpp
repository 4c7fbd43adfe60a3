/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sift/config.hpp"
#include "sift/logger.hpp"
#include <cstdlib>
#include <limits>
#include <utility>

namespace sift {

namespace {

bool parseNumber(const std::string& text, unsigned long long maxValue, unsigned long long& out) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    try {
        unsigned long long value = std::stoull(text);
        if (value == 0 || value > maxValue) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

ConfigResult failure(const std::string& message) {
    ConfigResult result;
    result.message = message;
    return result;
}

// Applies one "key=value" setting shared by env and flags.
bool applySetting(Config& config, const std::string& key, const std::string& value, std::string& error) {
    unsigned long long number = 0;

    if (key == "data") {
        if (value.empty()) {
            error = "data directory must not be empty";
            return false;
        }
        config.dataRoot = value;
    } else if (key == "host") {
        if (value.empty()) {
            error = "host must not be empty";
            return false;
        }
        config.host = value;
    } else if (key == "port") {
        if (!parseNumber(value, std::numeric_limits<std::uint16_t>::max(), number)) {
            error = "invalid port: " + value;
            return false;
        }
        config.port = static_cast<std::uint16_t>(number);
    } else if (key == "queue") {
        if (!parseNumber(value, 1'000'000, number)) {
            error = "invalid queue capacity: " + value;
            return false;
        }
        config.queueCapacity = static_cast<std::size_t>(number);
    } else if (key == "workers") {
        if (!parseNumber(value, 256, number)) {
            error = "invalid worker count: " + value;
            return false;
        }
        config.httpWorkers = static_cast<int>(number);
    } else {
        error = "unknown setting: " + key;
        return false;
    }
    return true;
}

}

ConfigResult applyEnvironment(Config config) {
    static const std::pair<const char*, const char*> kEnv[] = {
        {"SIFT_DATA_DIR", "data"},
        {"SIFT_HOST", "host"},
        {"SIFT_PORT", "port"},
        {"SIFT_QUEUE_CAPACITY", "queue"},
        {"SIFT_HTTP_WORKERS", "workers"},
    };

    for (const auto& entry : kEnv) {
        const char* value = std::getenv(entry.first);
        if (!value || !*value) {
            continue;
        }
        std::string error;
        if (!applySetting(config, entry.second, value, error)) {
            return failure(std::string(entry.first) + ": " + error);
        }
    }

    ConfigResult result;
    result.ok = true;
    result.config = config;
    return result;
}

ConfigResult loadConfig(const std::vector<std::string>& args) {
    ConfigResult result = applyEnvironment(Config{});
    if (!result) {
        return result;
    }

    bool dataSeen = false;
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "-h" || arg == "--help") {
            result.showHelp = true;
            return result;
        }
        if (arg == "-v" || arg == "--version") {
            result.showVersion = true;
            return result;
        }

        const char* key = nullptr;
        if (arg == "-H" || arg == "--host") key = "host";
        else if (arg == "-p" || arg == "--port") key = "port";
        else if (arg == "-q" || arg == "--queue") key = "queue";
        else if (arg == "-w" || arg == "--workers") key = "workers";

        std::string error;
        if (key) {
            if (i + 1 >= args.size()) {
                return failure("missing value for " + arg);
            }
            if (!applySetting(result.config, key, args[++i], error)) {
                return failure(error);
            }
        } else if (!arg.empty() && arg[0] == '-') {
            return failure("unknown option: " + arg);
        } else if (!dataSeen) {
            if (!applySetting(result.config, "data", arg, error)) {
                return failure(error);
            }
            dataSeen = true;
        } else {
            return failure("unexpected argument: " + arg);
        }
    }

    LOG_DEBUG("Config: data=" + result.config.dataRoot.string() + " host=" + result.config.host +
              " port=" + std::to_string(result.config.port) +
              " queue=" + std::to_string(result.config.queueCapacity) +
              " workers=" + std::to_string(result.config.httpWorkers));
    return result;
}

}
