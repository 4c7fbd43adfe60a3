/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace sift {

struct Config {
    std::filesystem::path dataRoot = "data";
    std::string host = "0.0.0.0";
    std::uint16_t port = 8080;
    std::size_t queueCapacity = 100;
    int httpWorkers = 4;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    bool showHelp = false;
    bool showVersion = false;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Defaults, then SIFT_* environment variables, then command-line flags:
//   [data-dir] [-H host] [-p port] [-q capacity] [-w workers]
[[nodiscard]] ConfigResult loadConfig(const std::vector<std::string>& args);

[[nodiscard]] ConfigResult applyEnvironment(Config config);

}
