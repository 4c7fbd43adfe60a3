/*
 * sift - Review daemon (siftd)
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sift/config.hpp"
#include "sift/server.hpp"
#include "sift/logger.hpp"
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace sift;

constexpr const char* VERSION = "0.1.0";

// Async-signal-safe: only set flag, no complex operations
static volatile sig_atomic_t g_shutdown_requested = 0;

void signalHandler(int signal) {
    (void)signal;
    g_shutdown_requested = 1;
}

void printUsage(const char* progName) {
    std::cout << "sift review daemon\n\n";
    std::cout << "Usage: " << progName << " [data-dir] [options]\n\n";
    std::cout << "Arguments:\n";
    std::cout << "  data-dir          Root holding review/, accept/ and reject/ (default: ./data)\n\n";
    std::cout << "Options:\n";
    std::cout << "  -H, --host <ip>   Listen address (default: 0.0.0.0)\n";
    std::cout << "  -p, --port <n>    Listen port (default: 8080)\n";
    std::cout << "  -q, --queue <n>   Move queue capacity (default: 100)\n";
    std::cout << "  -w, --workers <n> HTTP worker threads (default: 4)\n";
    std::cout << "  -h, --help        Show this help\n";
    std::cout << "  -v, --version     Show version\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  SIFT_LOG_LEVEL       Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
    std::cout << "  SIFT_DATA_DIR        Default data-dir\n";
    std::cout << "  SIFT_HOST            Default listen address\n";
    std::cout << "  SIFT_PORT            Default listen port\n";
    std::cout << "  SIFT_QUEUE_CAPACITY  Default move queue capacity\n";
    std::cout << "  SIFT_HTTP_WORKERS    Default HTTP worker threads\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << progName << " ./data\n";
    std::cout << "  " << progName << " ./data -p 9090 -q 500\n";
    std::cout << "  SIFT_LOG_LEVEL=DEBUG " << progName << " ./data\n";
}

int main(int argc, char* argv[]) {
    Logger::initFromEnv();

    std::vector<std::string> args(argv + 1, argv + argc);
    ConfigResult loaded = loadConfig(args);
    if (loaded.showHelp) {
        printUsage(argv[0]);
        return 0;
    }
    if (loaded.showVersion) {
        std::cout << VERSION << "\n";
        return 0;
    }
    if (!loaded) {
        std::cerr << "Error: " << loaded.message << "\n\n";
        printUsage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    const Config& config = loaded.config;

    try {
        auto server = std::make_unique<Server>(config);
        if (!server->start()) {
            std::cerr << "Failed to start\n";
            return 1;
        }

        std::cout << "\n";
        std::cout << "  sift " << VERSION << "\n\n";
        std::cout << "    Data       " << config.dataRoot.string() << "\n";
        std::cout << "    Listening  http://" << config.host << ":" << server->port() << "/\n";
        std::cout << "    Queue      " << config.queueCapacity << "\n";
        std::cout << "    Workers    " << config.httpWorkers << "\n";
        std::cout << "\n" << std::flush;

        while (!g_shutdown_requested && !server->shutdownRequested()) {
            (void)server->waitForShutdownRequest(std::chrono::milliseconds(100));
        }

        LOG_INFO("Initiate graceful termination");
        server->shutdown();
        LOG_INFO("Gracefully terminated");

    } catch (const std::exception& e) {
        LOG_ERROR("Server error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
