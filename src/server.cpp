/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sift/server.hpp"
#include "sift/stage_index.hpp"
#include "sift/scanner.hpp"
#include "sift/processor.hpp"
#include "sift/mover.hpp"
#include "sift/http.hpp"
#include "sift/logger.hpp"
#include <sstream>

namespace sift {

Server::Server(const Config& config)
    : config_(config) {
    LOG_DEBUG("Server created - data: " + config_.dataRoot.string() + ", port: " + std::to_string(config_.port) +
              ", queue: " + std::to_string(config_.queueCapacity));
}

Server::~Server() {
    shutdown();
}

bool Server::start() {
    if (running_.load()) {
        LOG_WARN("Server already running");
        return false;
    }

    LOG_INFO("Starting sift server...");

    if (!createDataRoot()) {
        LOG_ERROR("Failed to create data directories");
        return false;
    }

    setThreadName("Main");

    try {
        index_ = std::make_unique<StageIndex>();
        std::size_t seeded = seedIndex();
        LOG_INFO("Index seeded with " + std::to_string(seeded) + " item(s)");

        processor_ = std::make_unique<Processor>(config_.dataRoot, *index_);
        mover_ = std::make_unique<Mover>(*processor_, config_.queueCapacity);
        flow_ = std::make_unique<Flow>(config_.dataRoot, *index_);

        if (!mover_->start()) {
            LOG_ERROR("Failed to start mover");
            return false;
        }

        // Moves are accepted from the first request the frontend serves
        running_.store(true);
        http_ = std::make_unique<HttpFrontend>(*this, config_.host, config_.port, config_.httpWorkers);
        if (!http_->start()) {
            LOG_ERROR("Failed to start HTTP frontend");
            running_.store(false);
            mover_->stop();
            return false;
        }

        LOG_INFO("Server listening on " + config_.host + ":" + std::to_string(http_->port()));
        return true;

    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start server: " + std::string(e.what()));
        running_.store(false);
        if (mover_) {
            mover_->stop();
        }
        return false;
    }
}

void Server::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("Shutting down server...");

    // Producers first, then the single consumer
    if (http_) {
        http_->stop();
    }
    if (mover_) {
        mover_->stop();
    }

    requestShutdown();
    LOG_INFO("Server shutdown complete");
}

void Server::requestShutdown() noexcept {
    if (shutdownRequested_.exchange(true)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(shutdownMutex_);
    }
    shutdownCondition_.notify_all();
}

bool Server::waitForShutdownRequest(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(shutdownMutex_);
    return shutdownCondition_.wait_for(lock, timeout, [this] { return shutdownRequested_.load(); });
}

EnqueueResult Server::move(const MoveRequest& request) noexcept {
    if (!running_.load() || !mover_) {
        EnqueueResult result;
        result.error = EnqueueError::Closed;
        result.message = "server not running";
        return result;
    }
    return mover_->submit(request);
}

std::optional<ItemId> Server::next() const noexcept {
    if (!flow_) {
        return std::nullopt;
    }
    return flow_->next(Stage::Review);
}

std::optional<Stage> Server::locate(ItemId id) const noexcept {
    if (!flow_) {
        return std::nullopt;
    }
    return flow_->locate(id);
}

LoadResult Server::load(ItemId id, Stage stage) const noexcept {
    if (!flow_) {
        LoadResult result;
        result.error = LoadError::NotFound;
        result.message = "server not running";
        return result;
    }
    return flow_->load(id, stage);
}

std::string Server::statusReport() const {
    std::ostringstream out;
    if (index_) {
        for (Stage stage : kAllStages) {
            out << stageName(stage) << " " << index_->size(stage) << "\n";
        }
    }
    if (mover_) {
        MoverStats stats = mover_->stats();
        out << "queued " << mover_->queueSize() << "/" << mover_->queueCapacity() << "\n";
        out << "moved " << stats.moved << "\n";
        out << "stale " << stats.stale << "\n";
        out << "failed " << stats.failed << "\n";
    }
    return out.str();
}

bool Server::drain(std::chrono::milliseconds timeout) noexcept {
    return mover_ ? mover_->drain(timeout) : true;
}

std::uint16_t Server::port() const noexcept {
    return http_ ? http_->port() : 0;
}

bool Server::createDataRoot() noexcept {
    try {
        for (Stage stage : kAllStages) {
            std::filesystem::create_directories(config_.dataRoot / stageName(stage));
        }

        LOG_DEBUG("Data root ready: " + config_.dataRoot.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create data root: " + std::string(e.what()));
        return false;
    }
}

std::size_t Server::seedIndex() noexcept {
    Scanner scanner(config_.dataRoot);
    std::size_t total = 0;
    for (Stage stage : kAllStages) {
        total += index_->seed(stage, scanner.scan(stage));
    }
    return total;
}

}
