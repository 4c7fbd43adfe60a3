/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sift/mover.hpp"
#include "sift/logger.hpp"

namespace sift {

Mover::Mover(Processor& processor, std::size_t queueCapacity) noexcept
    : processor_(processor), queue_(queueCapacity) {
    LOG_DEBUG("Mover created with queue capacity " + std::to_string(queue_.capacity()));
}

Mover::~Mover() {
    stop();
}

bool Mover::start(MoveObserver observer) {
    if (running_.load()) {
        LOG_WARN("Mover already running");
        return false;
    }

    if (shutdown_.load()) {
        LOG_WARN("Mover cannot be restarted after shutdown");
        return false;
    }

    observer_ = std::move(observer);
    running_.store(true);

    try {
        thread_ = std::thread(&Mover::moveLoop, this);
        LOG_DEBUG("Mover thread started");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start mover: " + std::string(e.what()));
        running_.store(false);
        return false;
    }
}

void Mover::stop() noexcept {
    if (shutdown_.exchange(true)) {
        return;
    }

    LOG_DEBUG("Stopping mover...");

    // Wakes the mover and any producer blocked on a full queue
    queue_.close();

    if (thread_.joinable()) {
        thread_.join();
    }
    running_.store(false);

    std::size_t dropped = queue_.clear();
    if (dropped > 0) {
        LOG_WARN("Mover stopped with " + std::to_string(dropped) + " unapplied move request(s)");
    }

    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        finished_ += dropped;
    }
    progress_.notify_all();

    LOG_INFO("Mover stopped");
}

EnqueueResult Mover::submit(const MoveRequest& request) noexcept {
    // Counted before the push so drain() never sees the request as finished
    // ahead of acceptance.
    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        ++accepted_;
    }
    EnqueueResult result = queue_.push(request);
    noteAccepted(result);
    if (result) {
        LOG_DEBUG("Move queued: " + std::to_string(request.id) + " -> " + stageName(request.to));
    }
    return result;
}

EnqueueResult Mover::trySubmit(const MoveRequest& request) noexcept {
    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        ++accepted_;
    }
    EnqueueResult result = queue_.tryPush(request);
    noteAccepted(result);
    if (result) {
        LOG_DEBUG("Move queued: " + std::to_string(request.id) + " -> " + stageName(request.to));
    }
    return result;
}

bool Mover::drain(std::chrono::milliseconds timeout) noexcept {
    std::unique_lock<std::mutex> lock(progressMutex_);
    return progress_.wait_for(lock, timeout, [this] { return finished_ >= accepted_; });
}

MoverStats Mover::stats() const noexcept {
    std::lock_guard<std::mutex> lock(progressMutex_);
    return stats_;
}

void Mover::moveLoop() {
    setThreadName("Mover");
    LOG_DEBUG("Mover loop started");

    while (!shutdown_.load()) {
        auto request = queue_.pop();
        if (!request) {
            // Closed and empty
            break;
        }

        MoveOutcome outcome = processor_.apply(*request);

        if (observer_) {
            try {
                observer_(*request, outcome);
            } catch (const std::exception& e) {
                LOG_ERROR("Move observer error: " + std::string(e.what()));
            }
        }

        record(*request, outcome);
    }

    LOG_DEBUG("Mover loop stopped");
}

void Mover::record(const MoveRequest& request, MoveOutcome outcome) noexcept {
    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        switch (outcome) {
            case MoveOutcome::Moved: ++stats_.moved; break;
            case MoveOutcome::Stale: ++stats_.stale; break;
            case MoveOutcome::StorageError: ++stats_.failed; break;
        }
        ++finished_;
    }
    progress_.notify_all();

    LOG_TRACE("Move " + std::to_string(request.id) + " finished: " + outcomeName(outcome));
}

void Mover::noteAccepted(const EnqueueResult& result) noexcept {
    if (result) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(progressMutex_);
        --accepted_;
    }
    progress_.notify_all();
}

}
