/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sift/move_queue.hpp"
#include "sift/logger.hpp"

namespace sift {

MoveQueue::MoveQueue(std::size_t capacity) noexcept
    : capacity_(capacity == 0 ? 1 : capacity) {
}

EnqueueResult MoveQueue::push(const MoveRequest& request) noexcept {
    try {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            notFull_.wait(lock, [this] {
                return closed_ || requests_.size() < capacity_;
            });

            if (closed_) {
                return rejected(EnqueueError::Closed, "move queue closed");
            }
            requests_.push_back(request);
        }

        notEmpty_.notify_one();
        return accepted();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue move for " + std::to_string(request.id) + ": " + e.what());
        return rejected(EnqueueError::Closed, e.what());
    }
}

EnqueueResult MoveQueue::tryPush(const MoveRequest& request) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return rejected(EnqueueError::Closed, "move queue closed");
            }
            if (requests_.size() >= capacity_) {
                return rejected(EnqueueError::QueueFull,
                                "move queue full (" + std::to_string(capacity_) + ")");
            }
            requests_.push_back(request);
        }

        notEmpty_.notify_one();
        return accepted();
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue move for " + std::to_string(request.id) + ": " + e.what());
        return rejected(EnqueueError::Closed, e.what());
    }
}

std::optional<MoveRequest> MoveQueue::pop() noexcept {
    std::optional<MoveRequest> request;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        notEmpty_.wait(lock, [this] { return closed_ || !requests_.empty(); });

        if (requests_.empty()) {
            return std::nullopt;
        }
        request = requests_.front();
        requests_.pop_front();
    }

    notFull_.notify_one();
    return request;
}

void MoveQueue::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    notEmpty_.notify_all();
    notFull_.notify_all();
}

std::size_t MoveQueue::clear() noexcept {
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dropped = requests_.size();
        requests_.clear();
    }
    notFull_.notify_all();
    return dropped;
}

bool MoveQueue::closed() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t MoveQueue::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

EnqueueResult MoveQueue::accepted() {
    EnqueueResult result;
    result.ok = true;
    return result;
}

EnqueueResult MoveQueue::rejected(EnqueueError error, const std::string& message) {
    EnqueueResult result;
    result.error = error;
    result.message = message;
    return result;
}

}
