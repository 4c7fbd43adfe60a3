/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

#include "sift/types.hpp"

namespace sift {

enum class EnqueueError : uint8_t {
    None = 0,
    QueueFull,
    Closed
};

struct EnqueueResult {
    bool ok = false;
    EnqueueError error = EnqueueError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Bounded FIFO between any number of producers and the single Mover thread.
// push() blocks while full; tryPush() fails with QueueFull instead. Nothing
// is ever dropped once accepted, except by close() + clear() at shutdown.
class MoveQueue final {
public:
    static constexpr std::size_t kDefaultCapacity = 100;

    explicit MoveQueue(std::size_t capacity = kDefaultCapacity) noexcept;

    MoveQueue(const MoveQueue&) = delete;
    MoveQueue& operator=(const MoveQueue&) = delete;
    MoveQueue(MoveQueue&&) = delete;
    MoveQueue& operator=(MoveQueue&&) = delete;

    [[nodiscard]] EnqueueResult push(const MoveRequest& request) noexcept;
    [[nodiscard]] EnqueueResult tryPush(const MoveRequest& request) noexcept;

    // Blocks until a request is available or the queue is closed and empty.
    [[nodiscard]] std::optional<MoveRequest> pop() noexcept;

    void close() noexcept;
    std::size_t clear() noexcept;

    [[nodiscard]] bool closed() const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    [[nodiscard]] static EnqueueResult accepted();
    [[nodiscard]] static EnqueueResult rejected(EnqueueError error, const std::string& message);

    std::size_t capacity_;
    bool closed_ = false;

    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
    std::deque<MoveRequest> requests_;
};

}
