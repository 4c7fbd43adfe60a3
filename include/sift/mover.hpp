/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "sift/move_queue.hpp"
#include "sift/processor.hpp"
#include "sift/types.hpp"

namespace sift {

using MoveObserver = std::function<void(const MoveRequest&, MoveOutcome)>;

struct MoverStats {
    std::uint64_t moved = 0;
    std::uint64_t stale = 0;
    std::uint64_t failed = 0;
};

// The single dedicated thread that drains the MoveQueue into the Processor,
// one request at a time, in submission order.
class Mover final {
public:
    explicit Mover(Processor& processor, std::size_t queueCapacity = MoveQueue::kDefaultCapacity) noexcept;
    ~Mover();

    Mover(const Mover&) = delete;
    Mover& operator=(const Mover&) = delete;
    Mover(Mover&&) = delete;
    Mover& operator=(Mover&&) = delete;

    // The observer runs on the Mover thread after every applied request.
    [[nodiscard]] bool start(MoveObserver observer = {});
    void stop() noexcept;

    // Blocks the caller while the queue is full.
    [[nodiscard]] EnqueueResult submit(const MoveRequest& request) noexcept;
    [[nodiscard]] EnqueueResult trySubmit(const MoveRequest& request) noexcept;

    // Waits until every accepted request has been applied.
    bool drain(std::chrono::milliseconds timeout) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept { return queue_.size(); }
    [[nodiscard]] std::size_t queueCapacity() const noexcept { return queue_.capacity(); }
    [[nodiscard]] MoverStats stats() const noexcept;

private:
    void moveLoop();
    void record(const MoveRequest& request, MoveOutcome outcome) noexcept;
    void noteAccepted(const EnqueueResult& result) noexcept;

    Processor& processor_;
    MoveQueue queue_;
    MoveObserver observer_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};

    mutable std::mutex progressMutex_;
    std::condition_variable progress_;
    std::uint64_t accepted_ = 0;
    std::uint64_t finished_ = 0;
    MoverStats stats_;

    std::thread thread_;
};

}
