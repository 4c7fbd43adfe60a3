/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "sift/config.hpp"
#include "sift/flow.hpp"
#include "sift/move_queue.hpp"
#include "sift/types.hpp"

namespace sift {

class StageIndex;
class Processor;
class Mover;
class HttpFrontend;

// Composition root: owns the index, the mover and the HTTP frontend.
class Server final {
public:
    explicit Server(const Config& config);
    ~Server();

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;
    Server(Server&&) = delete;
    Server& operator=(Server&&) = delete;

    [[nodiscard]] bool start();
    void shutdown() noexcept;

    // Fire-once request, safe from any thread including HTTP workers.
    void requestShutdown() noexcept;
    [[nodiscard]] bool shutdownRequested() const noexcept { return shutdownRequested_.load(); }
    bool waitForShutdownRequest(std::chrono::milliseconds timeout);

    [[nodiscard]] EnqueueResult accept(ItemId id) noexcept { return move({id, Stage::Accept, Stage::Review}); }
    [[nodiscard]] EnqueueResult reject(ItemId id) noexcept { return move({id, Stage::Reject, Stage::Review}); }
    [[nodiscard]] EnqueueResult move(const MoveRequest& request) noexcept;

    [[nodiscard]] std::optional<ItemId> next() const noexcept;
    [[nodiscard]] LoadResult view(ItemId id) const noexcept { return load(id, Stage::Review); }
    [[nodiscard]] LoadResult load(ItemId id, Stage stage) const noexcept;
    [[nodiscard]] std::optional<Stage> locate(ItemId id) const noexcept;

    [[nodiscard]] std::string statusReport() const;
    bool drain(std::chrono::milliseconds timeout) noexcept;

    [[nodiscard]] const StageIndex& index() const noexcept { return *index_; }
    [[nodiscard]] std::uint16_t port() const noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

private:
    [[nodiscard]] bool createDataRoot() noexcept;
    [[nodiscard]] std::size_t seedIndex() noexcept;

    Config config_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdownRequested_{false};
    std::mutex shutdownMutex_;
    std::condition_variable shutdownCondition_;

    std::unique_ptr<StageIndex> index_;
    std::unique_ptr<Processor> processor_;
    std::unique_ptr<Mover> mover_;
    std::unique_ptr<Flow> flow_;
    std::unique_ptr<HttpFrontend> http_;
};

}
