/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <optional>
#include <shared_mutex>
#include <unordered_set>
#include <vector>

#include "sift/types.hpp"

namespace sift {

class Processor;

// Per-stage ID sets, each behind its own reader/writer lock. Operations on
// different stages never contend. Membership is only mutated by seed() at
// startup and by the Processor afterwards.
class StageIndex final {
public:
    StageIndex() = default;

    StageIndex(const StageIndex&) = delete;
    StageIndex& operator=(const StageIndex&) = delete;
    StageIndex(StageIndex&&) = delete;
    StageIndex& operator=(StageIndex&&) = delete;

    // Returns the number of IDs added. IDs already held by another stage are
    // skipped so an inconsistent directory layout cannot duplicate an item.
    std::size_t seed(Stage stage, const std::vector<ItemId>& ids) noexcept;

    [[nodiscard]] bool contains(Stage stage, ItemId id) const noexcept;
    [[nodiscard]] std::optional<ItemId> pickAny(Stage stage) const noexcept;
    [[nodiscard]] std::size_t size(Stage stage) const noexcept;

private:
    friend class Processor;

    bool add(Stage stage, ItemId id) noexcept;
    bool remove(Stage stage, ItemId id) noexcept;

    struct Bucket {
        mutable std::shared_mutex mutex;
        std::unordered_set<ItemId> ids;
    };

    [[nodiscard]] std::optional<Stage> owner(ItemId id) const noexcept;

    std::array<Bucket, kStageCount> buckets_;
};

}
