/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sift/stage_index.hpp"
#include "sift/logger.hpp"
#include <mutex>

namespace sift {

std::size_t StageIndex::seed(Stage stage, const std::vector<ItemId>& ids) noexcept {
    std::size_t added = 0;

    try {
        for (ItemId id : ids) {
            if (id <= 0) {
                LOG_DEBUG("Ignoring non-positive id while seeding " + std::string(stageName(stage)));
                continue;
            }

            auto existing = owner(id);
            if (existing && *existing != stage) {
                LOG_WARN("Item " + std::to_string(id) + " already in " + stageName(*existing) +
                         ", not seeding it into " + stageName(stage));
                continue;
            }

            if (add(stage, id)) {
                ++added;
            }
        }

        LOG_DEBUG("Seeded " + std::to_string(added) + " item(s) into " + stageName(stage));
    } catch (const std::exception& e) {
        LOG_ERROR("Seeding " + std::string(stageName(stage)) + " failed: " + e.what());
    }

    return added;
}

bool StageIndex::contains(Stage stage, ItemId id) const noexcept {
    const auto& bucket = buckets_[stageIndex(stage)];
    std::shared_lock<std::shared_mutex> lock(bucket.mutex);
    return bucket.ids.find(id) != bucket.ids.end();
}

std::optional<ItemId> StageIndex::pickAny(Stage stage) const noexcept {
    const auto& bucket = buckets_[stageIndex(stage)];
    std::shared_lock<std::shared_mutex> lock(bucket.mutex);
    if (bucket.ids.empty()) {
        return std::nullopt;
    }
    return *bucket.ids.begin();
}

std::size_t StageIndex::size(Stage stage) const noexcept {
    const auto& bucket = buckets_[stageIndex(stage)];
    std::shared_lock<std::shared_mutex> lock(bucket.mutex);
    return bucket.ids.size();
}

bool StageIndex::add(Stage stage, ItemId id) noexcept {
    auto& bucket = buckets_[stageIndex(stage)];
    try {
        std::unique_lock<std::shared_mutex> lock(bucket.mutex);
        return bucket.ids.insert(id).second;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to add " + std::to_string(id) + " to " + stageName(stage) + ": " + e.what());
        return false;
    }
}

bool StageIndex::remove(Stage stage, ItemId id) noexcept {
    auto& bucket = buckets_[stageIndex(stage)];
    try {
        std::unique_lock<std::shared_mutex> lock(bucket.mutex);
        return bucket.ids.erase(id) > 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to remove " + std::to_string(id) + " from " + stageName(stage) + ": " + e.what());
        return false;
    }
}

std::optional<Stage> StageIndex::owner(ItemId id) const noexcept {
    for (Stage stage : kAllStages) {
        if (contains(stage, id)) {
            return stage;
        }
    }
    return std::nullopt;
}

}
