/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sift/flow.hpp"
#include "sift/stage_index.hpp"
#include "sift/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

namespace sift {

Flow::Flow(const std::filesystem::path& dataRoot, const StageIndex& index) noexcept 
    : dataRoot_(dataRoot), index_(index) {
    LOG_DEBUG("Flow created for data root: " + dataRoot_.string());
}

LoadResult Flow::load(ItemId id, Stage stage) const noexcept {
    LoadResult result;
    try {
        result.item.id = id;
        result.item.stage = stage;

        if (!index_.contains(stage, id)) {
            result.error = LoadError::NotFound;
            result.message = "entry not present: " + std::to_string(id);
            return result;
        }

        auto file = dataRoot_ / stageName(stage) / std::to_string(id);
        std::string error;
        auto content = readContent(file, error);
        if (!content) {
            // Normal when a move of this id is applied concurrently
            result.error = LoadError::IoError;
            result.message = error;
            return result;
        }

        result.ok = true;
        result.item.content = std::move(*content);
        return result;

    } catch (const std::exception& e) {
        LOG_ERROR("Error loading item " + std::to_string(id) + ": " + e.what());
        result.ok = false;
        result.error = LoadError::IoError;
        result.message = e.what();
        return result;
    }
}

std::optional<ItemId> Flow::next(Stage stage) const noexcept {
    return index_.pickAny(stage);
}

std::optional<Stage> Flow::locate(ItemId id) const noexcept {
    for (Stage stage : kAllStages) {
        if (index_.contains(stage, id)) {
            return stage;
        }
    }
    return std::nullopt;
}

std::optional<std::string> Flow::readContent(const std::filesystem::path& file, std::string& error) const noexcept {
    try {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            error = "cannot open " + file.string() + ": " + std::strerror(errno);
            return std::nullopt;
        }

        std::string content((std::istreambuf_iterator<char>(in)),
                            std::istreambuf_iterator<char>());
        if (in.bad()) {
            error = "read failed: " + file.string();
            return std::nullopt;
        }
        return content;
    } catch (const std::exception& e) {
        error = "read failed: " + file.string() + ": " + e.what();
        return std::nullopt;
    }
}

}
