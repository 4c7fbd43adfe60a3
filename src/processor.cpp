/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sift/processor.hpp"
#include "sift/stage_index.hpp"
#include "sift/logger.hpp"
#include <system_error>

namespace sift {

const char* outcomeName(MoveOutcome outcome) noexcept {
    switch (outcome) {
        case MoveOutcome::Moved: return "moved";
        case MoveOutcome::Stale: return "stale";
        case MoveOutcome::StorageError: return "storage-error";
        default: return "unknown";
    }
}

Processor::Processor(const std::filesystem::path& dataRoot, StageIndex& index) noexcept
    : dataRoot_(dataRoot), index_(index) {
    LOG_DEBUG("Processor created for data root: " + dataRoot_.string());
}

MoveOutcome Processor::apply(const MoveRequest& request) noexcept {
    const std::string label = std::to_string(request.id) + " " + stageName(request.from) +
                              " -> " + stageName(request.to);
    LOG_DEBUG("Applying move: " + label);

    try {
        // Step 1: index phase. A missing source membership means the request
        // is stale (already moved, unknown id, duplicate) and is dropped.
        if (!transferMembership(request)) {
            LOG_DEBUG("Stale move ignored: " + label);
            return MoveOutcome::Stale;
        }

        // Step 2: storage phase. The index is not rolled back on failure.
        if (!moveFile(request)) {
            return MoveOutcome::StorageError;
        }

        LOG_INFO("Moved " + label);
        return MoveOutcome::Moved;

    } catch (const std::exception& e) {
        LOG_ERROR("Exception applying move " + label + ": " + std::string(e.what()));
        return MoveOutcome::StorageError;
    }
}

std::filesystem::path Processor::itemPath(Stage stage, ItemId id) const {
    return dataRoot_ / stageName(stage) / std::to_string(id);
}

bool Processor::transferMembership(const MoveRequest& request) noexcept {
    if (request.from == request.to) {
        return false;
    }

    if (!index_.remove(request.from, request.id)) {
        return false;
    }

    if (!index_.add(request.to, request.id)) {
        // Only reachable if the id was somehow in both stages already
        LOG_WARN("Item " + std::to_string(request.id) + " was already present in " + stageName(request.to));
    }
    return true;
}

bool Processor::moveFile(const MoveRequest& request) noexcept {
    try {
        auto sourcePath = itemPath(request.from, request.id);
        auto destPath = itemPath(request.to, request.id);

        std::error_code ec;
        if (std::filesystem::exists(destPath, ec)) {
            LOG_ERROR("Move failed: " + sourcePath.string() + " -> " + destPath.string() +
                      " [destination already exists]");
            return false;
        }

        std::filesystem::rename(sourcePath, destPath, ec);
        if (ec) {
            LOG_ERROR("Move failed: " + sourcePath.string() + " -> " + destPath.string() +
                      " [" + ec.message() + "]");
            return false;
        }

        LOG_TRACE("Renamed " + sourcePath.string() + " -> " + destPath.string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to move item " + std::to_string(request.id) + ": " + std::string(e.what()));
        return false;
    }
}

}
