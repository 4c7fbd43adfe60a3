/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sift/scanner.hpp"
#include "sift/logger.hpp"
#include <algorithm>

namespace sift {

Scanner::Scanner(const std::filesystem::path& dataRoot) noexcept 
    : dataRoot_(dataRoot) {
}

std::vector<ItemId> Scanner::scan(Stage stage) const noexcept {
    std::vector<ItemId> items;
    
    try {
        auto dir = stageDir(stage);
        if (!std::filesystem::exists(dir)) {
            LOG_DEBUG("Stage directory does not exist: " + dir.string());
            return items;
        }

        for (const auto& entry : std::filesystem::directory_iterator(dir)) {
            if (!isItemFile(entry)) {
                continue;
            }

            auto name = entry.path().filename().string();
            auto id = parseItemId(name);
            if (!id) {
                LOG_DEBUG("Issue with conversion for filename: " + name);
                continue;
            }

            items.push_back(*id);
            LOG_TRACE("Found item: " + name + " in " + stageName(stage));
        }

        std::sort(items.begin(), items.end());
        
        LOG_DEBUG("Scanner found " + std::to_string(items.size()) + " item(s) in " + stageName(stage));
        
    } catch (const std::exception& e) {
        LOG_ERROR("Scanner error in " + std::string(stageName(stage)) + ": " + std::string(e.what()));
    }
    
    return items;
}

std::filesystem::path Scanner::stageDir(Stage stage) const {
    return dataRoot_ / stageName(stage);
}

bool Scanner::isItemFile(const std::filesystem::directory_entry& entry) const noexcept {
    std::error_code ec;
    if (!entry.is_regular_file(ec) || ec) {
        return false;
    }
    return true;
}

}
