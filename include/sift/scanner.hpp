/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <vector>

#include "sift/types.hpp"

namespace sift {

// Lists the item files present in a stage directory. Used once at startup
// to seed the StageIndex.
class Scanner {
public:
    explicit Scanner(const std::filesystem::path& dataRoot) noexcept;
    
    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;
    Scanner(Scanner&&) noexcept = default;
    Scanner& operator=(Scanner&&) noexcept = default;

    [[nodiscard]] std::vector<ItemId> scan(Stage stage) const noexcept;
    [[nodiscard]] std::filesystem::path stageDir(Stage stage) const;

private:
    std::filesystem::path dataRoot_;
    
    [[nodiscard]] bool isItemFile(const std::filesystem::directory_entry& entry) const noexcept;
};

}
