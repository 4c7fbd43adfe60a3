/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "sift/types.hpp"

namespace sift {

class StageIndex;

enum class LoadError : uint8_t {
    None = 0,
    NotFound,
    IoError
};

struct Item {
    ItemId id = 0;
    Stage stage = Stage::Review;
    std::string content;
};

struct LoadResult {
    bool ok = false;
    Item item;
    LoadError error = LoadError::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Read side. Membership is checked against the index before touching the
// file; a file that vanishes in between is reported as IoError.
class Flow {
public:
    Flow(const std::filesystem::path& dataRoot, const StageIndex& index) noexcept;

    Flow(const Flow&) = delete;
    Flow& operator=(const Flow&) = delete;

    [[nodiscard]] LoadResult load(ItemId id, Stage stage) const noexcept;
    [[nodiscard]] std::optional<ItemId> next(Stage stage = Stage::Review) const noexcept;
    [[nodiscard]] std::optional<Stage> locate(ItemId id) const noexcept;

private:
    std::filesystem::path dataRoot_;
    const StageIndex& index_;
    
    [[nodiscard]] std::optional<std::string> readContent(const std::filesystem::path& file, std::string& error) const noexcept;
};

}
