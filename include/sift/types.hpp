/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace sift {

// Workflow stages. Review is the entry stage; Accept and Reject are terminal.
enum class Stage : std::uint8_t { Review = 0, Accept = 1, Reject = 2 };

inline constexpr std::size_t kStageCount = 3;
inline constexpr std::array<Stage, kStageCount> kAllStages = {Stage::Review, Stage::Accept, Stage::Reject};

// Positive numeric item identifier, also the file name inside a stage directory.
using ItemId = std::int64_t;

struct MoveRequest {
    ItemId id = 0;
    Stage to = Stage::Accept;
    Stage from = Stage::Review;
};

[[nodiscard]] const char* stageName(Stage stage) noexcept;

// Strict parse: digits only, no sign, no leading zero, no trailing junk, > 0.
[[nodiscard]] std::optional<ItemId> parseItemId(const std::string& text) noexcept;

[[nodiscard]] inline std::size_t stageIndex(Stage stage) noexcept {
    return static_cast<std::size_t>(stage);
}

} // namespace sift
