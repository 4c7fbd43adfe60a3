/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <cstdint>

#include "sift/types.hpp"

namespace sift {

class StageIndex;

enum class MoveOutcome : uint8_t {
    Moved,
    Stale,
    StorageError
};

[[nodiscard]] const char* outcomeName(MoveOutcome outcome) noexcept;

// Applies one move request: index first, then the rename on disk. A failed
// rename leaves the index in its post-move state; the caller only logs it.
class Processor {
public:
    Processor(const std::filesystem::path& dataRoot, StageIndex& index) noexcept;
    
    Processor(const Processor&) = delete;
    Processor& operator=(const Processor&) = delete;
    Processor(Processor&&) = delete;
    Processor& operator=(Processor&&) = delete;

    [[nodiscard]] MoveOutcome apply(const MoveRequest& request) noexcept;

    [[nodiscard]] std::filesystem::path itemPath(Stage stage, ItemId id) const;

private:
    std::filesystem::path dataRoot_;
    StageIndex& index_;
    
    [[nodiscard]] bool transferMembership(const MoveRequest& request) noexcept;
    [[nodiscard]] bool moveFile(const MoveRequest& request) noexcept;
};

}
