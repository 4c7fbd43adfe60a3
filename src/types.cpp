/*
 * sift - Staged Review Index
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sift/types.hpp"
#include <cctype>
#include <limits>

namespace sift {

const char* stageName(Stage stage) noexcept {
    switch (stage) {
        case Stage::Review: return "review";
        case Stage::Accept: return "accept";
        case Stage::Reject: return "reject";
        default: return "unknown";
    }
}

std::optional<ItemId> parseItemId(const std::string& text) noexcept {
    // Canonical form only: the file for an id is always named std::to_string(id)
    if (text.empty() || text.size() > 19 || text[0] == '0') {
        return std::nullopt;
    }

    ItemId value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        int digit = c - '0';
        if (value > (std::numeric_limits<ItemId>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }

    if (value <= 0) {
        return std::nullopt;
    }
    return value;
}

} // namespace sift
