// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "utils.h"

#include <algorithm>
#include <cctype>
#include <iostream>

#include <fmt/format.h>

/**
 * @brief Case-insensitive equality comparison for two string views (ASCII-ish semantics).
 *
 * @param lhs Left-hand string view.
 * @param rhs Right-hand string view.
 * @return True if both views have the same length and match case-insensitively; false otherwise.
 */
bool iequals(std::string_view lhs, std::string_view rhs) {
    return std::ranges::equal(
        lhs, rhs, [](unsigned char a, unsigned char b) {
            return std::tolower(a) == std::tolower(b);
    });
}

std::uint64_t fnv1a_64(std::span<const std::byte> data) {
    std::uint64_t hash = 0xcbf29ce484222325ULL;
    for (std::byte b : data) {
        hash ^= static_cast<std::uint64_t>(b);
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

std::string to_hex(std::uint64_t value) {
    return fmt::format("{:016x}", value);
}

void show_progress_bar(int current, int total, const std::string& label) {
    const int bar_width = 40;
    float progress = static_cast<float>(current + 1) / total;
    int pos = static_cast<int>(bar_width * progress);

    std::cerr << "\r" << label << ": [";
    for (int i = 0; i < bar_width; ++i) {
        if (i < pos) std::cerr << "=";
        else if (i == pos) std::cerr << ">";
        else std::cerr << " ";
    }
    std::cerr << "] " << static_cast<int>(progress * 100.0) << "% ("
              << (current + 1) << "/" << total << ")" << std::flush;

    if (current + 1 == total) {
        std::cerr << std::endl;
    }
}
