// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef REMORA_SRC_UTILS_UTILS_H
#define REMORA_SRC_UTILS_UTILS_H

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

template<std::integral Dst, std::integral Src>
constexpr Dst narrow(Src input) {
    if constexpr (std::is_signed_v<Src>) {
        if (std::is_unsigned_v<Dst> && input < 0) {
            throw std::out_of_range("Cannot convert negative number to unsigned");
        }
        if (std::is_signed_v<Dst> && input < std::numeric_limits<Dst>::min())
        {
            throw std::out_of_range("Out of range in integer conversion: underflow");
        }
    }

    if (input > std::numeric_limits<Dst>::max())
    {
        throw std::out_of_range("Out of range in integer conversion: overflow");
    }

    return static_cast<Dst>(input);
}

// ----------------------------------------------------------------------------
bool iequals(std::string_view lhs, std::string_view rhs);

/// 64-bit FNV-1a over raw bytes; stable across platforms and runs.
std::uint64_t fnv1a_64(std::span<const std::byte> data);

/// Lower-case, zero-padded 16 digit hex rendering of @p value.
std::string to_hex(std::uint64_t value);

/**
 * @brief Displays a simple progress bar on stderr.
 *
 * @param current Current item index (0-based).
 * @param total Total number of items.
 * @param label Prefix label for the progress bar.
 */
void show_progress_bar(int current, int total, const std::string& label = "Converting");

#endif //REMORA_SRC_UTILS_UTILS_H
