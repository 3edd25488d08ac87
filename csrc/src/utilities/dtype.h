// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef REMORA_SRC_UTILS_DTYPE_H
#define REMORA_SRC_UTILS_DTYPE_H

#include <cstddef>
#include <cstdint>
#include <string_view>

//! Element types that can appear in a SafeTensors archive.
enum class ETensorDType : int {
    FP32,
    BF16,
    FP16,
    FP8_E4M3,
    FP8_E5M2,
    INT64,
    INT32,
    INT8,
    BYTE,
};

/// Size in bytes of a single element of @p type.
std::size_t get_dtype_size(ETensorDType type);

/// Parse a SafeTensors dtype string (`F32`, `BF16`, ...). Throws FormatError on unknown names.
ETensorDType dtype_from_str(std::string_view dtype);

/// SafeTensors dtype string for @p dtype.
const char* dtype_to_str(ETensorDType dtype);

/// PyTorch-style dtype name (`float32`, `bfloat16`, ...), used in config.json.
const char* dtype_to_torch_str(ETensorDType dtype);

/// Whether elements of @p dtype can be widened to float for numeric checks.
bool is_float_dtype(ETensorDType dtype);

template<typename T>
inline constexpr ETensorDType dtype_from_type = ETensorDType::BYTE;

template<> inline constexpr ETensorDType dtype_from_type<float> = ETensorDType::FP32;
template<> inline constexpr ETensorDType dtype_from_type<std::int64_t> = ETensorDType::INT64;
template<> inline constexpr ETensorDType dtype_from_type<std::int32_t> = ETensorDType::INT32;
template<> inline constexpr ETensorDType dtype_from_type<std::int8_t> = ETensorDType::INT8;
template<> inline constexpr ETensorDType dtype_from_type<std::byte> = ETensorDType::BYTE;

// BF16 / FP16 are stored as raw 16-bit patterns on the host.
float bf16_bits_to_float(std::uint16_t bits);
std::uint16_t float_to_bf16_bits(float value);
float fp16_bits_to_float(std::uint16_t bits);

#endif //REMORA_SRC_UTILS_DTYPE_H
