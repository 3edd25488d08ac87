// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "dtype.h"

#include <bit>
#include <cmath>
#include <string>

#include <fmt/core.h>

#include "errors.h"

std::size_t get_dtype_size(ETensorDType type) {
    switch (type) {
    case ETensorDType::FP32:
    case ETensorDType::INT32:
        return 4;
    case ETensorDType::INT64:
        return 8;
    case ETensorDType::BF16:
    case ETensorDType::FP16:
        return 2;
    case ETensorDType::FP8_E4M3:
    case ETensorDType::FP8_E5M2:
    case ETensorDType::INT8:
    case ETensorDType::BYTE:
        return 1;
    }
    throw std::logic_error(fmt::format("Invalid dtype {}", static_cast<int>(type)));
}

ETensorDType dtype_from_str(std::string_view dtype) {
    if (dtype == "F32") return ETensorDType::FP32;
    if (dtype == "BF16") return ETensorDType::BF16;
    if (dtype == "F16") return ETensorDType::FP16;
    if (dtype == "F8_E4M3") return ETensorDType::FP8_E4M3;
    if (dtype == "F8_E5M2") return ETensorDType::FP8_E5M2;
    if (dtype == "I64") return ETensorDType::INT64;
    if (dtype == "I32") return ETensorDType::INT32;
    if (dtype == "I8") return ETensorDType::INT8;
    if (dtype == "U8") return ETensorDType::BYTE;
    throw remora::FormatError("read", "", fmt::format("unsupported dtype `{}`", dtype));
}

const char* dtype_to_str(ETensorDType dtype) {
    switch (dtype) {
    case ETensorDType::FP32: return "F32";
    case ETensorDType::BF16: return "BF16";
    case ETensorDType::FP16: return "F16";
    case ETensorDType::FP8_E4M3: return "F8_E4M3";
    case ETensorDType::FP8_E5M2: return "F8_E5M2";
    case ETensorDType::INT64: return "I64";
    case ETensorDType::INT32: return "I32";
    case ETensorDType::INT8: return "I8";
    case ETensorDType::BYTE: return "U8";
    }
    throw std::logic_error(fmt::format("Invalid dtype {}", static_cast<int>(dtype)));
}

const char* dtype_to_torch_str(ETensorDType dtype) {
    switch (dtype) {
    case ETensorDType::FP32: return "float32";
    case ETensorDType::BF16: return "bfloat16";
    case ETensorDType::FP16: return "float16";
    case ETensorDType::FP8_E4M3: return "float8_e4m3fn";
    case ETensorDType::FP8_E5M2: return "float8_e5m2";
    case ETensorDType::INT64: return "int64";
    case ETensorDType::INT32: return "int32";
    case ETensorDType::INT8: return "int8";
    case ETensorDType::BYTE: return "uint8";
    }
    throw std::logic_error(fmt::format("Invalid dtype {}", static_cast<int>(dtype)));
}

bool is_float_dtype(ETensorDType dtype) {
    return dtype == ETensorDType::FP32 || dtype == ETensorDType::BF16 || dtype == ETensorDType::FP16;
}

float bf16_bits_to_float(std::uint16_t bits) {
    return std::bit_cast<float>(static_cast<std::uint32_t>(bits) << 16);
}

std::uint16_t float_to_bf16_bits(float value) {
    std::uint32_t u = std::bit_cast<std::uint32_t>(value);
    // round to nearest even on the cut at 16 LSBs
    std::uint32_t lsb = (u >> 16) & 1u;
    u += 0x7FFFu + lsb;
    return static_cast<std::uint16_t>(u >> 16);
}

float fp16_bits_to_float(std::uint16_t bits) {
    const std::uint32_t sign = (bits >> 15) & 0x1u;
    const std::uint32_t exponent = (bits >> 10) & 0x1Fu;
    const std::uint32_t mantissa = bits & 0x3FFu;

    float magnitude;
    if (exponent == 0) {
        // subnormal
        magnitude = std::ldexp(static_cast<float>(mantissa), -24);
    } else if (exponent == 31) {
        magnitude = mantissa == 0 ? INFINITY : NAN;
    } else {
        magnitude = std::ldexp(static_cast<float>(mantissa | 0x400u), static_cast<int>(exponent) - 25);
    }
    return sign ? -magnitude : magnitude;
}
