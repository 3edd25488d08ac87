// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "tensor.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

std::string shape_to_str(const std::vector<long>& shape) {
    return fmt::format("({})", fmt::join(shape, ", "));
}

std::string Tensor::shape_str() const {
    return shape_to_str(shape());
}

/**
 * @brief Allocate a zero-initialized host tensor.
 *
 * @param dtype Element type.
 * @param shape Dimension sizes; at most MAX_TENSOR_DIM entries, none negative.
 * @return Tensor owning a fresh buffer.
 *
 * @throws std::runtime_error if the rank is too large or a dimension is negative.
 */
Tensor Tensor::allocate(ETensorDType dtype, const std::vector<long>& shape) {
    if (shape.size() > MAX_TENSOR_DIM) throw std::runtime_error("Tensor rank too large");
    Tensor t;
    t.DType = dtype;
    t.Rank = narrow<int>(shape.size());
    for (int i = 0; i < t.Rank; ++i) {
        if (shape[i] < 0) throw std::runtime_error(fmt::format("Negative dimension in shape {}", shape_to_str(shape)));
        t.Sizes[i] = shape[i];
    }
    for (int i = t.Rank; i < MAX_TENSOR_DIM; ++i) t.Sizes[i] = 1;

    // make_shared<T[]> value-initializes, so the buffer starts out as zeros
    const std::size_t n = std::max<std::size_t>(t.bytes(), 1);
    t.Storage = std::make_shared<std::byte[]>(n);
    t.Data = t.Storage.get();
    return t;
}

Tensor Tensor::from_bytes(ETensorDType dtype, const std::vector<long>& shape, std::span<const std::byte> data) {
    Tensor t = allocate(dtype, shape);
    if (data.size() != t.bytes()) {
        throw std::logic_error(fmt::format("Byte count {} does not match {} {} ({} bytes)",
                                           data.size(), dtype_to_str(dtype), shape_to_str(shape), t.bytes()));
    }
    if (!data.empty()) {
        std::memcpy(t.Data, data.data(), data.size());
    }
    return t;
}

float Tensor::float_at(long index) const {
    switch (DType) {
    case ETensorDType::FP32: {
        float v;
        std::memcpy(&v, Data + index * sizeof(float), sizeof(v));
        return v;
    }
    case ETensorDType::BF16: {
        std::uint16_t bits;
        std::memcpy(&bits, Data + index * sizeof(bits), sizeof(bits));
        return bf16_bits_to_float(bits);
    }
    case ETensorDType::FP16: {
        std::uint16_t bits;
        std::memcpy(&bits, Data + index * sizeof(bits), sizeof(bits));
        return fp16_bits_to_float(bits);
    }
    default:
        throw std::logic_error(fmt::format("Cannot read {} tensor as float", dtype_to_str(DType)));
    }
}

/**
 * @brief Create a contiguous view into @p src by slicing the first dimension.
 *
 * Only dimension 0 is supported because slices must remain contiguous with the
 * current Tensor storage/layout assumptions.
 *
 * @param src  Source tensor to slice (view semantics; no copy).
 * @param dim  Dimension to slice; must be 0.
 * @param start  Inclusive start index along @p dim (in elements).
 * @param end    Exclusive end index along @p dim (in elements).
 * @return Tensor view that shares storage with @p src and has Sizes[dim] = end-start.
 *
 * @throws std::logic_error if @p dim != 0 or if indices are out of bounds.
 */
Tensor slice(const Tensor& src, int dim, long start, long end) {
    if (dim != 0 || src.Rank == 0)
        throw std::logic_error("Slices must be contiguous, so only the first dimension can be sliced.");

    if (start < 0 || start > end || end > src.Sizes[dim])
        throw std::logic_error("Slice out of bounds.");

    std::array<long, MAX_TENSOR_DIM> strides{};

    strides[src.Rank - 1] = 1;
    for (int i = src.Rank - 2; i >= 0; --i)
        strides[i] = strides[i + 1] * src.Sizes[i + 1];

    Tensor dst = src;
    dst.Sizes[dim] = end - start;
    std::ptrdiff_t offset = start * strides[dim] * get_dtype_size(src.DType);
    dst.Data = src.Data + offset;
    return dst;
}

bool equal_bytes(const Tensor& a, const Tensor& b) {
    if (a.DType != b.DType || a.shape() != b.shape())
        return false;
    if (a.bytes() == 0)
        return true;
    return std::memcmp(a.Data, b.Data, a.bytes()) == 0;
}

std::vector<float> to_float_vector(const Tensor& t) {
    std::vector<float> result(t.nelem());
    for (std::size_t i = 0; i < result.size(); ++i) {
        result[i] = t.float_at(static_cast<long>(i));
    }
    return result;
}

TensorMagnitude magnitude(const Tensor& t) {
    TensorMagnitude result;
    if (!is_float_dtype(t.DType)) {
        const auto bytes = t.byte_span();
        result.AllZero = std::all_of(bytes.begin(), bytes.end(), [](std::byte b) { return b == std::byte{0}; });
        return result;
    }
    double sum_sq = 0.0;
    const long n = static_cast<long>(t.nelem());
    for (long i = 0; i < n; ++i) {
        const double v = t.float_at(i);
        sum_sq += v * v;
        result.MaxAbs = std::max(result.MaxAbs, std::abs(v));
        if (v != 0.0) result.AllZero = false;
    }
    result.L2 = std::sqrt(sum_sq);
    return result;
}
