// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef REMORA_SRC_UTILS_TENSOR_H
#define REMORA_SRC_UTILS_TENSOR_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "dtype.h"
#include "utils.h"

constexpr int MAX_TENSOR_DIM = 5;

//! \brief The Tensor class represents a contiguous, row-major block of host memory that is
//! associated with a specific data type and shape.
//!
//! The backing buffer is reference counted and shared between copies. Tensors are treated as
//! immutable once they have been handed to another stage: every transform allocates a new
//! tensor instead of writing into its inputs.
struct Tensor {
    ETensorDType DType = ETensorDType::FP32;
    std::array<long, MAX_TENSOR_DIM> Sizes{};
    std::byte* Data = nullptr;
    int Rank = 0;
    std::shared_ptr<std::byte[]> Storage;

    [[nodiscard]] std::size_t bytes() const {
        return nelem() * get_dtype_size(DType);
    }

    [[nodiscard]] std::size_t nelem() const {
        std::size_t sz = 1;
        for(int i = 0; i < Rank; ++i) {
            sz *= Sizes[i];
        }
        return sz;
    }

    [[nodiscard]] bool is_null() const { return Data == nullptr; }
    [[nodiscard]] bool has_value() const { return Data != nullptr; }

    [[nodiscard]] std::vector<long> shape() const {
        return {Sizes.begin(), Sizes.begin() + Rank};
    }

    //! Shape rendered as `(a, b, c)` for error messages.
    [[nodiscard]] std::string shape_str() const;

    [[nodiscard]] std::span<const std::byte> byte_span() const {
        return {Data, bytes()};
    }

    //! Allocate a zero-filled tensor of the given shape.
    static Tensor allocate(ETensorDType dtype, const std::vector<long>& shape);

    //! Allocate a tensor and copy @p data into it; the byte count must match the shape.
    static Tensor from_bytes(ETensorDType dtype, const std::vector<long>& shape, std::span<const std::byte> data);

    template<class TargetType>
    [[nodiscard]] const TargetType* get() const {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<const TargetType*>(Data);
    }

    template<typename TargetType>
    [[nodiscard]] TargetType* get() {
        if(dtype_from_type<TargetType> != DType) {
            throw std::logic_error(std::string("DType mismatch: expected ") +
                dtype_to_str(dtype_from_type<TargetType>) + ", got " + dtype_to_str(DType));
        }

        return reinterpret_cast<TargetType*>(Data);
    }

    //! Element @p index widened to float (FP32, BF16 and FP16 only).
    [[nodiscard]] float float_at(long index) const;
};

std::string shape_to_str(const std::vector<long>& shape);

Tensor slice(const Tensor& src, int dim, long start, long end);

//! Same dtype, same shape and bit-identical contents.
bool equal_bytes(const Tensor& a, const Tensor& b);

//! All elements widened to float (FP32, BF16 and FP16 only).
std::vector<float> to_float_vector(const Tensor& t);

struct TensorMagnitude {
    double L2 = 0.0;
    double MaxAbs = 0.0;
    bool AllZero = true;
};

//! L2 norm and max-abs of a float tensor; other dtypes only report whether every byte is zero.
TensorMagnitude magnitude(const Tensor& t);

#endif //REMORA_SRC_UTILS_TENSOR_H
