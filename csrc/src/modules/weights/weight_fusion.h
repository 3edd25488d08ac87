// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Weight Fusion Helpers - layout transformations between naming schemas
//
// Key transformations:
// 1. Latent KV merge: concatenate the compressed KV projection and the rotary key
//    projection along the output axis
// 2. Head interleave: per attention head, take the non-rotary key rows followed by
//    the value rows of the two decompression projections
// 3. Expert padding: zero-extend the intermediate axis of a routed expert
// 4. Expert stacking: combine per-expert weights into one tensor with a leading expert axis
//
// All functions return fresh tensors and never modify their inputs. Names passed in
// are only used for error messages.

#ifndef REMORA_SRC_MODULES_WEIGHTS_WEIGHT_FUSION_H
#define REMORA_SRC_MODULES_WEIGHTS_WEIGHT_FUSION_H

#include <string>
#include <string_view>
#include <vector>

#include "utilities/tensor.h"

namespace remora {

// ============================================================================
// Generic axis operations
// ============================================================================

/**
 * @brief A contiguous index range `[Begin, End)` of one tensor along the gather axis.
 */
struct AxisSegment {
    const Tensor* Source = nullptr;
    long Begin = 0;
    long End = 0;
};

/**
 * @brief Build a tensor by concatenating index ranges of several tensors along @p axis.
 *
 * All sources must share dtype, rank, and every dimension except @p axis.
 *
 * @throws std::logic_error if the sources are incompatible or a range is out of bounds.
 */
Tensor gather_along_axis(const std::vector<AxisSegment>& segments, int axis);

/**
 * @brief Copy of @p src restricted to `[begin, end)` along @p axis.
 */
Tensor narrow_axis(const Tensor& src, int axis, long begin, long end);

/**
 * @brief Extend @p axis of @p src to @p target_size with trailing zeros.
 *
 * Returns @p src itself (sharing its buffer) when the size already matches.
 *
 * @throws std::logic_error if @p target_size is smaller than the current size.
 */
Tensor pad_axis(const Tensor& src, int axis, long target_size);

/**
 * @brief A rank-N tensor of @p shape with every element set to @p value.
 *
 * Only FP32 and BF16 are supported.
 */
Tensor constant_tensor(ETensorDType dtype, const std::vector<long>& shape, float value);

/**
 * @brief Swap the two axes of a rank-2 tensor (element bytes copied unchanged).
 *
 * @throws std::logic_error if @p src is not rank 2.
 */
Tensor transpose_matrix(const Tensor& src);

// ============================================================================
// Latent attention
// ============================================================================

/**
 * @brief Concatenate two projections along their output axis.
 *
 * `result.Sizes[output_axis] == kv.Sizes[output_axis] + rope.Sizes[output_axis]`; values are
 * copied unchanged.
 *
 * @throws remora::ShapeMismatch naming both tensors and their shapes if ranks are not 2,
 *         dtypes differ, or the input (hidden) axis sizes differ.
 */
Tensor merge_projections(const Tensor& kv, std::string_view kv_name,
                         const Tensor& rope, std::string_view rope_name,
                         int output_axis);

/**
 * @brief Per-head interleave of key and value decompression projections.
 *
 * For every head h, the output receives rows `[h*k_head_rows, h*k_head_rows + k_keep_rows)`
 * of @p k followed by rows `[h*v_head_rows, (h+1)*v_head_rows)` of @p v, where "rows" run
 * along @p output_axis.
 *
 * @throws remora::ShapeMismatch if either tensor's output axis is not `heads * head_rows`,
 *         the input axes differ, or @p k_keep_rows exceeds @p k_head_rows.
 */
Tensor interleave_heads(const Tensor& k, std::string_view k_name,
                        const Tensor& v, std::string_view v_name,
                        int heads, long k_head_rows, long k_keep_rows, long v_head_rows,
                        int output_axis);

// ============================================================================
// MoE experts
// ============================================================================

/**
 * @brief The three SwiGLU projections of one expert, with their names for messages.
 *
 * Gate and up carry the intermediate dimension on their output axis, down on its input axis.
 */
struct ExpertWeights {
    Tensor Gate;
    Tensor Up;
    Tensor Down;
    std::string GateName;
    std::string UpName;
    std::string DownName;
};

/**
 * @brief Intermediate size of an expert after checking that its three projections agree.
 *
 * @throws remora::ShapeMismatch if a tensor is not rank 2 or the projections disagree on the
 *         intermediate or hidden size.
 */
long expert_intermediate_size(const ExpertWeights& expert, int output_axis);

/**
 * @brief Zero-pad the intermediate dimension of an expert to @p target_intermediate.
 *
 * Gate and up gain trailing zero rows on their output axis, down gains trailing zero
 * columns on its input axis, so the added channels contribute nothing to the expert output.
 * An expert already at the target size is returned unchanged.
 *
 * @throws remora::ShapeMismatch if the three projections disagree.
 * @throws remora::ConfigMismatch if the expert is wider than @p target_intermediate.
 */
ExpertWeights pad_expert(const ExpertWeights& expert, long target_intermediate, int output_axis);

/**
 * @brief Stack equally shaped tensors along a new leading axis, in the given order.
 *
 * Slice i of the result is bit-identical to `parts[i]`.
 *
 * @param parts Tensors to stack.
 * @param names Names of @p parts for error messages (same length).
 * @param target_name Name of the stacked tensor for error messages.
 *
 * @throws remora::ShapeMismatch if shapes or dtypes diverge, @p parts is empty, or the result
 *         would exceed the maximum rank.
 */
Tensor stack_tensors(const std::vector<Tensor>& parts, const std::vector<std::string>& names,
                     std::string_view target_name);

} // namespace remora

#endif // REMORA_SRC_MODULES_WEIGHTS_WEIGHT_FUSION_H
