// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/weights/weight_fusion.h"

#include <cstring>
#include <stdexcept>

#include <fmt/core.h>

#include "utilities/errors.h"

namespace remora {

namespace {

//! Number of index combinations before @p axis.
long outer_count(const Tensor& t, int axis) {
    long n = 1;
    for (int i = 0; i < axis; ++i) n *= t.Sizes[i];
    return n;
}

//! Bytes of one index step along @p axis.
std::size_t inner_bytes(const Tensor& t, int axis) {
    std::size_t n = get_dtype_size(t.DType);
    for (int i = axis + 1; i < t.Rank; ++i) n *= t.Sizes[i];
    return n;
}

void check_axis(const Tensor& t, int axis) {
    if (axis < 0 || axis >= t.Rank) {
        throw std::logic_error(fmt::format("axis {} out of range for tensor of shape {}", axis, t.shape_str()));
    }
}

} // namespace

Tensor gather_along_axis(const std::vector<AxisSegment>& segments, int axis) {
    if (segments.empty()) {
        throw std::logic_error("gather_along_axis: no segments");
    }
    const Tensor& first = *segments.front().Source;
    check_axis(first, axis);

    long total = 0;
    for (const auto& seg : segments) {
        const Tensor& src = *seg.Source;
        if (src.DType != first.DType || src.Rank != first.Rank) {
            throw std::logic_error("gather_along_axis: dtype or rank mismatch");
        }
        for (int i = 0; i < src.Rank; ++i) {
            if (i != axis && src.Sizes[i] != first.Sizes[i]) {
                throw std::logic_error(fmt::format("gather_along_axis: {} vs {} differ outside axis {}",
                                                   src.shape_str(), first.shape_str(), axis));
            }
        }
        if (seg.Begin < 0 || seg.Begin > seg.End || seg.End > src.Sizes[axis]) {
            throw std::logic_error(fmt::format("gather_along_axis: range [{}, {}) out of bounds for {}",
                                               seg.Begin, seg.End, src.shape_str()));
        }
        total += seg.End - seg.Begin;
    }

    std::vector<long> shape = first.shape();
    shape[axis] = total;
    Tensor dst = Tensor::allocate(first.DType, shape);

    const long outer = outer_count(first, axis);
    const std::size_t step = inner_bytes(first, axis);
    std::byte* out = dst.Data;
    for (long o = 0; o < outer; ++o) {
        for (const auto& seg : segments) {
            const Tensor& src = *seg.Source;
            const std::size_t count = static_cast<std::size_t>(seg.End - seg.Begin) * step;
            if (count == 0) continue;
            const std::byte* in = src.Data + (static_cast<std::size_t>(o * src.Sizes[axis] + seg.Begin)) * step;
            std::memcpy(out, in, count);
            out += count;
        }
    }
    return dst;
}

Tensor narrow_axis(const Tensor& src, int axis, long begin, long end) {
    return gather_along_axis({AxisSegment{&src, begin, end}}, axis);
}

Tensor pad_axis(const Tensor& src, int axis, long target_size) {
    check_axis(src, axis);
    const long current = src.Sizes[axis];
    if (current == target_size) {
        return src;
    }
    if (current > target_size) {
        throw std::logic_error(fmt::format("pad_axis: cannot shrink axis {} of {} to {}", axis, src.shape_str(), target_size));
    }

    std::vector<long> shape = src.shape();
    shape[axis] = target_size;
    Tensor dst = Tensor::allocate(src.DType, shape);   // zero-filled

    const long outer = outer_count(src, axis);
    const std::size_t step = inner_bytes(src, axis);
    const std::size_t src_block = static_cast<std::size_t>(current) * step;
    const std::size_t dst_block = static_cast<std::size_t>(target_size) * step;
    if (src_block == 0) return dst;
    for (long o = 0; o < outer; ++o) {
        std::memcpy(dst.Data + o * dst_block, src.Data + o * src_block, src_block);
    }
    return dst;
}

Tensor constant_tensor(ETensorDType dtype, const std::vector<long>& shape, float value) {
    Tensor t = Tensor::allocate(dtype, shape);
    const std::size_t n = t.nelem();
    switch (dtype) {
    case ETensorDType::FP32: {
        float* data = t.get<float>();
        for (std::size_t i = 0; i < n; ++i) data[i] = value;
        break;
    }
    case ETensorDType::BF16: {
        const std::uint16_t bits = float_to_bf16_bits(value);
        for (std::size_t i = 0; i < n; ++i) std::memcpy(t.Data + i * sizeof(bits), &bits, sizeof(bits));
        break;
    }
    default:
        throw std::logic_error(fmt::format("constant_tensor: unsupported dtype {}", dtype_to_str(dtype)));
    }
    return t;
}

Tensor transpose_matrix(const Tensor& src) {
    if (src.Rank != 2) {
        throw std::logic_error(fmt::format("transpose_matrix: expected rank 2, got {}", src.shape_str()));
    }
    const long rows = src.Sizes[0];
    const long cols = src.Sizes[1];
    const std::size_t elem = get_dtype_size(src.DType);
    Tensor dst = Tensor::allocate(src.DType, {cols, rows});
    for (long r = 0; r < rows; ++r) {
        for (long c = 0; c < cols; ++c) {
            std::memcpy(dst.Data + (c * rows + r) * elem, src.Data + (r * cols + c) * elem, elem);
        }
    }
    return dst;
}

Tensor merge_projections(const Tensor& kv, std::string_view kv_name,
                         const Tensor& rope, std::string_view rope_name,
                         int output_axis) {
    const int input_axis = 1 - output_axis;
    if (kv.Rank != 2 || rope.Rank != 2) {
        throw ShapeMismatch("merge", std::string(kv_name),
                            fmt::format("`{}` {} and `{}` {} must both be rank-2 projections",
                                        kv_name, kv.shape_str(), rope_name, rope.shape_str()));
    }
    if (kv.Sizes[input_axis] != rope.Sizes[input_axis]) {
        throw ShapeMismatch("merge", std::string(kv_name),
                            fmt::format("input axis {} differs: `{}` {} vs `{}` {}", input_axis,
                                        kv_name, kv.shape_str(), rope_name, rope.shape_str()));
    }
    if (kv.DType != rope.DType) {
        throw ShapeMismatch("merge", std::string(kv_name),
                            fmt::format("dtype differs: `{}` is {}, `{}` is {}", kv_name, dtype_to_str(kv.DType),
                                        rope_name, dtype_to_str(rope.DType)));
    }
    return gather_along_axis({AxisSegment{&kv, 0, kv.Sizes[output_axis]},
                              AxisSegment{&rope, 0, rope.Sizes[output_axis]}},
                             output_axis);
}

Tensor interleave_heads(const Tensor& k, std::string_view k_name,
                        const Tensor& v, std::string_view v_name,
                        int heads, long k_head_rows, long k_keep_rows, long v_head_rows,
                        int output_axis) {
    const int input_axis = 1 - output_axis;
    if (k.Rank != 2 || v.Rank != 2) {
        throw ShapeMismatch("interleave", std::string(k_name),
                            fmt::format("`{}` {} and `{}` {} must both be rank-2 projections",
                                        k_name, k.shape_str(), v_name, v.shape_str()));
    }
    if (k.Sizes[output_axis] != heads * k_head_rows) {
        throw ShapeMismatch("interleave", std::string(k_name),
                            fmt::format("expected {} heads x {} rows on axis {}, got shape {}",
                                        heads, k_head_rows, output_axis, k.shape_str()));
    }
    if (v.Sizes[output_axis] != heads * v_head_rows) {
        throw ShapeMismatch("interleave", std::string(v_name),
                            fmt::format("expected {} heads x {} rows on axis {}, got shape {}",
                                        heads, v_head_rows, output_axis, v.shape_str()));
    }
    if (k.Sizes[input_axis] != v.Sizes[input_axis] || k.DType != v.DType) {
        throw ShapeMismatch("interleave", std::string(k_name),
                            fmt::format("`{}` {} {} and `{}` {} {} disagree on input axis or dtype",
                                        k_name, dtype_to_str(k.DType), k.shape_str(),
                                        v_name, dtype_to_str(v.DType), v.shape_str()));
    }
    if (k_keep_rows > k_head_rows) {
        throw ShapeMismatch("interleave", std::string(k_name),
                            fmt::format("cannot keep {} of {} rows per head", k_keep_rows, k_head_rows));
    }

    std::vector<AxisSegment> segments;
    segments.reserve(2 * heads);
    for (int h = 0; h < heads; ++h) {
        segments.push_back({&k, h * k_head_rows, h * k_head_rows + k_keep_rows});
        segments.push_back({&v, h * v_head_rows, (h + 1) * v_head_rows});
    }
    return gather_along_axis(segments, output_axis);
}

long expert_intermediate_size(const ExpertWeights& expert, int output_axis) {
    const int input_axis = 1 - output_axis;
    for (const auto* t : {&expert.Gate, &expert.Up, &expert.Down}) {
        if (t->Rank != 2) {
            const std::string& name = t == &expert.Gate ? expert.GateName : t == &expert.Up ? expert.UpName : expert.DownName;
            throw ShapeMismatch("pad", name, fmt::format("expected a rank-2 projection, got shape {}", t->shape_str()));
        }
    }
    if (expert.Gate.shape() != expert.Up.shape() || expert.Gate.DType != expert.Up.DType) {
        throw ShapeMismatch("pad", expert.UpName,
                            fmt::format("`{}` {} {} and `{}` {} {} must match", expert.GateName,
                                        dtype_to_str(expert.Gate.DType), expert.Gate.shape_str(), expert.UpName,
                                        dtype_to_str(expert.Up.DType), expert.Up.shape_str()));
    }
    const long intermediate = expert.Gate.Sizes[output_axis];
    const long hidden = expert.Gate.Sizes[input_axis];
    if (expert.Down.Sizes[input_axis] != intermediate || expert.Down.Sizes[output_axis] != hidden ||
        expert.Down.DType != expert.Gate.DType) {
        throw ShapeMismatch("pad", expert.DownName,
                            fmt::format("`{}` {} is not the transpose-shaped partner of `{}` {}", expert.DownName,
                                        expert.Down.shape_str(), expert.GateName, expert.Gate.shape_str()));
    }
    return intermediate;
}

ExpertWeights pad_expert(const ExpertWeights& expert, long target_intermediate, int output_axis) {
    const long intermediate = expert_intermediate_size(expert, output_axis);
    if (intermediate > target_intermediate) {
        throw ConfigMismatch("pad", expert.GateName,
                             fmt::format("intermediate size {} exceeds the target size {}; padding never truncates",
                                         intermediate, target_intermediate));
    }

    ExpertWeights padded = expert;
    if (intermediate == target_intermediate) {
        return padded;
    }
    padded.Gate = pad_axis(expert.Gate, output_axis, target_intermediate);
    padded.Up = pad_axis(expert.Up, output_axis, target_intermediate);
    padded.Down = pad_axis(expert.Down, 1 - output_axis, target_intermediate);
    return padded;
}

Tensor stack_tensors(const std::vector<Tensor>& parts, const std::vector<std::string>& names,
                     std::string_view target_name) {
    if (parts.empty()) {
        throw ShapeMismatch("stack", std::string(target_name), "nothing to stack");
    }
    if (names.size() != parts.size()) {
        throw std::logic_error("stack_tensors: one name per part required");
    }
    const Tensor& first = parts.front();
    if (first.Rank + 1 > MAX_TENSOR_DIM) {
        throw ShapeMismatch("stack", std::string(target_name),
                            fmt::format("stacking rank-{} tensors exceeds the maximum rank {}", first.Rank, MAX_TENSOR_DIM));
    }
    for (std::size_t i = 1; i < parts.size(); ++i) {
        if (parts[i].shape() != first.shape() || parts[i].DType != first.DType) {
            throw ShapeMismatch("stack", names[i],
                                fmt::format("{} {} diverges from `{}` {} {} while building `{}`",
                                            dtype_to_str(parts[i].DType), parts[i].shape_str(), names[0],
                                            dtype_to_str(first.DType), first.shape_str(), target_name));
        }
    }

    std::vector<long> shape = first.shape();
    shape.insert(shape.begin(), static_cast<long>(parts.size()));
    Tensor dst = Tensor::allocate(first.DType, shape);
    const std::size_t slice_bytes = first.bytes();
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (slice_bytes > 0) {
            std::memcpy(dst.Data + i * slice_bytes, parts[i].Data, slice_bytes);
        }
    }
    return dst;
}

} // namespace remora
