// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "conversion/verification.h"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstring>
#include <fstream>
#include <random>

#include <fmt/core.h>

#include "config/architecture_config.h"
#include "models/deepseek_moe/weight_mapping.h"
#include "modules/weights/weight_fusion.h"
#include "modules/weights/weight_mapping.h"
#include "modules/weights/weight_schema.h"
#include "utilities/errors.h"

namespace remora {

std::string_view verification_status_name(VerificationStatus status) {
    switch (status) {
    case VerificationStatus::Passed: return "passed";
    case VerificationStatus::Failed: return "failed";
    case VerificationStatus::Inconclusive: return "inconclusive";
    }
    return "unknown";
}

namespace {

using BK = BlockKind;

constexpr std::array<const char*, 3> kExpertRoles = {proj::GateProj, proj::UpProj, proj::DownProj};

class Deadline {
public:
    explicit Deadline(std::optional<std::chrono::milliseconds> timeout)
        : mEnabled(timeout.has_value()),
          mEnd(std::chrono::steady_clock::now() + timeout.value_or(std::chrono::milliseconds{0})) {}

    [[nodiscard]] bool expired() const {
        return mEnabled && std::chrono::steady_clock::now() >= mEnd;
    }

private:
    bool mEnabled;
    std::chrono::steady_clock::time_point mEnd;
};

//! Source key a target tensor is derived from; equal to @p key for plain renames.
TensorKey origin_key(const TensorKey& key) {
    if (key.Block == BK::Attention && key.Projection == proj::KvAProj) {
        return TensorKey::layer(key.Layer, BK::Attention, proj::KvProj, key.Role);
    }
    if (key.Block == BK::Attention && key.Projection == proj::KvBProj) {
        return TensorKey::layer(key.Layer, BK::Attention, proj::KDecompress, key.Role);
    }
    if (key.Block == BK::MoeExperts) {
        return TensorKey::expert(key.Layer, 0, key.Projection, key.Role);
    }
    return key;
}

bool is_synthesized(const TensorKey& key) {
    return (key.Block == BK::Attention && key.Projection == proj::QANorm) ||
           (key.Block == BK::MoeRouter && key.Projection == proj::ScoreCorrection);
}

const Tensor* find_source(const ConversionContext& ctx, const CheckpointMapping& source, const TensorKey& key) {
    auto name = ctx.Source.name_for(key);
    return name ? source.find(*name) : nullptr;
}

//! Slice @p index of a stacked tensor, without the leading axis. Shares the buffer.
Tensor expert_view(const Tensor& stacked, long index) {
    Tensor view = slice(stacked, 0, index, index + 1);
    for (int i = 1; i < view.Rank; ++i) view.Sizes[i - 1] = view.Sizes[i];
    view.Sizes[view.Rank - 1] = 0;
    view.Rank -= 1;
    return view;
}

bool same_bytes(const Tensor& a, const Tensor& b) {
    return a.DType == b.DType && a.bytes() == b.bytes() &&
           (a.bytes() == 0 || std::memcmp(a.Data, b.Data, a.bytes()) == 0);
}

std::vector<float> project(const Tensor& w, const std::vector<float>& weights, const float* x, int output_axis) {
    const long out = w.Sizes[output_axis];
    const long in = w.Sizes[1 - output_axis];
    std::vector<float> y(out, 0.0f);
    for (long o = 0; o < out; ++o) {
        double acc = 0.0;
        for (long i = 0; i < in; ++i) {
            const float wv = output_axis == 0 ? weights[o * in + i] : weights[i * out + o];
            acc += static_cast<double>(wv) * x[i];
        }
        y[o] = static_cast<float>(acc);
    }
    return y;
}

struct SourceExpert {
    ExpertWeights Weights;
    bool Complete = false;
};

SourceExpert load_source_expert(const ConversionContext& ctx, const CheckpointMapping& source, int layer, int expert) {
    SourceExpert result;
    const Tensor* gate = find_source(ctx, source, TensorKey::expert(layer, expert, proj::GateProj));
    const Tensor* up = find_source(ctx, source, TensorKey::expert(layer, expert, proj::UpProj));
    const Tensor* down = find_source(ctx, source, TensorKey::expert(layer, expert, proj::DownProj));
    if (!gate || !up || !down) return result;
    result.Weights.Gate = *gate;
    result.Weights.Up = *up;
    result.Weights.Down = *down;
    result.Weights.GateName = ctx.Source.require_name(TensorKey::expert(layer, expert, proj::GateProj));
    result.Weights.UpName = ctx.Source.require_name(TensorKey::expert(layer, expert, proj::UpProj));
    result.Weights.DownName = ctx.Source.require_name(TensorKey::expert(layer, expert, proj::DownProj));
    result.Complete = true;
    return result;
}

const Tensor* find_stacked(const ConversionContext& ctx, const CheckpointMapping& written, int layer, const char* role) {
    auto name = ctx.Target.name_for(TensorKey::layer(layer, BK::MoeExperts, role));
    if (!name) return nullptr;
    const Tensor* t = written.find(*name);
    if (!t || t->Rank != 3 || t->Sizes[0] != ctx.Config.NumRoutedExperts) return nullptr;
    return t;
}

void check_dtypes_and_renames(const ConversionContext& ctx, const CheckpointMapping& source,
                              const CheckpointMapping& written, const CheckpointSchema& schema,
                              std::vector<std::string>& failures) {
    const Tensor* embed = find_source(ctx, source, TensorKey::global(proj::EmbedTokens));
    for (const auto& spec : schema.tensors()) {
        const Tensor* out = written.find(spec.name);
        if (!out) continue;

        const TensorKey origin = origin_key(spec.key);
        const Tensor* src = find_source(ctx, source, origin);

        std::optional<ETensorDType> expected;
        if (src) {
            expected = src->DType;
        } else if (is_synthesized(spec.key)) {
            expected = ETensorDType::FP32;
        } else if (spec.key.Block == BK::Global && spec.key.Projection == proj::LMHead && embed) {
            expected = embed->DType;
        }
        if (expected && *expected != out->DType) {
            failures.push_back(fmt::format("`{}`: dtype {} vs expected {}", spec.name, dtype_to_str(out->DType),
                                           dtype_to_str(*expected)));
            continue;
        }

        if (src && origin == spec.key && !equal_bytes(*src, *out)) {
            failures.push_back(fmt::format("`{}`: differs from source tensor `{}`", spec.name,
                                           ctx.Source.require_name(origin)));
        }
    }
}

void check_expert_layer(const ConversionContext& ctx, const CheckpointMapping& source,
                        const CheckpointMapping& written, int layer, std::vector<std::string>& failures) {
    const ArchitectureConfig& cfg = ctx.Config;
    const int axis = cfg.output_axis();
    const long routed = cfg.RoutedIntermediateSize;
    const long unified = cfg.unified_intermediate_size();

    std::array<const Tensor*, 3> stacked{};
    for (std::size_t r = 0; r < kExpertRoles.size(); ++r) {
        stacked[r] = find_stacked(ctx, written, layer, kExpertRoles[r]);
    }

    for (int e = 0; e < cfg.NumRoutedExperts; ++e) {
        SourceExpert expert = load_source_expert(ctx, source, layer, e);
        if (!expert.Complete) {
            failures.push_back(fmt::format("layer {} expert {}: source weights incomplete", layer, e));
            continue;
        }
        ExpertWeights padded;
        try {
            padded = pad_expert(expert.Weights, unified, axis);
        } catch (const ConversionError& err) {
            failures.push_back(err.what());
            continue;
        }
        const std::array<const Tensor*, 3> expected = {&padded.Gate, &padded.Up, &padded.Down};

        for (std::size_t r = 0; r < kExpertRoles.size(); ++r) {
            if (!stacked[r]) continue;
            const Tensor view = expert_view(*stacked[r], e);
            if (!same_bytes(view, *expected[r])) {
                failures.push_back(fmt::format("layer {} {}: slice {} does not equal padded source expert {}",
                                               layer, kExpertRoles[r], e, e));
                continue;
            }
            if (unified > routed) {
                const int pad_axis = r == 2 ? 1 - axis : axis;
                if (!magnitude(narrow_axis(view, pad_axis, routed, unified)).AllZero) {
                    failures.push_back(fmt::format("layer {} {}: padded region of expert {} is not zero",
                                                   layer, kExpertRoles[r], e));
                }
            }
        }
    }
}

void forward_check_layer(const ConversionContext& ctx, const CheckpointMapping& source,
                         const CheckpointMapping& written, int layer, const VerificationOptions& options,
                         std::vector<std::string>& failures) {
    const ArchitectureConfig& cfg = ctx.Config;
    const int axis = cfg.output_axis();
    const int tokens = std::max(1, options.ForwardTokens);

    std::array<const Tensor*, 3> stacked{};
    for (std::size_t r = 0; r < kExpertRoles.size(); ++r) {
        stacked[r] = find_stacked(ctx, written, layer, kExpertRoles[r]);
        if (!stacked[r] || !is_float_dtype(stacked[r]->DType)) return;
    }

    for (int e = 0; e < cfg.NumRoutedExperts; ++e) {
        SourceExpert expert = load_source_expert(ctx, source, layer, e);
        if (!expert.Complete || !is_float_dtype(expert.Weights.Gate.DType)) continue;

        std::mt19937 gen(options.Seed + static_cast<std::uint32_t>(layer) * 7919u + static_cast<std::uint32_t>(e));
        std::normal_distribution<float> dist(0.0f, 1.0f);
        std::vector<float> inputs(static_cast<std::size_t>(tokens) * cfg.HiddenSize);
        for (auto& v : inputs) v = dist(gen);

        const std::vector<float> reference = swiglu_forward(expert.Weights.Gate, expert.Weights.Up,
                                                            expert.Weights.Down, inputs, tokens, axis);
        const std::vector<float> padded = swiglu_forward(expert_view(*stacked[0], e), expert_view(*stacked[1], e),
                                                         expert_view(*stacked[2], e), inputs, tokens, axis);

        float max_ref = 0.0f;
        float max_diff = 0.0f;
        for (std::size_t i = 0; i < reference.size(); ++i) {
            max_ref = std::max(max_ref, std::abs(reference[i]));
            max_diff = std::max(max_diff, std::abs(reference[i] - padded[i]));
        }
        if (!(max_diff <= options.Tolerance * std::max(1.0f, max_ref))) {
            failures.push_back(fmt::format("layer {} expert {}: padded forward output deviates by {:.6g} (reference max {:.6g})",
                                           layer, e, max_diff, max_ref));
        }
    }
}

void check_reference_hashes(const std::string& file_name, const CheckpointMapping& written,
                            std::vector<std::string>& failures) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        failures.push_back(fmt::format("cannot open reference hashes `{}`", file_name));
        return;
    }
    nlohmann::json hashes = nlohmann::json::parse(file, nullptr, false);
    if (hashes.is_discarded() || !hashes.is_object()) {
        failures.push_back(fmt::format("reference hashes `{}` are not a JSON object", file_name));
        return;
    }
    for (const auto& [name, value] : hashes.items()) {
        const Tensor* t = written.find(name);
        if (!t) {
            failures.push_back(fmt::format("`{}`: listed in reference hashes but missing", name));
            continue;
        }
        if (!value.is_string()) {
            failures.push_back(fmt::format("`{}`: reference hash is not a string", name));
            continue;
        }
        const std::string actual = to_hex(fnv1a_64(t->byte_span()));
        if (actual != value.get<std::string>()) {
            failures.push_back(fmt::format("`{}`: hash {} vs reference {}", name, actual, value.get<std::string>()));
        }
    }
}

} // namespace

std::vector<float> swiglu_forward(const Tensor& gate, const Tensor& up, const Tensor& down,
                                  const std::vector<float>& inputs, int tokens, int output_axis) {
    const std::vector<float> gate_w = to_float_vector(gate);
    const std::vector<float> up_w = to_float_vector(up);
    const std::vector<float> down_w = to_float_vector(down);
    const long hidden = gate.Sizes[1 - output_axis];

    std::vector<float> result;
    result.reserve(static_cast<std::size_t>(tokens) * down.Sizes[output_axis]);
    for (int t = 0; t < tokens; ++t) {
        const float* x = inputs.data() + static_cast<std::size_t>(t) * hidden;
        std::vector<float> g = project(gate, gate_w, x, output_axis);
        const std::vector<float> u = project(up, up_w, x, output_axis);
        for (std::size_t i = 0; i < g.size(); ++i) {
            const float silu = g[i] / (1.0f + std::exp(-g[i]));
            g[i] = silu * u[i];
        }
        const std::vector<float> y = project(down, down_w, g.data(), output_axis);
        result.insert(result.end(), y.begin(), y.end());
    }
    return result;
}

nlohmann::json compute_tensor_hashes(const CheckpointMapping& checkpoint) {
    nlohmann::json result = nlohmann::json::object();
    for (const auto& [name, tensor] : checkpoint.tensors()) {
        result[name] = to_hex(fnv1a_64(tensor.byte_span()));
    }
    return result;
}

VerificationResult verify_checkpoint(const std::string& file_name, const ConversionContext& ctx,
                                     const CheckpointMapping& source, bool passthrough,
                                     const VerificationOptions& options) {
    const Deadline deadline(options.Timeout);
    VerificationResult result;

    auto out_of_time = [&](std::string_view next) {
        if (!deadline.expired()) return false;
        result.InconclusiveReason = fmt::format("deadline expired before {}", next);
        return true;
    };
    auto finish = [&]() {
        if (!result.Failures.empty()) {
            result.Status = VerificationStatus::Failed;
        } else if (!result.InconclusiveReason.empty()) {
            result.Status = VerificationStatus::Inconclusive;
        } else {
            result.Status = VerificationStatus::Passed;
        }
        return result;
    };

    if (out_of_time("reading the output")) return finish();
    CheckpointMapping written;
    try {
        written = read_checkpoint(file_name);
    } catch (const ConversionError& e) {
        result.Failures.push_back(e.what());
        return finish();
    }
    ++result.ChecksRun;

    if (out_of_time("the schema check")) return finish();
    CheckpointSchema schema;
    try {
        schema = describe_target_schema(ctx.Config, ctx.Target);
    } catch (const ConversionError& e) {
        result.Failures.push_back(e.what());
        return finish();
    }
    for (const auto& error : check_against_schema(written.tensors(), schema).errors) {
        result.Failures.push_back(fmt::format("`{}`: {}", error.tensor, error.message));
    }
    ++result.ChecksRun;

    if (passthrough) {
        if (out_of_time("the pass-through comparison")) return finish();
        for (const auto& [name, tensor] : written.tensors()) {
            const Tensor* src = source.find(name);
            if (!src || !equal_bytes(*src, tensor)) {
                result.Failures.push_back(fmt::format("`{}`: differs from the source tensor of the same name", name));
            }
        }
        ++result.ChecksRun;
    } else {
        if (out_of_time("the dtype check")) return finish();
        check_dtypes_and_renames(ctx, source, written, schema, result.Failures);
        ++result.ChecksRun;

        for (int layer = 0; layer < ctx.Config.NumLayers; ++layer) {
            if (out_of_time(fmt::format("the expert check of layer {}", layer))) return finish();
            check_expert_layer(ctx, source, written, layer, result.Failures);
            ++result.ChecksRun;
        }
    }

    if (!options.ReferenceHashesFile.empty()) {
        if (out_of_time("the reference hash check")) return finish();
        check_reference_hashes(options.ReferenceHashesFile, written, result.Failures);
        ++result.ChecksRun;
    }

    if (options.ForwardCheck && !passthrough) {
        for (int layer = 0; layer < ctx.Config.NumLayers; ++layer) {
            if (out_of_time(fmt::format("the forward check of layer {}", layer))) return finish();
            forward_check_layer(ctx, source, written, layer, options, result.Failures);
            ++result.ChecksRun;
        }
    }

    return finish();
}

} // namespace remora
