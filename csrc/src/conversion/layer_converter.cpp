// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "conversion/layer_converter.h"

#include <array>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "config/architecture_config.h"
#include "models/deepseek_moe/weight_mapping.h"
#include "modules/weights/weight_fusion.h"
#include "modules/weights/weight_mapping.h"
#include "utilities/errors.h"

namespace remora {

namespace {

using BK = BlockKind;

/**
 * @brief Insert @p tensor under the target name of @p key.
 *
 * @return The target name, or an empty string if the target does not declare @p key
 *         (the tensor is dropped and the drop reported).
 */
std::string emit(const ConversionContext& ctx, LayerOutput& out, const TensorKey& key, Tensor tensor,
                 std::string_view stage) {
    auto name = ctx.Target.name_for(key);
    if (!name) {
        out.Report.add_info(std::string(stage), key.to_string(), "not declared by the target schema, dropped");
        return {};
    }
    out.Tensors.insert(*name, std::move(tensor));
    return *name;
}

//! Report discarded values: info if all zero, precision warning otherwise.
void report_discarded(ConversionReport& report, std::string_view stage, const std::string& tensor,
                      const std::string& message, const Tensor& discarded) {
    const TensorMagnitude m = magnitude(discarded);
    if (m.AllZero) {
        report.add_info(std::string(stage), tensor, message + " (all values zero)");
    } else {
        report.add_precision_warning(std::string(stage), tensor, message, m.L2, m.MaxAbs);
    }
}

void rename(const ConversionContext& ctx, SchemaLookup& src, LayerOutput& out, const TensorKey& key) {
    emit(ctx, out, key, src.require(key, "rename"), "rename");
}

void merge_latent_kv(const ConversionContext& ctx, SchemaLookup& src, int layer, LayerOutput& out) {
    const ArchitectureConfig& cfg = ctx.Config;
    const int axis = cfg.output_axis();

    const TensorKey kv_key = TensorKey::layer(layer, BK::Attention, proj::KvProj);
    const TensorKey rope_key = TensorKey::layer(layer, BK::Attention, proj::KRopeProj);
    const Tensor& kv = src.require(kv_key, "merge");
    Tensor rope = src.require(rope_key, "merge");
    const std::string kv_name = src.name(kv_key);
    const std::string rope_name = src.name(rope_key);

    if (cfg.CollapseRopeHeads && rope.Rank == 2) {
        const long rows = rope.Sizes[axis];
        const long head = cfg.QkRopeHeadDim;
        if (rows > head && rows % head == 0) {
            report_discarded(out.Report, "merge", rope_name,
                             fmt::format("collapsed {} rotary key heads into one shared head, kept the first {} channels",
                                         rows / head, head),
                             narrow_axis(rope, axis, head, rows));
            rope = narrow_axis(rope, axis, 0, head);
        }
    }

    emit(ctx, out, TensorKey::layer(layer, BK::Attention, proj::KvAProj),
         merge_projections(kv, kv_name, rope, rope_name, axis), "merge");
}

void interleave_kv_decompress(const ConversionContext& ctx, SchemaLookup& src, int layer, LayerOutput& out) {
    const ArchitectureConfig& cfg = ctx.Config;
    const int axis = cfg.output_axis();

    const TensorKey k_key = TensorKey::layer(layer, BK::Attention, proj::KDecompress);
    const TensorKey v_key = TensorKey::layer(layer, BK::Attention, proj::VDecompress);
    const Tensor& k = src.require(k_key, "interleave");
    const Tensor& v = src.require(v_key, "interleave");
    const std::string k_name = src.name(k_key);

    const long k_head = cfg.source_k_head_dim();
    const long keep = cfg.QkNopeHeadDim;
    Tensor merged = interleave_heads(k, k_name, v, src.name(v_key), cfg.NumAttentionHeads, k_head, keep,
                                     cfg.VHeadDim, axis);

    if (k_head > keep) {
        // the rotary part of each key head is carried by kv_a_proj in the target layout
        std::vector<AxisSegment> dropped;
        for (long h = 0; h < cfg.NumAttentionHeads; ++h) {
            dropped.push_back(AxisSegment{&k, h * k_head + keep, (h + 1) * k_head});
        }
        report_discarded(out.Report, "interleave", k_name,
                         fmt::format("kept {} of {} key rows per head", keep, k_head),
                         gather_along_axis(dropped, axis));
    }

    emit(ctx, out, TensorKey::layer(layer, BK::Attention, proj::KvBProj), std::move(merged), "interleave");
}

/**
 * @brief Take @p key from the source if present, otherwise synthesize a constant FP32 vector.
 */
void rename_or_synthesize(const ConversionContext& ctx, SchemaLookup& src, LayerOutput& out, const TensorKey& key,
                          long length, float value, std::string_view what) {
    if (const Tensor* t = src.find(key)) {
        emit(ctx, out, key, *t, "rename");
        return;
    }
    if (!ctx.Target.declares(key)) {
        return;
    }
    const std::string name = emit(ctx, out, key, constant_tensor(ETensorDType::FP32, {length}, value), "synthesize");
    out.Report.add_info("synthesize", name, fmt::format("absent from the source, initialized {}", what));
}

void convert_routed_experts(const ConversionContext& ctx, SchemaLookup& src, int layer, LayerOutput& out) {
    const ArchitectureConfig& cfg = ctx.Config;
    const int axis = cfg.output_axis();
    const long target_width = cfg.unified_intermediate_size();
    const std::array<const char*, 3> roles = {proj::GateProj, proj::UpProj, proj::DownProj};

    std::array<std::vector<Tensor>, 3> parts;
    std::array<std::vector<std::string>, 3> names;
    for (auto& p : parts) p.reserve(cfg.NumRoutedExperts);

    for (int e = 0; e < cfg.NumRoutedExperts; ++e) {
        ExpertWeights expert;
        expert.Gate = src.require(TensorKey::expert(layer, e, proj::GateProj), "stack");
        expert.Up = src.require(TensorKey::expert(layer, e, proj::UpProj), "stack");
        expert.Down = src.require(TensorKey::expert(layer, e, proj::DownProj), "stack");
        expert.GateName = src.name(TensorKey::expert(layer, e, proj::GateProj));
        expert.UpName = src.name(TensorKey::expert(layer, e, proj::UpProj));
        expert.DownName = src.name(TensorKey::expert(layer, e, proj::DownProj));

        const long width = expert_intermediate_size(expert, axis);
        if (width != cfg.RoutedIntermediateSize) {
            throw ConfigMismatch("pad", expert.GateName,
                                 fmt::format("expert intermediate size {} vs declared routed_intermediate_size {}",
                                             width, cfg.RoutedIntermediateSize));
        }

        ExpertWeights padded = pad_expert(expert, target_width, axis);
        parts[0].push_back(std::move(padded.Gate));
        parts[1].push_back(std::move(padded.Up));
        parts[2].push_back(std::move(padded.Down));
        names[0].push_back(std::move(expert.GateName));
        names[1].push_back(std::move(expert.UpName));
        names[2].push_back(std::move(expert.DownName));
    }

    for (std::size_t r = 0; r < roles.size(); ++r) {
        const TensorKey key = TensorKey::layer(layer, BK::MoeExperts, roles[r]);
        const std::string target_name = ctx.Target.name_for(key).value_or(key.to_string());
        Tensor stacked = stack_tensors(parts[r], names[r], target_name);
        parts[r].clear();
        if (stacked.Sizes[0] != cfg.NumRoutedExperts) {
            throw ConfigMismatch("stack", target_name,
                                 fmt::format("stacked {} experts vs declared n_routed_experts {}",
                                             stacked.Sizes[0], cfg.NumRoutedExperts));
        }
        const std::string name = emit(ctx, out, key, std::move(stacked), "stack");
        if (!name.empty() && cfg.needs_expert_padding()) {
            out.Report.add_info("pad", name, fmt::format("{} experts zero-padded from intermediate size {} to {}",
                                                         cfg.NumRoutedExperts, cfg.RoutedIntermediateSize,
                                                         target_width));
        }
    }
}

} // namespace

LayerOutput convert_globals(const ConversionContext& ctx, const CheckpointMapping& source) {
    LayerOutput out;
    SchemaLookup src(source, ctx.Source);

    const TensorKey embed_key = TensorKey::global(proj::EmbedTokens);
    const Tensor& embed = src.require(embed_key, "rename");
    emit(ctx, out, embed_key, embed, "rename");
    rename(ctx, src, out, TensorKey::global(proj::FinalNorm));

    const TensorKey head_key = TensorKey::global(proj::LMHead);
    if (const Tensor* head = src.find(head_key)) {
        emit(ctx, out, head_key, *head, "rename");
    } else if (ctx.Config.TiedWordEmbeddings) {
        Tensor head_weight = ctx.Config.Layout == WeightLayout::OutIn ? embed : transpose_matrix(embed);
        const std::string name = emit(ctx, out, head_key, std::move(head_weight), "tie");
        out.Report.add_info("tie", name, "copied from the tied token embedding");
    } else if (ctx.Target.declares(head_key)) {
        throw FormatError("rename", src.name(head_key),
                          "source has no LM head and the config does not declare tied embeddings");
    }

    strip_biases(ctx, src, -1, out);
    out.Consumed = src.consumed();
    return out;
}

LayerOutput convert_layer(const ConversionContext& ctx, const CheckpointMapping& source, int layer) {
    const ArchitectureConfig& cfg = ctx.Config;
    LayerOutput out;
    SchemaLookup src(source, ctx.Source);

    rename(ctx, src, out, TensorKey::layer(layer, BK::Norm, proj::InputNorm));
    rename(ctx, src, out, TensorKey::layer(layer, BK::Norm, proj::PostAttentionNorm));

    rename(ctx, src, out, TensorKey::layer(layer, BK::Attention, proj::QAProj));
    rename(ctx, src, out, TensorKey::layer(layer, BK::Attention, proj::QBProj));
    rename(ctx, src, out, TensorKey::layer(layer, BK::Attention, proj::KvANorm));
    rename(ctx, src, out, TensorKey::layer(layer, BK::Attention, proj::OProj));
    rename_or_synthesize(ctx, src, out, TensorKey::layer(layer, BK::Attention, proj::QANorm),
                         cfg.QLoraRank, 1.0f, "to ones");
    merge_latent_kv(ctx, src, layer, out);
    interleave_kv_decompress(ctx, src, layer, out);

    rename(ctx, src, out, TensorKey::layer(layer, BK::MoeRouter, proj::RouterGate));
    rename_or_synthesize(ctx, src, out,
                         TensorKey::layer(layer, BK::MoeRouter, proj::ScoreCorrection, TensorRole::Bias),
                         cfg.NumRoutedExperts, 0.0f, "to zeros");

    convert_routed_experts(ctx, src, layer, out);

    for (const char* p : {proj::GateProj, proj::UpProj, proj::DownProj}) {
        rename(ctx, src, out, TensorKey::layer(layer, BK::MoeShared, p));
    }

    strip_biases(ctx, src, layer, out);
    out.Consumed = src.consumed();
    return out;
}

void strip_biases(const ConversionContext& ctx, SchemaLookup& lookup, int layer, LayerOutput& out) {
    for (const auto& pattern : ctx.Source.patterns()) {
        const TensorKey& schema_key = pattern.Key;
        if (schema_key.Role != TensorRole::Bias) continue;
        if (is_per_layer(schema_key.Block) != (layer >= 0)) continue;

        const int experts = is_per_expert(schema_key.Block) ? ctx.Config.NumRoutedExperts : 1;
        for (int e = 0; e < experts; ++e) {
            const TensorKey key = is_per_expert(schema_key.Block) ? schema_key.instantiate(layer, e)
                                                                  : schema_key.instantiate(layer);
            const Tensor* bias = lookup.find(key);
            if (!bias) continue;

            auto target_name = ctx.Target.name_for(key);
            if (target_name && out.Tensors.contains(*target_name)) {
                continue;   // already produced by an earlier stage
            }
            if (target_name) {
                out.Tensors.insert(*target_name, *bias);
                continue;
            }
            report_discarded(out.Report, "strip", lookup.name(key),
                             "bias not present in the target architecture, dropped", *bias);
        }
    }
}

void check_unconsumed(const ConversionContext& ctx, const CheckpointMapping& source,
                      const std::set<std::string>& consumed, ConversionReport& report) {
    const ArchitectureConfig& cfg = ctx.Config;
    for (const auto& [name, tensor] : source.tensors()) {
        if (consumed.contains(name)) continue;

        auto key = ctx.Source.match(name);
        if (key && key->Layer >= cfg.NumLayers) {
            throw ConfigMismatch("convert", name, fmt::format("layer index {} vs declared num_hidden_layers {}",
                                                              key->Layer, cfg.NumLayers));
        }
        if (key && is_per_expert(key->Block) && key->Expert >= cfg.NumRoutedExperts) {
            throw ConfigMismatch("convert", name, fmt::format("expert index {} vs declared n_routed_experts {}",
                                                              key->Expert, cfg.NumRoutedExperts));
        }
        if (ctx.Strict) {
            throw ConfigMismatch("convert", name, "source tensor is not used by any conversion stage");
        }
        report_discarded(report, "convert", name, "source tensor is not used by any conversion stage, dropped",
                         tensor);
    }
}

bool uses_target_names(const CheckpointMapping& source, const BaseWeightMapping& target) {
    if (source.empty()) return false;
    for (const auto& [name, tensor] : source.tensors()) {
        if (!target.match(name)) return false;
    }
    return true;
}

} // namespace remora
