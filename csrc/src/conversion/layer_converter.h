// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Layer Converter - produces the target tensors of one decoder layer (or of the
// global tensors) from a source checkpoint.
//
// Per layer, in order:
// 1. Norms and attention projections that only change name
// 2. Latent KV merge (kv_proj + k_rope_proj -> kv_a_proj)
// 3. Per-head interleave (k_decompress + v_decompress -> kv_b_proj)
// 4. Synthesized tensors the source does not carry (q_a norm scale, score correction bias)
// 5. Routed experts: width check, zero padding, stacking in index order
// 6. Shared expert and router
// 7. Bias stripping
//
// A layer depends on nothing but the source tensors of that layer, so layers can be
// converted concurrently; every layer writes only into its own LayerOutput.

#ifndef REMORA_SRC_CONVERSION_LAYER_CONVERTER_H
#define REMORA_SRC_CONVERSION_LAYER_CONVERTER_H

#include <set>
#include <string>

#include "conversion/checkpoint.h"
#include "conversion/conversion_report.h"

namespace remora {

struct ArchitectureConfig;
class BaseWeightMapping;
class ConversionLogger;

/**
 * @brief Everything a conversion stage may read. All members outlive the conversion.
 */
struct ConversionContext {
    const ArchitectureConfig& Config;
    const BaseWeightMapping& Source;
    const BaseWeightMapping& Target;
    ConversionLogger* Logger = nullptr;
    int Threads = 0;            ///< 0 = hardware concurrency
    bool Strict = false;        ///< unmapped source tensors are fatal
};

/**
 * @brief Result of converting one unit (a layer, or the global tensors).
 */
struct LayerOutput {
    CheckpointMapping Tensors;
    ConversionReport Report;
    std::set<std::string> Consumed;     ///< source names read by this unit
};

/**
 * @brief Convert embeddings, final norm and LM head.
 *
 * An absent source LM head is filled from the embedding when the config declares tied
 * embeddings.
 *
 * @throws remora::FormatError if a required source tensor is missing.
 */
LayerOutput convert_globals(const ConversionContext& ctx, const CheckpointMapping& source);

/**
 * @brief Convert all tensors of decoder layer @p layer.
 *
 * @throws remora::FormatError if a required source tensor is missing.
 * @throws remora::ShapeMismatch if tensors cannot be merged, interleaved or stacked.
 * @throws remora::ConfigMismatch if an expert is wider than the declared routed size.
 */
LayerOutput convert_layer(const ConversionContext& ctx, const CheckpointMapping& source, int layer);

/**
 * @brief Drop the source biases of @p layer (-1 for globals) the target does not declare.
 *
 * Biases the target declares are carried over under their target name. Every dropped bias
 * is reported: all-zero biases as info, others as precision warning with the L2 norm and
 * max-abs of the discarded values.
 */
void strip_biases(const ConversionContext& ctx, SchemaLookup& lookup, int layer, LayerOutput& out);

/**
 * @brief Report source tensors no stage consumed.
 *
 * Tensors with a layer or expert index beyond the declared counts are a configuration
 * error. Others are reported as precision warnings, or rejected in strict mode.
 *
 * @throws remora::ConfigMismatch as described above.
 */
void check_unconsumed(const ConversionContext& ctx, const CheckpointMapping& source,
                      const std::set<std::string>& consumed, ConversionReport& report);

/**
 * @brief Whether every tensor of @p source already carries a target schema name.
 *
 * Such a checkpoint is passed through unchanged.
 */
bool uses_target_names(const CheckpointMapping& source, const BaseWeightMapping& target);

} // namespace remora

#endif // REMORA_SRC_CONVERSION_LAYER_CONVERTER_H
