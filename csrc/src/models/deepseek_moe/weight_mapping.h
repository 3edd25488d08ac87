// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// DeepSeek MoE Weight Mapping - tensor name patterns of the training checkpoint
// (GPT-style `h.{layer}` prefix, split latent attention projections, one tensor per
// routed expert) and of the MLX runtime (`model.layers.{layer}`, merged latent
// projections, stacked `switch_mlp` experts).

#ifndef REMORA_SRC_MODELS_DEEPSEEK_MOE_WEIGHT_MAPPING_H
#define REMORA_SRC_MODELS_DEEPSEEK_MOE_WEIGHT_MAPPING_H

#include <memory>
#include <string_view>

#include "modules/weights/weight_mapping.h"

namespace remora {

// Projection names shared by both schemas.
namespace proj {
// global
inline constexpr const char* EmbedTokens = "embed_tokens";
inline constexpr const char* FinalNorm = "final_norm";
inline constexpr const char* LMHead = "lm_head";
// norm
inline constexpr const char* InputNorm = "input";
inline constexpr const char* PostAttentionNorm = "post_attention";
// attention
inline constexpr const char* QAProj = "q_a_proj";
inline constexpr const char* QANorm = "q_a_norm";
inline constexpr const char* QBProj = "q_b_proj";
inline constexpr const char* KvProj = "kv_proj";
inline constexpr const char* KRopeProj = "k_rope_proj";
inline constexpr const char* KvAProj = "kv_a_proj";
inline constexpr const char* KvANorm = "kv_a_norm";
inline constexpr const char* KDecompress = "k_decompress";
inline constexpr const char* VDecompress = "v_decompress";
inline constexpr const char* KvBProj = "kv_b_proj";
inline constexpr const char* OProj = "o_proj";
// router
inline constexpr const char* RouterGate = "gate";
inline constexpr const char* ScoreCorrection = "e_score_correction";
// experts (routed, stacked and shared)
inline constexpr const char* GateProj = "gate_proj";
inline constexpr const char* UpProj = "up_proj";
inline constexpr const char* DownProj = "down_proj";
} // namespace proj

/**
 * @brief Naming convention of the training checkpoint.
 *
 * Feed-forward biases are registered as optional: the converter drops them.
 */
class DeepSeekMoESourceMapping : public BaseWeightMapping {
public:
    void register_patterns() override;
    [[nodiscard]] std::string_view schema_name() const override { return "source"; }
};

/**
 * @brief Naming convention of the MLX DeepSeek-V3 runtime.
 *
 * Every registered entry is required in a converted checkpoint.
 */
class MlxDeepSeekTargetMapping : public BaseWeightMapping {
public:
    void register_patterns() override;
    [[nodiscard]] std::string_view schema_name() const override { return "target"; }
};

std::unique_ptr<BaseWeightMapping> create_source_mapping();
std::unique_ptr<BaseWeightMapping> create_target_mapping();

} // namespace remora

#endif // REMORA_SRC_MODELS_DEEPSEEK_MOE_WEIGHT_MAPPING_H
