// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "models/deepseek_moe/weight_mapping.h"

namespace remora {

void DeepSeekMoESourceMapping::register_patterns() {
    using BK = BlockKind;
    using TR = TensorRole;

    // Non-block weights
    add_pattern("wte.weight", TensorKey::global(proj::EmbedTokens));
    add_pattern("ln_f.weight", TensorKey::global(proj::FinalNorm));
    add_pattern("lm_head.weight", TensorKey::global(proj::LMHead), true);

    // Layer norms
    add_layer_pattern("h.{layer}.ln_1.weight", TensorKey::layer(-1, BK::Norm, proj::InputNorm));
    add_layer_pattern("h.{layer}.ln_2.weight", TensorKey::layer(-1, BK::Norm, proj::PostAttentionNorm));

    // Latent attention, split projections
    add_layer_pattern("h.{layer}.attn.q_proj.weight", TensorKey::layer(-1, BK::Attention, proj::QAProj));
    add_layer_pattern("h.{layer}.attn.q_decompress.weight", TensorKey::layer(-1, BK::Attention, proj::QBProj));
    add_layer_pattern("h.{layer}.attn.kv_proj.weight", TensorKey::layer(-1, BK::Attention, proj::KvProj));
    add_layer_pattern("h.{layer}.attn.k_rope_proj.weight", TensorKey::layer(-1, BK::Attention, proj::KRopeProj));
    add_layer_pattern("h.{layer}.attn.kv_norm.weight", TensorKey::layer(-1, BK::Attention, proj::KvANorm));
    add_layer_pattern("h.{layer}.attn.k_decompress.weight", TensorKey::layer(-1, BK::Attention, proj::KDecompress));
    add_layer_pattern("h.{layer}.attn.v_decompress.weight", TensorKey::layer(-1, BK::Attention, proj::VDecompress));
    add_layer_pattern("h.{layer}.attn.o_proj.weight", TensorKey::layer(-1, BK::Attention, proj::OProj));
    add_layer_pattern("h.{layer}.attn.o_proj.bias", TensorKey::layer(-1, BK::Attention, proj::OProj, TR::Bias), true);

    // Router
    add_layer_pattern("h.{layer}.mlp.router.weight", TensorKey::layer(-1, BK::MoeRouter, proj::RouterGate));
    add_layer_pattern("h.{layer}.mlp.router.bias", TensorKey::layer(-1, BK::MoeRouter, proj::RouterGate, TR::Bias), true);

    // Routed experts, one tensor per expert
    for (const char* p : {proj::GateProj, proj::UpProj, proj::DownProj}) {
        const std::string base = std::string("h.{layer}.mlp.experts.{expert}.") + p;
        add_expert_pattern(base + ".weight", TensorKey::expert(-1, -1, p));
        add_expert_pattern(base + ".bias", TensorKey::expert(-1, -1, p, TR::Bias), true);
    }

    // Shared expert
    for (const char* p : {proj::GateProj, proj::UpProj, proj::DownProj}) {
        const std::string base = std::string("h.{layer}.mlp.shared_expert.") + p;
        add_layer_pattern(base + ".weight", TensorKey::layer(-1, BK::MoeShared, p));
        add_layer_pattern(base + ".bias", TensorKey::layer(-1, BK::MoeShared, p, TR::Bias), true);
    }
}

void MlxDeepSeekTargetMapping::register_patterns() {
    using BK = BlockKind;
    using TR = TensorRole;

    // Non-block weights
    add_pattern("model.embed_tokens.weight", TensorKey::global(proj::EmbedTokens));
    add_pattern("model.norm.weight", TensorKey::global(proj::FinalNorm));
    add_pattern("lm_head.weight", TensorKey::global(proj::LMHead));

    // Layer norms
    add_layer_pattern("model.layers.{layer}.input_layernorm.weight", TensorKey::layer(-1, BK::Norm, proj::InputNorm));
    add_layer_pattern("model.layers.{layer}.post_attention_layernorm.weight",
                      TensorKey::layer(-1, BK::Norm, proj::PostAttentionNorm));

    // Latent attention, merged projections
    add_layer_pattern("model.layers.{layer}.self_attn.q_a_proj.weight", TensorKey::layer(-1, BK::Attention, proj::QAProj));
    add_layer_pattern("model.layers.{layer}.self_attn.q_a_layernorm.weight",
                      TensorKey::layer(-1, BK::Attention, proj::QANorm));
    add_layer_pattern("model.layers.{layer}.self_attn.q_b_proj.weight", TensorKey::layer(-1, BK::Attention, proj::QBProj));
    add_layer_pattern("model.layers.{layer}.self_attn.kv_a_proj_with_mqa.weight",
                      TensorKey::layer(-1, BK::Attention, proj::KvAProj));
    add_layer_pattern("model.layers.{layer}.self_attn.kv_a_layernorm.weight",
                      TensorKey::layer(-1, BK::Attention, proj::KvANorm));
    add_layer_pattern("model.layers.{layer}.self_attn.kv_b_proj.weight", TensorKey::layer(-1, BK::Attention, proj::KvBProj));
    add_layer_pattern("model.layers.{layer}.self_attn.o_proj.weight", TensorKey::layer(-1, BK::Attention, proj::OProj));

    // Router and its routing bias
    add_layer_pattern("model.layers.{layer}.mlp.gate.weight", TensorKey::layer(-1, BK::MoeRouter, proj::RouterGate));
    add_layer_pattern("model.layers.{layer}.mlp.gate.e_score_correction_bias",
                      TensorKey::layer(-1, BK::MoeRouter, proj::ScoreCorrection, TR::Bias));

    // Stacked routed experts (SwitchGLU) and shared experts
    for (const char* p : {proj::GateProj, proj::UpProj, proj::DownProj}) {
        add_layer_pattern(std::string("model.layers.{layer}.mlp.switch_mlp.") + p + ".weight",
                          TensorKey::layer(-1, BK::MoeExperts, p));
        add_layer_pattern(std::string("model.layers.{layer}.mlp.shared_experts.") + p + ".weight",
                          TensorKey::layer(-1, BK::MoeShared, p));
    }
}

std::unique_ptr<BaseWeightMapping> create_source_mapping() {
    auto mapping = std::make_unique<DeepSeekMoESourceMapping>();
    mapping->register_patterns();
    return mapping;
}

std::unique_ptr<BaseWeightMapping> create_target_mapping() {
    auto mapping = std::make_unique<MlxDeepSeekTargetMapping>();
    mapping->register_patterns();
    return mapping;
}

} // namespace remora
