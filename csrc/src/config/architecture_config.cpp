// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "config/architecture_config.h"

#include <cstdint>
#include <algorithm>
#include <fstream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include <fmt/core.h>

#include "utilities/errors.h"
#include "utilities/utils.h"

namespace remora {

namespace {

// Keys interpreted by parse_architecture_config(); everything else is passed through.
const char* const kKnownKeys[] = {
    "num_hidden_layers", "hidden_size", "num_attention_heads", "vocab_size", "max_position_embeddings",
    "n_routed_experts", "num_experts_per_tok", "n_shared_experts", "routed_intermediate_size",
    "moe_intermediate_size", "shared_intermediate_size", "q_lora_rank", "kv_lora_rank",
    "qk_rope_head_dim", "qk_nope_head_dim", "v_head_dim", "source_k_head_dim", "rms_norm_eps",
    "rope_theta", "weight_layout", "tie_word_embeddings", "collapse_rope_heads",
};

// Values that do not fit an int throw std::out_of_range.
std::optional<int> as_int(const nlohmann::json& value) {
    if (value.is_number_unsigned()) return narrow<int>(value.get<std::uint64_t>());
    if (value.is_number_integer()) return narrow<int>(value.get<std::int64_t>());
    if (value.is_number_float()) {
        const double v = value.get<double>();
        if (!(v >= std::numeric_limits<int>::min() && v <= std::numeric_limits<int>::max())) {
            throw std::out_of_range("Out of range in integer conversion");
        }
        return static_cast<int>(v);
    }
    if (value.is_string()) {
        try {
            return std::stoi(value.get<std::string>());
        } catch (const std::invalid_argument&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<float> as_float(const nlohmann::json& value) {
    if (value.is_number_float() || value.is_number_integer() || value.is_number_unsigned()) {
        return static_cast<float>(value.get<double>());
    }
    if (value.is_string()) {
        try {
            return std::stof(value.get<std::string>());
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

std::optional<bool> as_bool(const nlohmann::json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number_integer()) return value.get<int>() != 0;
    if (value.is_string()) {
        const std::string v = value.get<std::string>();
        if (iequals(v, "true") || v == "1") return true;
        if (iequals(v, "false") || v == "0") return false;
    }
    return std::nullopt;
}

template<typename T>
std::optional<T> get_opt(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;
    std::optional<T> result;
    if constexpr (std::is_same_v<T, int>) {
        try {
            result = as_int(*it);
        } catch (const std::out_of_range&) {
            throw ConfigMismatch("config", key, fmt::format("value {} does not fit a 32-bit integer", it->dump()));
        }
    } else if constexpr (std::is_same_v<T, float>) {
        result = as_float(*it);
    } else if constexpr (std::is_same_v<T, bool>) {
        result = as_bool(*it);
    } else if constexpr (std::is_same_v<T, std::string>) {
        if (it->is_string()) result = it->get<std::string>();
    }
    // present but unusable is an error, not a silent default
    if (!result) {
        throw ConfigMismatch("config", key, fmt::format("cannot interpret value {}", it->dump()));
    }
    return result;
}

int require_int(const nlohmann::json& obj, const char* key, const std::string& origin) {
    if (auto v = get_opt<int>(obj, key)) return *v;
    throw ConfigMismatch("config", key, fmt::format("required key missing from {}", origin));
}

void require_positive(int value, const char* key) {
    if (value <= 0) {
        throw ConfigMismatch("config", key, fmt::format("must be positive, got {}", value));
    }
}

// Derived tensor extents are ints; their factors must not overflow.
void require_int_extent(std::int64_t value, const char* key, const char* what) {
    if (value > std::numeric_limits<int>::max()) {
        throw ConfigMismatch("config", key, fmt::format("{} of {} overflows a 32-bit integer", what, value));
    }
}

}  // namespace

std::string_view weight_layout_name(WeightLayout layout) {
    switch (layout) {
    case WeightLayout::OutIn: return "out_in";
    case WeightLayout::InOut: return "in_out";
    }
    throw std::logic_error("unknown WeightLayout");
}

void ArchitectureConfig::validate() const {
    require_positive(NumLayers, "num_hidden_layers");
    require_positive(HiddenSize, "hidden_size");
    require_positive(NumAttentionHeads, "num_attention_heads");
    require_positive(VocabSize, "vocab_size");
    require_positive(MaxPositionEmbeddings, "max_position_embeddings");
    require_positive(NumRoutedExperts, "n_routed_experts");
    require_positive(NumExpertsPerTok, "num_experts_per_tok");
    require_positive(NumSharedExperts, "n_shared_experts");
    require_positive(RoutedIntermediateSize, "routed_intermediate_size");
    require_positive(SharedIntermediateSize, "shared_intermediate_size");
    require_positive(QLoraRank, "q_lora_rank");
    require_positive(KvLoraRank, "kv_lora_rank");
    require_positive(QkRopeHeadDim, "qk_rope_head_dim");
    require_positive(QkNopeHeadDim, "qk_nope_head_dim");
    require_positive(VHeadDim, "v_head_dim");

    const std::int64_t heads = NumAttentionHeads;
    require_int_extent(std::int64_t{QkNopeHeadDim} + QkRopeHeadDim, "qk_rope_head_dim", "query head dimension");
    require_int_extent(heads * (std::int64_t{QkNopeHeadDim} + QkRopeHeadDim), "num_attention_heads",
                       "query projection rows");
    require_int_extent(std::int64_t{KvLoraRank} + QkRopeHeadDim, "kv_lora_rank", "kv_a projection rows");
    require_int_extent(heads * (std::int64_t{QkNopeHeadDim} + VHeadDim), "num_attention_heads",
                       "kv_b projection rows");
    require_int_extent(heads * std::max<std::int64_t>(SourceKHeadDim, 0), "source_k_head_dim",
                       "key decompression rows");
    require_int_extent(std::int64_t{SharedIntermediateSize} * NumSharedExperts, "n_shared_experts",
                       "shared expert rows");

    if (NumExpertsPerTok > NumRoutedExperts) {
        throw ConfigMismatch("config", "num_experts_per_tok",
                             fmt::format("{} experts per token but only {} routed experts",
                                         NumExpertsPerTok, NumRoutedExperts));
    }
    // padding is always an enlargement
    if (RoutedIntermediateSize > SharedIntermediateSize) {
        throw ConfigMismatch("config", "routed_intermediate_size",
                             fmt::format("routed intermediate size {} exceeds shared intermediate size {}",
                                         RoutedIntermediateSize, SharedIntermediateSize));
    }
    if (SourceKHeadDim < 0) {
        throw ConfigMismatch("config", "source_k_head_dim", fmt::format("must not be negative, got {}", SourceKHeadDim));
    }
    if (source_k_head_dim() < QkNopeHeadDim) {
        throw ConfigMismatch("config", "source_k_head_dim",
                             fmt::format("{} rows per head cannot provide {} non-rotary key rows",
                                         source_k_head_dim(), QkNopeHeadDim));
    }
}

ArchitectureConfig parse_architecture_config(const nlohmann::json& config_json, const std::string& origin) {
    if (!config_json.is_object()) {
        throw ConfigMismatch("config", "", fmt::format("{} does not contain a JSON object", origin));
    }

    ArchitectureConfig cfg;

    // Dimensions
    cfg.NumLayers = require_int(config_json, "num_hidden_layers", origin);
    cfg.HiddenSize = require_int(config_json, "hidden_size", origin);
    cfg.NumAttentionHeads = require_int(config_json, "num_attention_heads", origin);
    cfg.VocabSize = require_int(config_json, "vocab_size", origin);
    cfg.MaxPositionEmbeddings = require_int(config_json, "max_position_embeddings", origin);

    // MoE
    cfg.NumRoutedExperts = require_int(config_json, "n_routed_experts", origin);
    cfg.NumExpertsPerTok = require_int(config_json, "num_experts_per_tok", origin);
    if (auto v = get_opt<int>(config_json, "n_shared_experts")) cfg.NumSharedExperts = *v;
    if (auto v = get_opt<int>(config_json, "routed_intermediate_size")) {
        cfg.RoutedIntermediateSize = *v;
    } else if (auto alias = get_opt<int>(config_json, "moe_intermediate_size")) {
        cfg.RoutedIntermediateSize = *alias;
    } else {
        throw ConfigMismatch("config", "routed_intermediate_size",
                             fmt::format("required key missing from {} (alias: moe_intermediate_size)", origin));
    }
    cfg.SharedIntermediateSize = require_int(config_json, "shared_intermediate_size", origin);

    // Latent attention
    cfg.QLoraRank = require_int(config_json, "q_lora_rank", origin);
    cfg.KvLoraRank = require_int(config_json, "kv_lora_rank", origin);
    cfg.QkRopeHeadDim = require_int(config_json, "qk_rope_head_dim", origin);
    cfg.QkNopeHeadDim = require_int(config_json, "qk_nope_head_dim", origin);
    cfg.VHeadDim = require_int(config_json, "v_head_dim", origin);
    if (auto v = get_opt<int>(config_json, "source_k_head_dim")) cfg.SourceKHeadDim = *v;

    if (auto v = get_opt<float>(config_json, "rms_norm_eps")) cfg.RmsNormEps = *v;
    if (auto v = get_opt<float>(config_json, "rope_theta")) cfg.RopeTheta = *v;

    if (auto layout = get_opt<std::string>(config_json, "weight_layout")) {
        if (iequals(*layout, "out_in")) {
            cfg.Layout = WeightLayout::OutIn;
        } else if (iequals(*layout, "in_out")) {
            cfg.Layout = WeightLayout::InOut;
        } else {
            throw ConfigMismatch("config", "weight_layout",
                                 fmt::format("expected \"out_in\" or \"in_out\", got \"{}\"", *layout));
        }
    }
    if (auto v = get_opt<bool>(config_json, "tie_word_embeddings")) cfg.TiedWordEmbeddings = *v;
    if (auto v = get_opt<bool>(config_json, "collapse_rope_heads")) cfg.CollapseRopeHeads = *v;

    for (const auto& [key, value] : config_json.items()) {
        bool known = false;
        for (const char* k : kKnownKeys) {
            if (key == k) {
                known = true;
                break;
            }
        }
        if (!known) cfg.PassThrough[key] = value;
    }

    cfg.validate();
    return cfg;
}

ArchitectureConfig load_architecture_config(const std::string& file_name) {
    std::ifstream file(file_name);
    if (!file.is_open()) {
        throw IOError("config", file_name, "could not open config file");
    }

    nlohmann::json config_json;
    try {
        config_json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigMismatch("config", "", fmt::format("malformed JSON in {}: {}", file_name, e.what()));
    }
    return parse_architecture_config(config_json, file_name);
}

nlohmann::json runtime_config_json(const ArchitectureConfig& config, ETensorDType dtype) {
    nlohmann::json config_json = config.PassThrough;
    if (!config_json.contains("model_type")) {
        config_json["model_type"] = "deepseek_v3";
    }
    if (!config_json.contains("architectures")) {
        config_json["architectures"] = {"DeepseekV3ForCausalLM"};
    }
    config_json["vocab_size"] = config.VocabSize;
    config_json["hidden_size"] = config.HiddenSize;
    config_json["intermediate_size"] = config.SharedIntermediateSize;
    config_json["moe_intermediate_size"] = config.unified_intermediate_size();
    // converted routed experts already carry the unified size
    config_json["routed_intermediate_size"] = config.unified_intermediate_size();
    config_json["shared_intermediate_size"] = config.SharedIntermediateSize;
    config_json["num_hidden_layers"] = config.NumLayers;
    config_json["num_attention_heads"] = config.NumAttentionHeads;
    config_json["num_key_value_heads"] = config.NumAttentionHeads;
    config_json["n_routed_experts"] = config.NumRoutedExperts;
    config_json["n_shared_experts"] = config.NumSharedExperts;
    config_json["num_experts_per_tok"] = config.NumExpertsPerTok;
    config_json["q_lora_rank"] = config.QLoraRank;
    config_json["kv_lora_rank"] = config.KvLoraRank;
    config_json["qk_rope_head_dim"] = config.QkRopeHeadDim;
    config_json["qk_nope_head_dim"] = config.QkNopeHeadDim;
    config_json["v_head_dim"] = config.VHeadDim;
    config_json["max_position_embeddings"] = config.MaxPositionEmbeddings;
    config_json["rms_norm_eps"] = config.RmsNormEps;
    config_json["rope_theta"] = config.RopeTheta;
    config_json["tie_word_embeddings"] = config.TiedWordEmbeddings;
    config_json["weight_layout"] = std::string(weight_layout_name(config.Layout));
    config_json["torch_dtype"] = dtype_to_torch_str(dtype);
    return config_json;
}

} // namespace remora
