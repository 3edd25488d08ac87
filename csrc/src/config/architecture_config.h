// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef REMORA_SRC_CONFIG_ARCHITECTURE_CONFIG_H
#define REMORA_SRC_CONFIG_ARCHITECTURE_CONFIG_H

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "utilities/dtype.h"

namespace remora {

/**
 * @brief Orientation of every rank-2 projection matrix in both checkpoints.
 *
 * `OutIn` is the PyTorch `nn.Linear` convention `(out_features, in_features)`;
 * `InOut` stores the transpose. The output axis of a projection is axis 0 for
 * `OutIn` and axis 1 for `InOut`.
 */
enum class WeightLayout {
    OutIn,
    InOut,
};

std::string_view weight_layout_name(WeightLayout layout);

/**
 * @brief Declared architecture of a DeepSeek-style MoE decoder with multi-head latent attention.
 *
 * Every count is taken from the config file; nothing is inferred from the checkpoint.
 * The converter iterates layers and experts exclusively from these values.
 */
struct ArchitectureConfig {
    // Model dimensions
    int NumLayers = 0;
    int HiddenSize = 0;
    int NumAttentionHeads = 0;
    int VocabSize = 0;
    int MaxPositionEmbeddings = 0;

    // MoE
    int NumRoutedExperts = 0;
    int NumExpertsPerTok = 0;
    int NumSharedExperts = 1;
    int RoutedIntermediateSize = 0;     ///< Per routed expert
    int SharedIntermediateSize = 0;     ///< Per shared expert; padding target for routed experts

    // Multi-head latent attention
    int QLoraRank = 0;
    int KvLoraRank = 0;
    int QkRopeHeadDim = 0;
    int QkNopeHeadDim = 0;
    int VHeadDim = 0;
    int SourceKHeadDim = 0;             ///< Rows per head of the source key decompression; 0 = nope + rope

    // Numerics carried into the runtime config
    float RmsNormEps = 1e-6f;
    float RopeTheta = 10000.0f;

    WeightLayout Layout = WeightLayout::OutIn;
    bool TiedWordEmbeddings = false;
    bool CollapseRopeHeads = false;

    // Keys of the config file that are not interpreted here; copied into the runtime config.
    nlohmann::json PassThrough = nlohmann::json::object();

    [[nodiscard]] int q_head_dim() const { return QkNopeHeadDim + QkRopeHeadDim; }
    [[nodiscard]] int source_k_head_dim() const { return SourceKHeadDim > 0 ? SourceKHeadDim : q_head_dim(); }
    [[nodiscard]] int kv_a_rows() const { return KvLoraRank + QkRopeHeadDim; }
    [[nodiscard]] int kv_b_rows() const { return NumAttentionHeads * (QkNopeHeadDim + VHeadDim); }
    [[nodiscard]] int shared_expert_rows() const { return SharedIntermediateSize * NumSharedExperts; }
    [[nodiscard]] int unified_intermediate_size() const { return SharedIntermediateSize; }
    [[nodiscard]] bool needs_expert_padding() const { return RoutedIntermediateSize != SharedIntermediateSize; }

    //! Axis holding the output features of a rank-2 projection.
    [[nodiscard]] int output_axis() const { return Layout == WeightLayout::OutIn ? 0 : 1; }
    //! Axis holding the input features of a rank-2 projection.
    [[nodiscard]] int input_axis() const { return 1 - output_axis(); }

    //! Storage shape of a projection with @p out output and @p in input features.
    [[nodiscard]] std::vector<long> projection_shape(long out, long in) const {
        return Layout == WeightLayout::OutIn ? std::vector<long>{out, in} : std::vector<long>{in, out};
    }

    /**
     * @brief Check the declared values for internal consistency.
     *
     * @throws remora::ConfigMismatch naming the first offending key.
     */
    void validate() const;
};

/**
 * @brief Parse an architecture config from its JSON representation.
 *
 * @param config_json Parsed config object.
 * @param origin File name used in error messages.
 *
 * @throws remora::ConfigMismatch if a required key is missing, ill-typed or inconsistent.
 */
ArchitectureConfig parse_architecture_config(const nlohmann::json& config_json, const std::string& origin);

/**
 * @brief Load and validate an architecture config file.
 *
 * @throws remora::IOError if the file cannot be opened.
 * @throws remora::ConfigMismatch on malformed JSON or invalid values.
 */
ArchitectureConfig load_architecture_config(const std::string& file_name);

/**
 * @brief Build the `config.json` the target runtime reads next to the converted weights.
 *
 * @param config Declared architecture.
 * @param dtype Dominant element type of the converted weights.
 */
nlohmann::json runtime_config_json(const ArchitectureConfig& config, ETensorDType dtype);

} // namespace remora

#endif // REMORA_SRC_CONFIG_ARCHITECTURE_CONFIG_H
