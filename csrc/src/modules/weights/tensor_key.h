// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Structured tensor identity shared by the source and target naming schemas.

#ifndef REMORA_SRC_MODULES_WEIGHTS_TENSOR_KEY_H
#define REMORA_SRC_MODULES_WEIGHTS_TENSOR_KEY_H

#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace remora {

/**
 * @brief Part of the network a tensor belongs to.
 */
enum class BlockKind {
    Global,         ///< Embeddings, final norm, LM head (no layer index)
    Norm,           ///< Per-layer RMSNorm scales
    Attention,      ///< Multi-head latent attention projections
    MoeRouter,      ///< Router gate and its routing bias
    MoeExpert,      ///< One routed expert (layer and expert index)
    MoeExperts,     ///< All routed experts of a layer stacked along a leading axis
    MoeShared,      ///< Shared expert(s)
};

enum class TensorRole {
    Weight,
    Bias,
};

std::string_view block_kind_name(BlockKind kind);
std::optional<BlockKind> block_kind_from_name(std::string_view name);

//! Whether tensors of @p kind carry a layer index.
constexpr bool is_per_layer(BlockKind kind) { return kind != BlockKind::Global; }
//! Whether tensors of @p kind carry an expert index.
constexpr bool is_per_expert(BlockKind kind) { return kind == BlockKind::MoeExpert; }

/**
 * @brief Identifies a tensor independently of any concrete naming convention.
 *
 * `Layer` is -1 for global tensors, `Expert` is -1 unless the block is `MoeExpert`.
 * Keys with both indices at -1 also serve as schema entries ("templates") from which
 * concrete keys are instantiated.
 */
struct TensorKey {
    int Layer = -1;
    BlockKind Block = BlockKind::Global;
    int Expert = -1;
    TensorRole Role = TensorRole::Weight;
    std::string Projection;

    auto operator<=>(const TensorKey&) const = default;
    bool operator==(const TensorKey&) const = default;

    static TensorKey global(std::string projection, TensorRole role = TensorRole::Weight) {
        return TensorKey{-1, BlockKind::Global, -1, role, std::move(projection)};
    }
    static TensorKey layer(int layer, BlockKind block, std::string projection, TensorRole role = TensorRole::Weight) {
        return TensorKey{layer, block, -1, role, std::move(projection)};
    }
    static TensorKey expert(int layer, int expert, std::string projection, TensorRole role = TensorRole::Weight) {
        return TensorKey{layer, BlockKind::MoeExpert, expert, role, std::move(projection)};
    }

    //! Same block, role and projection with layer/expert indices cleared.
    [[nodiscard]] TensorKey schema_key() const;
    //! Concrete key for @p layer / @p expert of this schema entry.
    [[nodiscard]] TensorKey instantiate(int layer, int expert = -1) const;
    //! Same key with the role switched to bias.
    [[nodiscard]] TensorKey bias() const;

    //! Schema identifier, e.g. `attention.kv_proj.weight`.
    [[nodiscard]] std::string schema_id() const;

    //! Human readable form, e.g. `layer 4 moe_shared.gate_proj.weight`.
    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Parse a schema identifier of the form `<block>.<projection>.<weight|bias>`.
 *
 * @return std::nullopt if the block or role is unknown or the projection is empty.
 */
std::optional<TensorKey> parse_schema_id(std::string_view id);

} // namespace remora

#endif // REMORA_SRC_MODULES_WEIGHTS_TENSOR_KEY_H
