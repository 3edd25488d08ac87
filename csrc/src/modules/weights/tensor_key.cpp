// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/weights/tensor_key.h"

#include <array>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

namespace remora {

namespace {

constexpr std::array<std::pair<BlockKind, std::string_view>, 7> kBlockNames{{
    {BlockKind::Global, "global"},
    {BlockKind::Norm, "norm"},
    {BlockKind::Attention, "attention"},
    {BlockKind::MoeRouter, "moe_router"},
    {BlockKind::MoeExpert, "moe_expert"},
    {BlockKind::MoeExperts, "moe_experts"},
    {BlockKind::MoeShared, "moe_shared"},
}};

} // namespace

std::string_view block_kind_name(BlockKind kind) {
    for (const auto& [k, name] : kBlockNames) {
        if (k == kind) return name;
    }
    throw std::logic_error("unknown BlockKind");
}

std::optional<BlockKind> block_kind_from_name(std::string_view name) {
    for (const auto& [k, n] : kBlockNames) {
        if (n == name) return k;
    }
    return std::nullopt;
}

TensorKey TensorKey::schema_key() const {
    return TensorKey{-1, Block, -1, Role, Projection};
}

TensorKey TensorKey::instantiate(int layer, int expert) const {
    TensorKey key = schema_key();
    if (is_per_layer(Block)) key.Layer = layer;
    if (is_per_expert(Block)) key.Expert = expert;
    return key;
}

TensorKey TensorKey::bias() const {
    TensorKey key = *this;
    key.Role = TensorRole::Bias;
    return key;
}

std::string TensorKey::schema_id() const {
    return fmt::format("{}.{}.{}", block_kind_name(Block), Projection, Role == TensorRole::Weight ? "weight" : "bias");
}

std::string TensorKey::to_string() const {
    if (Layer < 0) {
        return schema_id();
    }
    if (Expert >= 0) {
        return fmt::format("layer {} expert {} {}", Layer, Expert, schema_id());
    }
    return fmt::format("layer {} {}", Layer, schema_id());
}

std::optional<TensorKey> parse_schema_id(std::string_view id) {
    const auto first = id.find('.');
    const auto last = id.rfind('.');
    if (first == std::string_view::npos || first == last) return std::nullopt;

    auto block = block_kind_from_name(id.substr(0, first));
    if (!block) return std::nullopt;

    std::string_view role_str = id.substr(last + 1);
    TensorRole role;
    if (role_str == "weight") {
        role = TensorRole::Weight;
    } else if (role_str == "bias") {
        role = TensorRole::Bias;
    } else {
        return std::nullopt;
    }

    std::string_view projection = id.substr(first + 1, last - first - 1);
    if (projection.empty()) return std::nullopt;
    return TensorKey{-1, *block, -1, role, std::string(projection)};
}

} // namespace remora
