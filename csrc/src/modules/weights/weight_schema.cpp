// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "modules/weights/weight_schema.h"

#include <optional>
#include <utility>

#include <fmt/core.h>

#include "config/architecture_config.h"
#include "models/deepseek_moe/weight_mapping.h"
#include "modules/weights/weight_mapping.h"
#include "utilities/errors.h"

namespace remora {

void CheckpointSchema::add(TensorSpec spec) {
    auto [it, inserted] = mIndex.emplace(spec.name, mTensors.size());
    if (!inserted) {
        throw ConfigMismatch("validate", spec.name, "target schema maps two keys to the same tensor name");
    }
    mTensors.push_back(std::move(spec));
}

const TensorSpec* CheckpointSchema::find(const std::string& name) const {
    auto it = mIndex.find(name);
    return it == mIndex.end() ? nullptr : &mTensors[it->second];
}

namespace {

struct Features {
    long Out;
    long In;
};

// Output/input features of the linear projections known to the runtime.
std::optional<Features> projection_features(const ArchitectureConfig& c, BlockKind block, const std::string& p) {
    const long hidden = c.HiddenSize;
    switch (block) {
    case BlockKind::Global:
        if (p == proj::LMHead) return Features{c.VocabSize, hidden};
        break;
    case BlockKind::Attention:
        if (p == proj::QAProj) return Features{c.QLoraRank, hidden};
        if (p == proj::QBProj) return Features{static_cast<long>(c.NumAttentionHeads) * c.q_head_dim(), c.QLoraRank};
        if (p == proj::KvAProj) return Features{c.kv_a_rows(), hidden};
        if (p == proj::KvBProj) return Features{c.kv_b_rows(), c.KvLoraRank};
        if (p == proj::OProj) return Features{hidden, static_cast<long>(c.NumAttentionHeads) * c.VHeadDim};
        break;
    case BlockKind::MoeRouter:
        if (p == proj::RouterGate) return Features{c.NumRoutedExperts, hidden};
        break;
    case BlockKind::MoeExperts:
        if (p == proj::GateProj || p == proj::UpProj) return Features{c.unified_intermediate_size(), hidden};
        if (p == proj::DownProj) return Features{hidden, c.unified_intermediate_size()};
        break;
    case BlockKind::MoeShared:
        if (p == proj::GateProj || p == proj::UpProj) return Features{c.shared_expert_rows(), hidden};
        if (p == proj::DownProj) return Features{hidden, c.shared_expert_rows()};
        break;
    default:
        break;
    }
    return std::nullopt;
}

// Length of rank-1 scale vectors.
std::optional<long> vector_length(const ArchitectureConfig& c, BlockKind block, const std::string& p) {
    switch (block) {
    case BlockKind::Global:
        if (p == proj::FinalNorm) return c.HiddenSize;
        break;
    case BlockKind::Norm:
        return c.HiddenSize;
    case BlockKind::Attention:
        if (p == proj::QANorm) return c.QLoraRank;
        if (p == proj::KvANorm) return c.KvLoraRank;
        break;
    case BlockKind::MoeRouter:
        if (p == proj::ScoreCorrection) return c.NumRoutedExperts;
        break;
    default:
        break;
    }
    return std::nullopt;
}

} // namespace

std::vector<long> expected_shape(const ArchitectureConfig& config, const TensorKey& key) {
    if (key.Block == BlockKind::Global && key.Projection == proj::EmbedTokens && key.Role == TensorRole::Weight) {
        // embedding tables are indexed by token id in either layout
        return {config.VocabSize, config.HiddenSize};
    }

    if (key.Role == TensorRole::Weight) {
        if (auto length = vector_length(config, key.Block, key.Projection)) {
            return {*length};
        }
    }

    if (auto features = projection_features(config, key.Block, key.Projection)) {
        std::vector<long> shape;
        if (key.Role == TensorRole::Bias) {
            shape = {features->Out};
        } else {
            shape = config.projection_shape(features->Out, features->In);
        }
        if (key.Block == BlockKind::MoeExperts) {
            shape.insert(shape.begin(), config.NumRoutedExperts);
        }
        return shape;
    }

    if (key.Role == TensorRole::Bias) {
        // biases of scale vectors, e.g. the routing score correction
        if (auto length = vector_length(config, key.Block, key.Projection)) {
            return {*length};
        }
    }

    throw ConfigMismatch("validate", key.schema_id(), "no expected shape is known for this target tensor");
}

CheckpointSchema describe_target_schema(const ArchitectureConfig& config, const BaseWeightMapping& target) {
    CheckpointSchema schema;
    for (const auto& pattern : target.patterns()) {
        const TensorKey& key = pattern.Key;
        if (is_per_expert(key.Block)) {
            throw ConfigMismatch("validate", pattern.NameTemplate,
                                 "the target schema stores routed experts stacked; per-expert entries are not supported");
        }
        const WeightRequirement requirement = pattern.Optional ? WeightRequirement::Optional : WeightRequirement::Required;
        if (!is_per_layer(key.Block)) {
            schema.add({pattern.expand_name(-1), key, expected_shape(config, key), requirement});
            continue;
        }
        for (int layer = 0; layer < config.NumLayers; ++layer) {
            TensorKey concrete = key.instantiate(layer);
            std::vector<long> shape = expected_shape(config, concrete);
            schema.add({pattern.expand_name(layer), std::move(concrete), std::move(shape), requirement});
        }
    }
    return schema;
}

std::string ValidationResult::format() const {
    std::string result;
    for (const auto& e : errors) {
        result += fmt::format("ERROR: `{}`: {}\n", e.tensor, e.message);
    }
    return result;
}

ValidationResult check_against_schema(const std::map<std::string, Tensor>& tensors, const CheckpointSchema& schema) {
    // collect per name first so the result is ordered by tensor name
    std::map<std::string, std::string> problems;

    for (const auto& spec : schema.tensors()) {
        auto it = tensors.find(spec.name);
        if (it == tensors.end()) {
            if (spec.requirement == WeightRequirement::Required) {
                problems.emplace(spec.name, fmt::format("missing (expected shape {})", shape_to_str(spec.shape)));
            }
            continue;
        }
        if (it->second.shape() != spec.shape) {
            problems.emplace(spec.name, fmt::format("actual shape {} vs expected {}",
                                                    it->second.shape_str(), shape_to_str(spec.shape)));
        }
    }

    for (const auto& [name, tensor] : tensors) {
        if (!schema.find(name)) {
            problems.emplace(name, "unexpected tensor, not part of the target schema");
        }
    }

    ValidationResult result;
    for (auto& [name, message] : problems) {
        result.add_error(name, std::move(message));
    }
    return result;
}

void throw_on_violation(const ValidationResult& result) {
    if (result.success) return;

    const SchemaViolation& first = result.errors.front();
    std::string message = first.message;
    if (result.errors.size() > 1) {
        message += fmt::format(" ({} further violation(s))", result.errors.size() - 1);
    }
    throw ConfigMismatch("validate", first.tensor, message);
}

void validate_against_schema(const std::map<std::string, Tensor>& tensors, const ArchitectureConfig& config,
                             const BaseWeightMapping& target) {
    config.validate();
    throw_on_violation(check_against_schema(tensors, describe_target_schema(config, target)));
}

} // namespace remora
