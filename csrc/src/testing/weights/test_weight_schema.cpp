// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <string>
#include <vector>

#include "config/architecture_config.h"
#include "models/deepseek_moe/weight_mapping.h"
#include "modules/weights/weight_schema.h"
#include "utilities/errors.h"
#include "test_utils.h"

using namespace remora;
using namespace testing_utils;

namespace {

std::map<std::string, Tensor> conforming_tensors(const CheckpointSchema& schema) {
    std::map<std::string, Tensor> tensors;
    for (const auto& spec : schema.tensors()) {
        tensors[spec.name] = Tensor::allocate(ETensorDType::FP32, spec.shape);
    }
    return tensors;
}

} // namespace

TEST_CASE("weight schema: target schema covers globals and every layer", "[weights][schema]") {
    const ArchitectureConfig cfg = small_config();
    auto target = create_target_mapping();
    const CheckpointSchema schema = describe_target_schema(cfg, *target);
    REQUIRE(schema.size() == static_cast<std::size_t>(3 + 17 * cfg.NumLayers));

    const long H = cfg.HiddenSize;
    const long E = cfg.NumRoutedExperts;
    const long U = cfg.SharedIntermediateSize;
    const auto* experts = schema.find("model.layers.1.mlp.switch_mlp.down_proj.weight");
    REQUIRE(experts != nullptr);
    REQUIRE(experts->shape == std::vector<long>{E, H, U});

    const auto* kv_a = schema.find("model.layers.0.self_attn.kv_a_proj_with_mqa.weight");
    REQUIRE(kv_a != nullptr);
    REQUIRE(kv_a->shape == std::vector<long>{cfg.kv_a_rows(), H});

    const auto* kv_b = schema.find("model.layers.0.self_attn.kv_b_proj.weight");
    REQUIRE(kv_b != nullptr);
    REQUIRE(kv_b->shape == std::vector<long>{cfg.kv_b_rows(), cfg.KvLoraRank});

    const auto* bias = schema.find("model.layers.0.mlp.gate.e_score_correction_bias");
    REQUIRE(bias != nullptr);
    REQUIRE(bias->shape == std::vector<long>{E});

    REQUIRE(schema.find("model.embed_tokens.weight")->shape == std::vector<long>{cfg.VocabSize, H});
    REQUIRE(schema.find("model.layers.2.input_layernorm.weight") == nullptr);
}

TEST_CASE("weight schema: in_out layout transposes projections but not embeddings", "[weights][schema]") {
    ArchitectureConfig cfg = small_config();
    cfg.Layout = WeightLayout::InOut;
    auto target = create_target_mapping();
    const CheckpointSchema schema = describe_target_schema(cfg, *target);

    const long H = cfg.HiddenSize;
    REQUIRE(schema.find("model.embed_tokens.weight")->shape == std::vector<long>{cfg.VocabSize, H});
    REQUIRE(schema.find("lm_head.weight")->shape == std::vector<long>{H, cfg.VocabSize});
    REQUIRE(schema.find("model.layers.0.mlp.switch_mlp.gate_proj.weight")->shape ==
            std::vector<long>{cfg.NumRoutedExperts, H, cfg.SharedIntermediateSize});
}

TEST_CASE("weight schema: conforming tensors validate", "[weights][schema]") {
    const ArchitectureConfig cfg = small_config();
    auto target = create_target_mapping();
    const auto tensors = conforming_tensors(describe_target_schema(cfg, *target));
    REQUIRE_NOTHROW(validate_against_schema(tensors, cfg, *target));
}

TEST_CASE("weight schema: violations are collected and ordered by name", "[weights][schema][errors]") {
    const ArchitectureConfig cfg = small_config();
    auto target = create_target_mapping();
    const CheckpointSchema schema = describe_target_schema(cfg, *target);
    auto tensors = conforming_tensors(schema);

    tensors.erase("model.norm.weight");
    tensors["model.layers.0.self_attn.kv_b_proj.weight"] = Tensor::allocate(ETensorDType::FP32, {3, 3});
    tensors["extra.weight"] = Tensor::allocate(ETensorDType::FP32, {1});

    const ValidationResult result = check_against_schema(tensors, schema);
    REQUIRE_FALSE(result.success);
    REQUIRE(result.errors.size() == 3);
    REQUIRE(result.errors[0].tensor == "extra.weight");
    REQUIRE(result.errors[1].tensor == "model.layers.0.self_attn.kv_b_proj.weight");
    REQUIRE(result.errors[1].message.find("actual shape (3, 3)") != std::string::npos);
    REQUIRE(result.errors[2].tensor == "model.norm.weight");
    REQUIRE(result.errors[2].message.find("missing") != std::string::npos);

    try {
        throw_on_violation(result);
        FAIL("expected ConfigMismatch");
    } catch (const ConfigMismatch& e) {
        REQUIRE(e.tensor() == "extra.weight");
        REQUIRE(std::string(e.what()).find("2 further violation(s)") != std::string::npos);
    }
}

TEST_CASE("weight schema: vocabulary size disagreement names the embedding", "[weights][schema][errors]") {
    const ArchitectureConfig cfg = small_config();
    auto target = create_target_mapping();
    auto tensors = conforming_tensors(describe_target_schema(cfg, *target));
    tensors["model.embed_tokens.weight"] = Tensor::allocate(ETensorDType::FP32, {cfg.VocabSize + 1, cfg.HiddenSize});
    try {
        validate_against_schema(tensors, cfg, *target);
        FAIL("expected ConfigMismatch");
    } catch (const ConfigMismatch& e) {
        REQUIRE(e.tensor() == "model.embed_tokens.weight");
    }
}

TEST_CASE("weight schema: per-expert target entries are rejected", "[weights][schema][errors]") {
    auto target = create_target_mapping();
    target->apply_overrides({{"moe_expert.gate_proj.weight", "model.layers.{layer}.experts.{expert}.gate.weight"}});
    REQUIRE_THROWS_AS(describe_target_schema(small_config(), *target), ConfigMismatch);
}
