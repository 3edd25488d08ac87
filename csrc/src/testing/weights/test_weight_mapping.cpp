// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <string>

#include <nlohmann/json.hpp>

#include "models/deepseek_moe/weight_mapping.h"
#include "modules/weights/tensor_key.h"
#include "modules/weights/weight_mapping.h"
#include "utilities/errors.h"
#include "test_utils.h"

using namespace remora;
using namespace testing_utils;

TEST_CASE("tensor key: schema ids parse back into keys", "[weights][schema]") {
    const TensorKey key = TensorKey::layer(3, BlockKind::MoeShared, proj::GateProj);
    REQUIRE(key.schema_id() == "moe_shared.gate_proj.weight");
    REQUIRE(key.to_string() == "layer 3 moe_shared.gate_proj.weight");

    const auto parsed = parse_schema_id("moe_router.e_score_correction.bias");
    REQUIRE(parsed.has_value());
    REQUIRE(parsed->Block == BlockKind::MoeRouter);
    REQUIRE(parsed->Role == TensorRole::Bias);
    REQUIRE(parsed->Projection == "e_score_correction");

    REQUIRE_FALSE(parse_schema_id("attention.q_a_proj").has_value());
    REQUIRE_FALSE(parse_schema_id("mlp.q_a_proj.weight").has_value());
    REQUIRE_FALSE(parse_schema_id("attention..weight").has_value());
    REQUIRE_FALSE(parse_schema_id("attention.q_a_proj.scale").has_value());
}

TEST_CASE("weight mapping: source names expand and match back", "[weights][schema]") {
    auto source = create_source_mapping();

    const TensorKey expert = TensorKey::expert(4, 7, proj::UpProj);
    REQUIRE(source->require_name(expert) == "h.4.mlp.experts.7.up_proj.weight");
    REQUIRE(source->match("h.4.mlp.experts.7.up_proj.weight") == expert);

    const TensorKey shared = TensorKey::layer(12, BlockKind::MoeShared, proj::DownProj);
    REQUIRE(source->require_name(shared) == "h.12.mlp.shared_expert.down_proj.weight");
    REQUIRE(source->match("h.12.mlp.shared_expert.down_proj.weight") == shared);

    REQUIRE(source->match("wte.weight") == TensorKey::global(proj::EmbedTokens));
    REQUIRE_FALSE(source->match("h.x.ln_1.weight").has_value());
    REQUIRE_FALSE(source->match("h.1.ln_1.weight.extra").has_value());
}

TEST_CASE("weight mapping: indices too large for an int name the tensor", "[weights][schema][errors]") {
    auto source = create_source_mapping();

    try {
        (void)source->match("h.99999999999.ln_1.weight");
        FAIL("oversized layer index was accepted");
    } catch (const ConfigMismatch& e) {
        REQUIRE(e.tensor() == "h.99999999999.ln_1.weight");
        REQUIRE(e.stage() == "convert");
    }
    REQUIRE_THROWS_AS(source->match("h.0.mlp.experts.4294967296.gate_proj.weight"), ConfigMismatch);
}

TEST_CASE("weight mapping: target declares stacked experts but not per-expert tensors", "[weights][schema]") {
    auto target = create_target_mapping();
    REQUIRE(target->require_name(TensorKey::layer(2, BlockKind::MoeExperts, proj::GateProj)) ==
            "model.layers.2.mlp.switch_mlp.gate_proj.weight");
    REQUIRE(target->require_name(TensorKey::layer(0, BlockKind::Attention, proj::KvAProj)) ==
            "model.layers.0.self_attn.kv_a_proj_with_mqa.weight");
    REQUIRE_FALSE(target->declares(TensorKey::expert(0, 0, proj::GateProj)));
    REQUIRE_THROWS_AS(target->require_name(TensorKey::expert(0, 0, proj::GateProj)), ConfigMismatch);
}

TEST_CASE("weight mapping: overrides replace, add and remove entries", "[weights][schema]") {
    auto source = create_source_mapping();
    source->apply_overrides({
        {"norm.input.weight", "blocks.{layer}.pre_norm.scale"},
        {"moe_shared.gate_proj.bias", nullptr},
        {"attention.q_a_proj.bias", "h.{layer}.attn.q_proj.bias"},
    });

    const TensorKey norm = TensorKey::layer(5, BlockKind::Norm, proj::InputNorm);
    REQUIRE(source->require_name(norm) == "blocks.5.pre_norm.scale");
    REQUIRE(source->match("blocks.5.pre_norm.scale") == norm);
    REQUIRE_FALSE(source->match("h.5.ln_1.weight").has_value());

    REQUIRE_FALSE(source->declares(TensorKey::layer(0, BlockKind::MoeShared, proj::GateProj, TensorRole::Bias)));

    const auto* added = source->find_pattern(TensorKey::layer(0, BlockKind::Attention, proj::QAProj, TensorRole::Bias));
    REQUIRE(added != nullptr);
    REQUIRE(added->Optional);
}

TEST_CASE("weight mapping: invalid overrides are rejected", "[weights][schema][errors]") {
    auto source = create_source_mapping();

    SECTION("unknown schema id") {
        REQUIRE_THROWS_AS(source->apply_overrides({{"mlp.gate_proj.weight", "x.{layer}"}}), ConfigMismatch);
    }
    SECTION("missing layer placeholder") {
        REQUIRE_THROWS_AS(source->apply_overrides({{"norm.input.weight", "ln_1.weight"}}), ConfigMismatch);
    }
    SECTION("expert placeholder on a per-layer tensor") {
        REQUIRE_THROWS_AS(source->apply_overrides({{"norm.input.weight", "h.{layer}.{expert}.ln"}}), ConfigMismatch);
    }
    SECTION("template collides with another entry") {
        REQUIRE_THROWS_AS(source->apply_overrides({{"norm.input.weight", "h.{layer}.ln_2.weight"}}), ConfigMismatch);
    }
    SECTION("non-string value") {
        REQUIRE_THROWS_AS(source->apply_overrides({{"norm.input.weight", 3}}), ConfigMismatch);
    }
}

TEST_CASE("weight mapping: schema file overrides both sides", "[weights][schema]") {
    TempDir dir;
    auto source = create_source_mapping();
    auto target = create_target_mapping();

    write_json(dir.file("schema.json"), {
        {"source", {{"global.embed_tokens.weight", "tok_embeddings.weight"}}},
        {"target", {{"global.final_norm.weight", "model.final_norm.weight"}}},
    });
    apply_schema_file(dir.file("schema.json"), *source, *target);
    REQUIRE(source->require_name(TensorKey::global(proj::EmbedTokens)) == "tok_embeddings.weight");
    REQUIRE(target->require_name(TensorKey::global(proj::FinalNorm)) == "model.final_norm.weight");

    write_json(dir.file("bad.json"), {{"middle", nlohmann::json::object()}});
    REQUIRE_THROWS_AS(apply_schema_file(dir.file("bad.json"), *source, *target), ConfigMismatch);
    REQUIRE_THROWS_AS(apply_schema_file(dir.file("absent.json"), *source, *target), IOError);
}
