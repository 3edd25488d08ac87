// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/architecture_config.h"
#include "utilities/errors.h"
#include "test_utils.h"

using namespace remora;
using namespace testing_utils;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("architecture config: parses every declared key", "[config]") {
    const ArchitectureConfig expected = small_config();
    nlohmann::json j = config_to_json(expected);
    j["rms_norm_eps"] = 1e-5;
    j["rope_theta"] = 50000;

    const ArchitectureConfig cfg = parse_architecture_config(j, "test.json");
    REQUIRE(cfg.NumLayers == expected.NumLayers);
    REQUIRE(cfg.HiddenSize == expected.HiddenSize);
    REQUIRE(cfg.NumRoutedExperts == expected.NumRoutedExperts);
    REQUIRE(cfg.RoutedIntermediateSize == expected.RoutedIntermediateSize);
    REQUIRE(cfg.SharedIntermediateSize == expected.SharedIntermediateSize);
    REQUIRE(cfg.KvLoraRank == expected.KvLoraRank);
    REQUIRE(cfg.Layout == WeightLayout::OutIn);
    REQUIRE(cfg.RopeTheta == 50000.0f);
    REQUIRE(cfg.PassThrough.empty());
}

TEST_CASE("architecture config: moe_intermediate_size is accepted for the routed size", "[config]") {
    nlohmann::json j = config_to_json(small_config());
    const int routed = j["routed_intermediate_size"];
    j.erase("routed_intermediate_size");
    j["moe_intermediate_size"] = routed;
    REQUIRE(parse_architecture_config(j, "test.json").RoutedIntermediateSize == routed);
}

TEST_CASE("architecture config: missing required key names the key", "[config][errors]") {
    for (const char* key : {"num_hidden_layers", "hidden_size", "n_routed_experts", "shared_intermediate_size",
                            "kv_lora_rank", "routed_intermediate_size"}) {
        nlohmann::json j = config_to_json(small_config());
        j.erase(key);
        try {
            parse_architecture_config(j, "test.json");
            FAIL("expected ConfigMismatch for " << key);
        } catch (const ConfigMismatch& e) {
            REQUIRE(e.tensor() == key);
            REQUIRE(e.stage() == "config");
        }
    }
}

TEST_CASE("architecture config: inconsistent values are rejected", "[config][errors]") {
    nlohmann::json j = config_to_json(small_config());

    SECTION("routed size larger than shared size") {
        j["routed_intermediate_size"] = j["shared_intermediate_size"].get<int>() + 1;
        REQUIRE_THROWS_AS(parse_architecture_config(j, "test.json"), ConfigMismatch);
    }
    SECTION("more experts per token than routed experts") {
        j["num_experts_per_tok"] = j["n_routed_experts"].get<int>() + 1;
        REQUIRE_THROWS_AS(parse_architecture_config(j, "test.json"), ConfigMismatch);
    }
    SECTION("non-positive layer count") {
        j["num_hidden_layers"] = 0;
        REQUIRE_THROWS_AS(parse_architecture_config(j, "test.json"), ConfigMismatch);
    }
    SECTION("unknown weight layout") {
        j["weight_layout"] = "row_major";
        REQUIRE_THROWS_WITH(parse_architecture_config(j, "test.json"), ContainsSubstring("row_major"));
    }
    SECTION("value of the wrong type") {
        j["hidden_size"] = nlohmann::json::array();
        REQUIRE_THROWS_AS(parse_architecture_config(j, "test.json"), ConfigMismatch);
    }
    SECTION("source key rows smaller than the non-rotary dimension") {
        j["source_k_head_dim"] = j["qk_nope_head_dim"].get<int>() - 1;
        REQUIRE_THROWS_AS(parse_architecture_config(j, "test.json"), ConfigMismatch);
    }
}

TEST_CASE("architecture config: values beyond 32 bits are rejected, not truncated", "[config][errors]") {
    const auto rejected_key = [](const nlohmann::json& j) -> std::string {
        try {
            parse_architecture_config(j, "test.json");
        } catch (const ConfigMismatch& e) {
            return e.tensor();
        }
        return "";
    };
    nlohmann::json j = config_to_json(small_config());

    SECTION("unsigned integer") {
        j["hidden_size"] = std::uint64_t{4294967297};
        REQUIRE(rejected_key(j) == "hidden_size");
    }
    SECTION("negative integer") {
        j["vocab_size"] = std::int64_t{-4294967296};
        REQUIRE(rejected_key(j) == "vocab_size");
    }
    SECTION("floating point") {
        j["n_routed_experts"] = 1e12;
        REQUIRE(rejected_key(j) == "n_routed_experts");
    }
    SECTION("numeric string") {
        j["num_hidden_layers"] = "99999999999";
        REQUIRE(rejected_key(j) == "num_hidden_layers");
    }
    SECTION("derived projection rows") {
        j["num_attention_heads"] = 100000;
        j["v_head_dim"] = 100000;
        REQUIRE(rejected_key(j) == "num_attention_heads");
    }
}

TEST_CASE("architecture config: load reports missing and malformed files", "[config][errors]") {
    TempDir dir;
    REQUIRE_THROWS_AS(load_architecture_config(dir.file("absent.json")), IOError);

    const std::string file = dir.file("broken.json");
    std::ofstream(file) << "{\"hidden_size\": ";
    REQUIRE_THROWS_AS(load_architecture_config(file), ConfigMismatch);
}

TEST_CASE("architecture config: in_out layout swaps projection axes", "[config]") {
    ArchitectureConfig cfg = small_config();
    REQUIRE(cfg.projection_shape(3, 5) == std::vector<long>{3, 5});
    REQUIRE(cfg.output_axis() == 0);
    cfg.Layout = WeightLayout::InOut;
    REQUIRE(cfg.projection_shape(3, 5) == std::vector<long>{5, 3});
    REQUIRE(cfg.output_axis() == 1);
    REQUIRE(cfg.input_axis() == 0);
}

TEST_CASE("architecture config: runtime config carries the unified expert size", "[config]") {
    nlohmann::json j = config_to_json(small_config());
    j["model_type"] = "custom_moe";
    j["bos_token_id"] = 0;
    const ArchitectureConfig cfg = parse_architecture_config(j, "test.json");

    const nlohmann::json runtime = runtime_config_json(cfg, ETensorDType::BF16);
    REQUIRE(runtime["moe_intermediate_size"] == cfg.SharedIntermediateSize);
    REQUIRE(runtime["routed_intermediate_size"] == cfg.SharedIntermediateSize);
    REQUIRE(runtime["n_routed_experts"] == cfg.NumRoutedExperts);
    REQUIRE(runtime["torch_dtype"] == "bfloat16");
    REQUIRE(runtime["model_type"] == "custom_moe");
    REQUIRE(runtime["bos_token_id"] == 0);
}
