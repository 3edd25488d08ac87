// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "config/architecture_config.h"
#include "conversion/checkpoint.h"
#include "conversion/logging.h"
#include "conversion/pipeline.h"
#include "conversion/verification.h"
#include "models/deepseek_moe/weight_mapping.h"
#include "modules/weights/weight_fusion.h"
#include "test_utils.h"

using namespace remora;
using namespace testing_utils;

namespace {

//! A converted checkpoint written to disk, together with its source.
struct VerifyFixture {
    VerifyFixture() : Config(small_config()), Source(create_source_mapping()), Target(create_target_mapping()),
                      Context{Config, *Source, *Target, nullptr, 1, false} {
        SourceTensors = make_source_checkpoint(Config);
        Converted = convert_checkpoint(Context, SourceTensors).Tensors;
        write_checkpoint(Converted, Dir.file("weights.safetensors"));
    }

    VerificationResult verify(const VerificationOptions& options = {}) const {
        return verify_checkpoint(Dir.file("weights.safetensors"), Context, SourceTensors, false, options);
    }

    //! Replace @p name in the written file by @p tensor.
    void rewrite(const std::string& name, Tensor tensor) {
        CheckpointMapping modified;
        for (const auto& [n, t] : Converted.tensors()) {
            modified.insert(n, n == name ? tensor : t);
        }
        write_checkpoint(modified, Dir.file("weights.safetensors"));
    }

    TempDir Dir;
    ArchitectureConfig Config;
    std::unique_ptr<BaseWeightMapping> Source;
    std::unique_ptr<BaseWeightMapping> Target;
    ConversionContext Context;
    CheckpointMapping SourceTensors;
    CheckpointMapping Converted;
};

Tensor expert_slice(const Tensor& stacked, long index) {
    Tensor view = slice(stacked, 0, index, index + 1);
    view.Rank = 2;
    view.Sizes = {stacked.Sizes[1], stacked.Sizes[2]};
    return view;
}

} // namespace

TEST_CASE("verification: faithful conversion passes", "[verification]") {
    const VerifyFixture fixture;
    VerificationOptions options;
    options.ForwardCheck = true;
    const VerificationResult result = fixture.verify(options);
    REQUIRE(result.Failures.empty());
    REQUIRE(result.Status == VerificationStatus::Passed);
    // read, schema, dtypes, experts per layer, forward per layer
    REQUIRE(result.ChecksRun == 3 + 2 * fixture.Config.NumLayers);
}

TEST_CASE("verification: swapped expert slices are detected", "[verification]") {
    VerifyFixture fixture;
    const std::string name = "model.layers.1.mlp.switch_mlp.up_proj.weight";
    const Tensor& stacked = fixture.Converted.at(name);

    std::vector<Tensor> parts;
    std::vector<std::string> names;
    for (long e = 0; e < stacked.Sizes[0]; ++e) {
        const long from = e == 0 ? 1 : (e == 1 ? 0 : e);
        parts.push_back(expert_slice(stacked, from));
        names.push_back(std::to_string(e));
    }
    fixture.rewrite(name, stack_tensors(parts, names, name));

    const VerificationResult result = fixture.verify();
    REQUIRE(result.Status == VerificationStatus::Failed);
    REQUIRE(result.Failures.size() == 2);
    REQUIRE(result.Failures[0].find("slice 0 does not equal padded source expert 0") != std::string::npos);
}

TEST_CASE("verification: renamed tensor that differs from its source fails", "[verification]") {
    VerifyFixture fixture;
    const std::string name = "model.layers.0.post_attention_layernorm.weight";
    fixture.rewrite(name, random_tensor(ETensorDType::FP32, {fixture.Config.HiddenSize}, 999));

    const VerificationResult result = fixture.verify();
    REQUIRE(result.Status == VerificationStatus::Failed);
    REQUIRE(result.Failures.size() == 1);
    REQUIRE(result.Failures[0].find(name) != std::string::npos);
}

TEST_CASE("verification: dtype drift is reported", "[verification]") {
    VerifyFixture fixture;
    const std::string name = "model.norm.weight";
    fixture.rewrite(name, random_tensor(ETensorDType::BF16, {fixture.Config.HiddenSize}, 3));

    const VerificationResult result = fixture.verify();
    REQUIRE(result.Status == VerificationStatus::Failed);
    REQUIRE(result.Failures[0].find("dtype") != std::string::npos);
}

TEST_CASE("verification: expired deadline is inconclusive", "[verification]") {
    const VerifyFixture fixture;
    VerificationOptions options;
    options.Timeout = std::chrono::milliseconds{0};
    const VerificationResult result = fixture.verify(options);
    REQUIRE(result.Status == VerificationStatus::Inconclusive);
    REQUIRE(result.ChecksRun == 0);
    REQUIRE_FALSE(result.InconclusiveReason.empty());
    REQUIRE(verification_status_name(result.Status) == "inconclusive");
}

TEST_CASE("verification: unreadable output fails without throwing", "[verification]") {
    const VerifyFixture fixture;
    std::ofstream(fixture.Dir.file("weights.safetensors"), std::ios::trunc) << "xy";
    const VerificationResult result = fixture.verify();
    REQUIRE(result.Status == VerificationStatus::Failed);
    REQUIRE(result.ChecksRun == 0);
}

TEST_CASE("verification: reference hashes", "[verification][hashes]") {
    const VerifyFixture fixture;
    nlohmann::json hashes = compute_tensor_hashes(fixture.Converted);
    REQUIRE(hashes.size() == fixture.Converted.size());

    VerificationOptions options;
    options.ReferenceHashesFile = fixture.Dir.file("hashes.json");

    SECTION("matching hashes pass") {
        write_json(options.ReferenceHashesFile, hashes);
        REQUIRE(fixture.verify(options).passed());
    }

    SECTION("a differing hash fails and names the tensor") {
        hashes["model.norm.weight"] = "0000000000000000";
        write_json(options.ReferenceHashesFile, hashes);
        const VerificationResult result = fixture.verify(options);
        REQUIRE(result.Status == VerificationStatus::Failed);
        REQUIRE(result.Failures.size() == 1);
        REQUIRE(result.Failures[0].find("model.norm.weight") != std::string::npos);
    }
}

TEST_CASE("verification: padded expert computes the same SwiGLU output", "[verification][forward]") {
    const long hidden = 6;
    const long routed = 10;
    const long unified = 16;
    for (int axis : {0, 1}) {
        auto shape = [&](long out, long in) {
            return axis == 0 ? std::vector<long>{out, in} : std::vector<long>{in, out};
        };
        ExpertWeights expert;
        expert.Gate = random_tensor(ETensorDType::FP32, shape(routed, hidden), 1);
        expert.Up = random_tensor(ETensorDType::FP32, shape(routed, hidden), 2);
        expert.Down = random_tensor(ETensorDType::FP32, shape(hidden, routed), 3);
        const ExpertWeights padded = pad_expert(expert, unified, axis);

        const int tokens = 3;
        const std::vector<float> inputs = uniform_host(tokens * hidden, -2.0f, 2.0f, 77);
        const auto reference = swiglu_forward(expert.Gate, expert.Up, expert.Down, inputs, tokens, axis);
        const auto result = swiglu_forward(padded.Gate, padded.Up, padded.Down, inputs, tokens, axis);
        REQUIRE(reference.size() == static_cast<std::size_t>(tokens * hidden));
        for (std::size_t i = 0; i < reference.size(); ++i) {
            REQUIRE_THAT(result[i], Catch::Matchers::WithinAbs(reference[i], 1e-6));
        }
    }
}

TEST_CASE("verification: pipeline reports a failed check and keeps the output", "[verification][pipeline]") {
    const ArchitectureConfig cfg = small_config();
    TempDir dir;
    write_checkpoint(make_source_checkpoint(cfg), dir.file("source.safetensors"));
    write_json(dir.file("config.json"), config_to_json(cfg));
    write_json(dir.file("hashes.json"), {{"model.norm.weight", "ffffffffffffffff"}});

    PipelineOptions options;
    options.SourcePath = dir.file("source.safetensors");
    options.TargetPath = dir.file("out/model.safetensors");
    options.ConfigPath = dir.file("config.json");
    options.Verification.ReferenceHashesFile = dir.file("hashes.json");

    ConversionLogger logger("", ConversionLogger::QUIET);
    const PipelineResult result = run_pipeline(options, logger);
    REQUIRE(result.Verification.has_value());
    REQUIRE(result.Verification->Status == VerificationStatus::Failed);
    REQUIRE(std::filesystem::exists(dir.file("out/model.safetensors")));
    REQUIRE(std::filesystem::exists(dir.file("out/config.json")));
}
