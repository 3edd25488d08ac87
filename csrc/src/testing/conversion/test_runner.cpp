// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/architecture_config.h"
#include "conversion/checkpoint.h"
#include "conversion/runner.h"
#include "test_utils.h"

using namespace remora;
using namespace testing_utils;

namespace {

//! Source checkpoint and config on disk, plus argv assembly for the command line.
struct CommandLine {
    explicit CommandLine(CheckpointMapping source = make_source_checkpoint(small_config())) {
        write_checkpoint(source, Dir.file("source.safetensors"));
        write_json(Dir.file("config.json"), config_to_json(small_config()));
    }

    int run(const std::vector<std::string>& extra) const {
        std::vector<std::string> args = {"remora", Dir.file("source.safetensors"), Dir.file("out"),
                                         Dir.file("config.json"), "-q"};
        args.insert(args.end(), extra.begin(), extra.end());
        std::vector<const char*> argv;
        for (const auto& arg : args) argv.push_back(arg.c_str());
        return run_converter(static_cast<int>(argv.size()), argv.data());
    }

    [[nodiscard]] bool wrote_output() const { return std::filesystem::exists(Dir.file("out")); }

    TempDir Dir;
};

} // namespace

TEST_CASE("command line: successful conversion exits with zero", "[cli]") {
    const CommandLine cli;
    REQUIRE(cli.run({"--threads", "2", "--forward-check"}) == 0);
    REQUIRE(std::filesystem::exists(cli.Dir.file("out/weights.safetensors")));
}

TEST_CASE("command line: usage errors exit with two", "[cli][errors]") {
    const CommandLine cli;

    SECTION("missing positional") {
        const char* argv[] = {"remora", "only-source.safetensors"};
        REQUIRE(run_converter(2, argv) == EXIT_USAGE);
    }
    SECTION("negative thread count") {
        REQUIRE(cli.run({"--threads", "-1"}) == EXIT_USAGE);
    }
    SECTION("verification timeout beyond the accepted range") {
        REQUIRE(cli.run({"--verify-timeout", "1e300"}) == EXIT_USAGE);
    }
    SECTION("verification timeout that is not a number") {
        REQUIRE(cli.run({"--verify-timeout", "nan"}) == EXIT_USAGE);
    }
    REQUIRE_FALSE(cli.wrote_output());
}

TEST_CASE("command line: strict mode turns unused source tensors into a failure", "[cli][strict]") {
    CheckpointMapping source = make_source_checkpoint(small_config());
    source.insert("optimizer.step", make_tensor(ETensorDType::FP32, {1}, {7.0f}));
    const CommandLine cli(source);

    SECTION("strict") {
        REQUIRE(cli.run({"--strict"}) == EXIT_CONVERSION_FAILED);
        REQUIRE_FALSE(cli.wrote_output());
    }
    SECTION("lenient") {
        REQUIRE(cli.run({}) == 0);
        REQUIRE(cli.wrote_output());
    }
}

TEST_CASE("command line: failed verification exits with three and keeps the output", "[cli][verification]") {
    const CommandLine cli;
    write_json(cli.Dir.file("hashes.json"), {{"model.norm.weight", "ffffffffffffffff"}});
    REQUIRE(cli.run({"--reference-hashes", cli.Dir.file("hashes.json")}) == EXIT_VERIFICATION_FAILED);
    REQUIRE(std::filesystem::exists(cli.Dir.file("out/weights.safetensors")));
}

TEST_CASE("command line: verification timeout is parsed into milliseconds", "[cli]") {
    const CommandLine cli;
    const std::string source = cli.Dir.file("source.safetensors");
    const std::string target = cli.Dir.file("out");
    const std::string config = cli.Dir.file("config.json");
    const char* argv[] = {"remora", source.c_str(), target.c_str(), config.c_str(), "--verify-timeout", "1.5"};

    ConversionRunner runner;
    REQUIRE_FALSE(runner.load_options(6, argv).has_value());
    REQUIRE(runner.Options.Verification.Timeout == std::chrono::milliseconds(1500));
}
