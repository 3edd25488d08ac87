// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "conversion/conversion_report.h"
#include "conversion/logging.h"
#include "utilities/errors.h"
#include "test_utils.h"

using namespace remora;
using namespace testing_utils;

TEST_CASE("report: entries keep their order and count warnings", "[report]") {
    ConversionReport first;
    first.add_info("pad", "a", "padded");
    first.add_precision_warning("strip", "b", "dropped", 2.5, 1.5);

    ConversionReport second;
    second.add_precision_warning("convert", "c", "unused", 1.0, 1.0);

    ConversionReport merged;
    merged.append(first);
    merged.append(second);
    REQUIRE(merged.entries().size() == 3);
    REQUIRE(merged.entries()[2].Tensor == "c");
    REQUIRE(merged.warning_count() == 2);

    const nlohmann::json j = merged.to_json();
    REQUIRE(j["warnings"] == 2);
    REQUIRE(j["entries"][0]["severity"] == "info");
    REQUIRE_FALSE(j["entries"][0].contains("discarded_l2"));
    REQUIRE(j["entries"][1]["discarded_l2"] == 2.5);
    REQUIRE(j["entries"][1]["discarded_max_abs"] == 1.5);
}

TEST_CASE("report: save writes JSON and reports unwritable paths", "[report]") {
    TempDir dir;
    ConversionReport report;
    report.add_info("tie", "lm_head.weight", "copied");
    report.save(dir.file("report.json"));
    REQUIRE(read_json(dir.file("report.json"))["entries"].size() == 1);

    SECTION("a failed save keeps the previous report") {
        std::ofstream(dir.file("blocker")) << "not a directory";
        REQUIRE_THROWS_AS(report.save(dir.file("blocker/report.json")), IOError);

        report.add_info("pad", "h.0.mlp.experts.0.up_proj.weight", "padded");
        report.save(dir.file("report.json"));
        REQUIRE(read_json(dir.file("report.json"))["entries"].size() == 2);
        REQUIRE_FALSE(std::filesystem::exists(dir.file("report.json.tmp")));
    }
}

TEST_CASE("logging: log file stays a valid JSON array", "[logging]") {
    TempDir dir;
    const std::string file = dir.file("logs/run.json");
    std::vector<std::string> lines;
    {
        ConversionLogger logger(file, ConversionLogger::QUIET);
        logger.set_callback([&](std::string_view line) { lines.emplace_back(line); });
        const char* argv[] = {"remora", "in.safetensors", "out"};
        logger.log_cmd(3, argv);
        logger.log_message("hello");
        logger.log_error("merge", "h.0.attn.kv_proj.weight", "bad shape");
        {
            auto section = logger.log_section_start("Writing");
        }
        ConversionReport report;
        report.add_precision_warning("strip", "x", "dropped", 1.0, 1.0);
        logger.log_report(report);
    }

    REQUIRE(lines.size() == 5);
    const nlohmann::json log = read_json(file);
    REQUIRE(log.is_array());
    REQUIRE(log.size() == 5);
    REQUIRE(log[0]["log"] == "cmd");
    REQUIRE(log[2]["log"] == "error");
    REQUIRE(log[2]["tensor"] == "h.0.attn.kv_proj.weight");
    REQUIRE(log[3]["log"] == "section");
    REQUIRE(log[4]["report"]["warnings"] == 1);
}
