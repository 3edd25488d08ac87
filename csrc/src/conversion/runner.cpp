// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "conversion/runner.h"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include "conversion/logging.h"
#include "utilities/errors.h"

namespace remora {

std::optional<int> ConversionRunner::load_options(int argc, const char** argv) {
    CLI::App app{"Convert a DeepSeek-style MoE training checkpoint to the MLX runtime layout"};

    app.add_option("source", Options.SourcePath, "Source checkpoint (.safetensors file, sharded index or directory)")
        ->required();
    app.add_option("target", Options.TargetPath, "Output directory, or output .safetensors file")->required();
    app.add_option("config", Options.ConfigPath, "Architecture config (JSON)")->required()->check(CLI::ExistingFile);

    app.add_option("--schema", Options.SchemaPath, "Naming schema overrides (JSON with \"source\"/\"target\" sections)")
        ->check(CLI::ExistingFile);
    app.add_option("--threads", Options.Threads, "Worker threads for layer conversion (0 = all cores)")
        ->check(CLI::NonNegativeNumber);
    app.add_flag("--strict", Options.Strict, "Fail on source tensors no conversion stage uses");
    app.add_option("--report", Options.ReportPath, "Write the conversion report as JSON");
    app.add_option("--log", LogFile, "Write a JSON log of the run");
    app.add_option("--copy", Options.CopyFiles, "Files copied unchanged next to the output (e.g. tokenizer files)");

    app.add_flag("--verify,!--no-verify", Options.Verify, "Re-read and verify the output after writing");
    app.add_flag("--forward-check", Options.Verification.ForwardCheck,
                 "Compare padded and unpadded expert outputs on random inputs during verification");
    app.add_option("--forward-tolerance", Options.Verification.Tolerance, "Relative tolerance of the forward check")
        ->check(CLI::PositiveNumber);
    app.add_option("--reference-hashes", Options.Verification.ReferenceHashesFile,
                   "JSON of expected per-tensor FNV-1a hashes")->check(CLI::ExistingFile);
    app.add_option("--emit-hashes", Options.EmitHashesPath, "Write per-tensor FNV-1a hashes of the output");
    app.add_option("--verify-timeout", VerifyTimeout, "Seconds after which verification stops as inconclusive")
        ->check(CLI::Range(0.0, MAX_VERIFY_TIMEOUT_SECONDS));

    auto quiet = app.add_flag("-q,--quiet", Quiet, "Only print warnings and errors");
    app.add_flag("-v,--verbose", Verbose, "Print informational report entries and details")->excludes(quiet);

    try {
        app.parse(argc, argv);
        // NaN passes every range comparison
        if (std::isnan(VerifyTimeout)) {
            throw CLI::ValidationError("--verify-timeout", "must be a number of seconds");
        }
    } catch (const CLI::ParseError& e) {
        const int code = app.exit(e);
        return code == 0 ? 0 : EXIT_USAGE;
    }

    if (VerifyTimeout >= 0.0) {
        Options.Verification.Timeout = std::chrono::milliseconds(std::llround(VerifyTimeout * 1000.0));
    }
    return std::nullopt;
}

int ConversionRunner::run(int argc, const char** argv) {
    const auto verbosity = Quiet ? ConversionLogger::QUIET
                                 : (Verbose ? ConversionLogger::VERBOSE : ConversionLogger::DEFAULT);
    ConversionLogger logger(LogFile, verbosity);
    logger.log_cmd(argc, argv);
    logger.log_options({
        {"source", Options.SourcePath},
        {"target", Options.TargetPath},
        {"config", Options.ConfigPath},
        {"schema", Options.SchemaPath},
        {"threads", static_cast<std::int64_t>(Options.Threads)},
        {"strict", Options.Strict},
        {"verify", Options.Verify},
        {"forward-check", Options.Verification.ForwardCheck},
    });

    PipelineResult result;
    try {
        result = run_pipeline(Options, logger);
    } catch (const ConversionError& e) {
        logger.log_error(e.stage(), e.tensor(), e.what());
        return EXIT_CONVERSION_FAILED;
    }

    if (!result.Verification) {
        return EXIT_SUCCESS;
    }
    switch (result.Verification->Status) {
    case VerificationStatus::Passed:
        logger.log_message(fmt::format("Verification passed ({} checks)", result.Verification->ChecksRun));
        return EXIT_SUCCESS;
    case VerificationStatus::Inconclusive:
        logger.log_warning(fmt::format("Verification inconclusive: {}", result.Verification->InconclusiveReason));
        return EXIT_SUCCESS;
    case VerificationStatus::Failed:
        break;
    }
    logger.log_error("verify", result.Output.WeightsFile,
                     fmt::format("Verification failed with {} problem(s); the output was kept",
                                 result.Verification->Failures.size()));
    return EXIT_VERIFICATION_FAILED;
}

int run_converter(int argc, const char** argv) {
    try {
        ConversionRunner runner;
        if (auto code = runner.load_options(argc, argv)) {
            return *code;
        }
        return runner.run(argc, argv);
    } catch (const std::exception& e) {
        ::fprintf(stderr, "ERROR: %s\n", e.what());
        fflush(stderr);
        return EXIT_CONVERSION_FAILED;
    }
}

} // namespace remora
