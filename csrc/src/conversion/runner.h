// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef REMORA_SRC_CONVERSION_RUNNER_H
#define REMORA_SRC_CONVERSION_RUNNER_H

#include <optional>
#include <string>

#include "conversion/pipeline.h"

namespace remora {

constexpr int EXIT_CONVERSION_FAILED = 1;
constexpr int EXIT_USAGE = 2;
constexpr int EXIT_VERIFICATION_FAILED = 3;

/// Longest accepted `--verify-timeout`, in seconds.
constexpr double MAX_VERIFY_TIMEOUT_SECONDS = 7 * 24 * 3600.0;

/**
 * @brief Command line front end of the converter.
 */
struct ConversionRunner {
    PipelineOptions Options;
    std::string LogFile;
    bool Quiet = false;
    bool Verbose = false;
    double VerifyTimeout = -1.0;

    /**
     * @brief Parse the command line into Options.
     *
     * @return The exit code when the process should stop here (help requested or a usage
     *         error, which CLI11 has already printed), std::nullopt otherwise.
     */
    std::optional<int> load_options(int argc, const char** argv);

    /// Run the pipeline; returns 0, EXIT_CONVERSION_FAILED or EXIT_VERIFICATION_FAILED.
    int run(int argc, const char** argv);
};

/**
 * @brief Parse, convert and verify; the whole `remora` command.
 */
int run_converter(int argc, const char** argv);

} // namespace remora

#endif //REMORA_SRC_CONVERSION_RUNNER_H
