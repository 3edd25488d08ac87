// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef REMORA_SRC_CONVERSION_PIPELINE_H
#define REMORA_SRC_CONVERSION_PIPELINE_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "conversion/checkpoint.h"
#include "conversion/conversion_report.h"
#include "conversion/layer_converter.h"
#include "conversion/verification.h"

namespace remora {

class ConversionLogger;

struct PipelineOptions {
    std::string SourcePath;
    std::string TargetPath;
    std::string ConfigPath;
    std::string SchemaPath;                 ///< optional naming schema overrides
    std::string ReportPath;                 ///< optional JSON report
    std::string EmitHashesPath;             ///< optional reference hash output
    std::vector<std::string> CopyFiles;     ///< copied unchanged next to the output
    int Threads = 0;
    bool Strict = false;
    bool Verify = true;
    VerificationOptions Verification;
};

/**
 * @brief In-memory result of a conversion, validated against the target schema.
 */
struct ConversionResult {
    CheckpointMapping Tensors;
    ConversionReport Report;
    bool Passthrough = false;       ///< the source already used target names
};

struct PipelineResult {
    ConversionReport Report;
    OutputPaths Output;
    std::size_t TensorCount = 0;
    bool Passthrough = false;
    std::optional<VerificationResult> Verification;
};

/**
 * @brief Convert @p source into the target schema without touching the filesystem.
 *
 * Layers are converted concurrently by `ctx.Threads` workers; results and report entries
 * are assembled in layer order, so the output does not depend on the thread count.
 *
 * @throws remora::ConversionError subclasses on any fatal condition.
 */
ConversionResult convert_checkpoint(const ConversionContext& ctx, const CheckpointMapping& source);

/**
 * @brief Summary written to `weight_mapping_info.json`.
 */
nlohmann::json mapping_info_json(const ConversionContext& ctx, const std::string& source_path,
                                 const ConversionResult& result);

/**
 * @brief Full run: load config and checkpoint, convert, write, optionally verify.
 *
 * Nothing is written unless conversion and validation succeed. A failed verification is
 * returned in the result; the written output is kept.
 *
 * @throws remora::ConversionError subclasses on any fatal condition.
 */
PipelineResult run_pipeline(const PipelineOptions& options, ConversionLogger& logger);

} // namespace remora

#endif // REMORA_SRC_CONVERSION_PIPELINE_H
