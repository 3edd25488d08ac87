// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Verification Pass - re-reads a written checkpoint and checks it against the
// target schema and the source it was converted from.

#ifndef REMORA_SRC_CONVERSION_VERIFICATION_H
#define REMORA_SRC_CONVERSION_VERIFICATION_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "conversion/checkpoint.h"
#include "conversion/layer_converter.h"

namespace remora {

enum class VerificationStatus {
    Passed,
    Failed,
    Inconclusive,       ///< the deadline expired before every check ran
};

std::string_view verification_status_name(VerificationStatus status);

struct VerificationOptions {
    bool ForwardCheck = false;                      ///< compare SwiGLU outputs of padded and unpadded experts
    std::string ReferenceHashesFile;                ///< optional JSON `name -> FNV-1a hex`
    std::optional<std::chrono::milliseconds> Timeout;
    float Tolerance = 1e-3f;                        ///< relative to the largest reference output
    int ForwardTokens = 4;                          ///< random inputs per expert
    std::uint32_t Seed = 1234;
};

struct VerificationResult {
    VerificationStatus Status = VerificationStatus::Passed;
    std::vector<std::string> Failures;
    int ChecksRun = 0;
    std::string InconclusiveReason;

    [[nodiscard]] bool passed() const { return Status == VerificationStatus::Passed; }
};

/**
 * @brief Verify the checkpoint written to @p file_name.
 *
 * Checks, in order and each only if the deadline has not passed:
 * 1. the file parses and matches the target schema (names and shapes)
 * 2. dtypes match the source tensors they were derived from
 * 3. renamed tensors are bit-identical to their source
 * 4. per layer, stacked expert slice i equals the padded source expert i and the
 *    padded region is zero
 * 5. optional reference hashes
 * 6. optional forward check of every routed expert
 *
 * When @p passthrough is set, the source already used target names and every output
 * tensor must be bit-identical to the source tensor of the same name instead of 3 and 4.
 *
 * Failures are collected, never thrown. The written file is never modified.
 */
VerificationResult verify_checkpoint(const std::string& file_name, const ConversionContext& ctx,
                                     const CheckpointMapping& source, bool passthrough,
                                     const VerificationOptions& options);

/**
 * @brief FNV-1a 64 hashes (lower-case hex) of the raw bytes of every tensor.
 */
nlohmann::json compute_tensor_hashes(const CheckpointMapping& checkpoint);

/**
 * @brief Forward output of one SwiGLU expert, `down(silu(gate x) * up x)`, for each input row.
 *
 * @param inputs `tokens x hidden` values, row-major.
 * @param output_axis Axis of the output features in the projection matrices.
 *
 * @return `tokens x hidden` values, row-major.
 */
std::vector<float> swiglu_forward(const Tensor& gate, const Tensor& up, const Tensor& down,
                                  const std::vector<float>& inputs, int tokens, int output_axis);

} // namespace remora

#endif // REMORA_SRC_CONVERSION_VERIFICATION_H
