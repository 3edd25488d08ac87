// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Weight Schema - expected tensors of a converted checkpoint
//
// The schema is derived from two inputs only: the declared architecture and the
// target naming schema. For every entry the target mapping declares, it states
// the concrete tensor name, the shape the runtime expects and whether the tensor
// is required. A converted checkpoint is accepted only if it matches exactly:
// every required tensor present with the expected shape and nothing else.

#ifndef REMORA_SRC_MODULES_WEIGHTS_WEIGHT_SCHEMA_H
#define REMORA_SRC_MODULES_WEIGHTS_WEIGHT_SCHEMA_H

#include <map>
#include <string>
#include <vector>

#include "modules/weights/tensor_key.h"
#include "utilities/tensor.h"

namespace remora {

struct ArchitectureConfig;
class BaseWeightMapping;

/**
 * @brief Requirement level for a weight tensor
 */
enum class WeightRequirement {
    Required,       ///< Weight must be present
    Optional,       ///< Weight may be present
};

/**
 * @brief Specification for a single tensor of the converted checkpoint
 */
struct TensorSpec {
    std::string name;                   ///< Concrete tensor name
    TensorKey key;                      ///< Concrete key (layer index filled in)
    std::vector<long> shape;            ///< Expected shape
    WeightRequirement requirement = WeightRequirement::Required;

    [[nodiscard]] long nelem() const {
        long n = 1;
        for (long dim : shape) n *= dim;
        return n;
    }
};

/**
 * @brief All tensors a converted checkpoint must consist of.
 */
class CheckpointSchema {
public:
    void add(TensorSpec spec);

    [[nodiscard]] const TensorSpec* find(const std::string& name) const;
    [[nodiscard]] const std::vector<TensorSpec>& tensors() const { return mTensors; }
    [[nodiscard]] std::size_t size() const { return mTensors.size(); }

private:
    std::vector<TensorSpec> mTensors;
    std::map<std::string, std::size_t> mIndex;
};

/**
 * @brief Expected shape of the tensor identified by @p key under @p config.
 *
 * Rank-2 projections follow the configured weight layout; stacked expert tensors carry
 * the expert count as leading axis; biases and norm scales are rank 1.
 *
 * @throws remora::ConfigMismatch if there is no shape rule for @p key.
 */
std::vector<long> expected_shape(const ArchitectureConfig& config, const TensorKey& key);

/**
 * @brief Expand the target mapping over all layers into a concrete checkpoint schema.
 *
 * @throws remora::ConfigMismatch if the target declares per-expert tensors or a key
 *         without a shape rule.
 */
CheckpointSchema describe_target_schema(const ArchitectureConfig& config, const BaseWeightMapping& target);

// ============================================================================
// Schema Validation
// ============================================================================

struct SchemaViolation {
    std::string tensor;
    std::string message;
};

/**
 * @brief Result of schema validation
 */
struct ValidationResult {
    bool success = true;
    std::vector<SchemaViolation> errors;

    void add_error(std::string tensor, std::string message) {
        success = false;
        errors.push_back({std::move(tensor), std::move(message)});
    }

    [[nodiscard]] std::string format() const;
};

/**
 * @brief Compare a set of tensors against @p schema without throwing.
 *
 * Reports missing required tensors, shape mismatches (actual vs. expected) and tensors the
 * schema does not contain. Errors are ordered by tensor name.
 */
ValidationResult check_against_schema(const std::map<std::string, Tensor>& tensors, const CheckpointSchema& schema);

/**
 * @brief Throw the first violation of @p result, if any.
 *
 * @throws remora::ConfigMismatch naming the tensor; the message also counts any further violations.
 */
void throw_on_violation(const ValidationResult& result);

/**
 * @brief Check the config, then the tensors, against the target schema.
 *
 * @throws remora::ConfigMismatch for the first violation, naming the tensor with actual
 *         and expected shape; the message also counts any further violations.
 */
void validate_against_schema(const std::map<std::string, Tensor>& tensors, const ArchitectureConfig& config,
                             const BaseWeightMapping& target);

} // namespace remora

#endif // REMORA_SRC_MODULES_WEIGHTS_WEIGHT_SCHEMA_H
