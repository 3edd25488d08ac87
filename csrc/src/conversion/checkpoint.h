// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef REMORA_SRC_CONVERSION_CHECKPOINT_H
#define REMORA_SRC_CONVERSION_CHECKPOINT_H

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "modules/weights/tensor_key.h"
#include "utilities/tensor.h"

namespace remora {

class BaseWeightMapping;

/**
 * @brief Name-ordered set of tensors making up one checkpoint.
 *
 * Names are unique; iteration is in lexicographic name order, which is also the order
 * the writer serializes them in.
 */
class CheckpointMapping {
public:
    /**
     * @brief Add a tensor.
     *
     * @throws remora::FormatError if @p name is already present.
     */
    void insert(const std::string& name, Tensor tensor);

    /**
     * @brief Move all tensors of @p other into this mapping.
     *
     * @throws remora::FormatError on the first duplicate name.
     */
    void merge(CheckpointMapping&& other);

    bool erase(const std::string& name);

    [[nodiscard]] bool contains(const std::string& name) const { return mTensors.contains(name); }
    [[nodiscard]] const Tensor* find(const std::string& name) const;

    /**
     * @throws std::out_of_range if @p name is absent.
     */
    [[nodiscard]] const Tensor& at(const std::string& name) const;

    [[nodiscard]] std::size_t size() const { return mTensors.size(); }
    [[nodiscard]] bool empty() const { return mTensors.empty(); }
    [[nodiscard]] const std::map<std::string, Tensor>& tensors() const { return mTensors; }

    //! Most common dtype among the tensors (by element count), FP32 if empty.
    [[nodiscard]] ETensorDType dominant_dtype() const;

private:
    std::map<std::string, Tensor> mTensors;
};

/**
 * @brief Read-only view of a checkpoint through a naming schema.
 *
 * Resolves keys to names and records which names were consumed, so that source tensors
 * no stage used can be reported afterwards.
 */
class SchemaLookup {
public:
    SchemaLookup(const CheckpointMapping& checkpoint, const BaseWeightMapping& schema);

    /**
     * @brief Tensor for @p key.
     *
     * @throws remora::FormatError naming the key and its concrete name if the tensor is absent.
     * @throws remora::ConfigMismatch if the schema has no entry for @p key.
     */
    const Tensor& require(const TensorKey& key, std::string_view stage);

    /**
     * @brief Tensor for @p key, or nullptr if the schema does not declare it or the checkpoint lacks it.
     */
    const Tensor* find(const TensorKey& key);

    //! Concrete name of @p key; `<undeclared ...>` if the schema has no entry.
    [[nodiscard]] std::string name(const TensorKey& key) const;

    [[nodiscard]] const std::set<std::string>& consumed() const { return mConsumed; }

private:
    const CheckpointMapping& mCheckpoint;
    const BaseWeightMapping& mSchema;
    std::set<std::string> mConsumed;
};

/**
 * @brief Load a SafeTensors checkpoint (file, sharded index or directory) into memory.
 *
 * @throws remora::FormatError on malformed archives, remora::IOError on unreadable files.
 */
CheckpointMapping read_checkpoint(const std::string& path);

/**
 * @brief Where a converted checkpoint and its companion files go.
 *
 * A target ending in `.safetensors` names the weights file itself; any other target is a
 * directory receiving `weights.safetensors`.
 */
struct OutputPaths {
    std::string Directory;
    std::string WeightsFile;
    std::string ConfigFile;
    std::string MappingInfoFile;
};

OutputPaths resolve_output_paths(const std::string& target);

/**
 * @brief Serialize @p checkpoint to @p file_name atomically.
 *
 * @throws remora::IOError on write failures; the final path is left untouched.
 */
void write_checkpoint(const CheckpointMapping& checkpoint, const std::string& file_name,
                      const std::map<std::string, std::string>& metadata = {});

/**
 * @brief Write @p value as indented JSON through a temporary file and rename.
 *
 * @throws remora::IOError on write failures.
 */
void write_json_atomic(const std::string& file_name, const nlohmann::json& value);

/**
 * @brief Copy @p source unchanged into @p directory (keeping its file name), atomically.
 *
 * @throws remora::IOError if the file cannot be read or written.
 */
void copy_file_atomic(const std::string& source, const std::string& directory);

} // namespace remora

#endif // REMORA_SRC_CONVERSION_CHECKPOINT_H
