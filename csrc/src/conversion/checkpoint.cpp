// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "conversion/checkpoint.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <fmt/core.h>

#include "modules/weights/weight_mapping.h"
#include "utilities/errors.h"
#include "utilities/safetensors.h"

namespace remora {

void CheckpointMapping::insert(const std::string& name, Tensor tensor) {
    auto [it, inserted] = mTensors.emplace(name, std::move(tensor));
    if (!inserted) {
        throw FormatError("assemble", name, "tensor name is not unique");
    }
}

void CheckpointMapping::merge(CheckpointMapping&& other) {
    for (auto& [name, tensor] : other.mTensors) {
        insert(name, std::move(tensor));
    }
    other.mTensors.clear();
}

bool CheckpointMapping::erase(const std::string& name) {
    return mTensors.erase(name) > 0;
}

const Tensor* CheckpointMapping::find(const std::string& name) const {
    auto it = mTensors.find(name);
    return it == mTensors.end() ? nullptr : &it->second;
}

const Tensor& CheckpointMapping::at(const std::string& name) const {
    auto it = mTensors.find(name);
    if (it == mTensors.end()) {
        throw std::out_of_range(fmt::format("Tensor not found: {}", name));
    }
    return it->second;
}

ETensorDType CheckpointMapping::dominant_dtype() const {
    std::map<ETensorDType, std::size_t> counts;
    for (const auto& [name, tensor] : mTensors) {
        counts[tensor.DType] += tensor.nelem();
    }
    ETensorDType best = ETensorDType::FP32;
    std::size_t best_count = 0;
    for (const auto& [dtype, count] : counts) {
        if (count > best_count) {
            best = dtype;
            best_count = count;
        }
    }
    return best;
}

SchemaLookup::SchemaLookup(const CheckpointMapping& checkpoint, const BaseWeightMapping& schema)
    : mCheckpoint(checkpoint), mSchema(schema) {
}

const Tensor& SchemaLookup::require(const TensorKey& key, std::string_view stage) {
    const std::string tensor_name = mSchema.require_name(key);
    const Tensor* tensor = mCheckpoint.find(tensor_name);
    if (!tensor) {
        throw FormatError(std::string(stage), tensor_name,
                          fmt::format("required {} tensor for key `{}` is missing", mSchema.schema_name(), key.to_string()));
    }
    mConsumed.insert(tensor_name);
    return *tensor;
}

const Tensor* SchemaLookup::find(const TensorKey& key) {
    auto tensor_name = mSchema.name_for(key);
    if (!tensor_name) return nullptr;
    const Tensor* tensor = mCheckpoint.find(*tensor_name);
    if (tensor) mConsumed.insert(*tensor_name);
    return tensor;
}

std::string SchemaLookup::name(const TensorKey& key) const {
    if (auto tensor_name = mSchema.name_for(key)) return *tensor_name;
    return fmt::format("<undeclared {}>", key.to_string());
}

CheckpointMapping read_checkpoint(const std::string& path) {
    SafeTensorsReader reader(path);
    CheckpointMapping result;
    for (const auto& entry : reader.entries()) {
        result.insert(entry.name(), entry.read());
    }
    return result;
}

OutputPaths resolve_output_paths(const std::string& target) {
    namespace fs = std::filesystem;
    OutputPaths paths;
    fs::path weights;
    fs::path directory;
    if (target.ends_with(".safetensors")) {
        weights = fs::path(target);
        directory = weights.parent_path();
    } else {
        directory = fs::path(target);
        weights = directory / "weights.safetensors";
    }
    paths.Directory = directory.string();
    paths.WeightsFile = weights.string();
    paths.ConfigFile = (directory / "config.json").string();
    paths.MappingInfoFile = (directory / "weight_mapping_info.json").string();
    return paths;
}

void write_checkpoint(const CheckpointMapping& checkpoint, const std::string& file_name,
                      const std::map<std::string, std::string>& metadata) {
    try {
        write_safetensors(file_name, checkpoint.tensors(), metadata);
    } catch (const std::logic_error& e) {
        // writer misuse never leaves a file behind, but still surfaces as a write failure
        throw IOError("write", file_name, e.what());
    }
}

namespace {

/**
 * @brief Temporary sibling of a final path, removed on destruction unless committed.
 */
class TempFile {
public:
    explicit TempFile(std::string final_name) : mFinal(std::move(final_name)), mTemp(mFinal + ".tmp") {
        std::filesystem::path parent = std::filesystem::path(mFinal).parent_path();
        std::error_code ec;
        if (!parent.empty()) std::filesystem::create_directories(parent, ec);
        if (ec) throw IOError("write", parent.string(), "cannot create output directory: " + ec.message());
    }
    ~TempFile() {
        if (!mCommitted) {
            std::error_code ec;
            std::filesystem::remove(mTemp, ec);
        }
    }
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    [[nodiscard]] const std::string& path() const { return mTemp; }

    void commit() {
        std::error_code ec;
        std::filesystem::rename(mTemp, mFinal, ec);
        if (ec) throw IOError("write", mFinal, "cannot move temporary file into place: " + ec.message());
        mCommitted = true;
    }

private:
    std::string mFinal;
    std::string mTemp;
    bool mCommitted = false;
};

} // namespace

void write_json_atomic(const std::string& file_name, const nlohmann::json& value) {
    TempFile temp(file_name);
    {
        std::ofstream file(temp.path(), std::ios::out | std::ios::trunc);
        if (!file.is_open()) throw IOError("write", temp.path(), "cannot open file for writing");
        file << value.dump(2) << "\n";
        file.flush();
        if (!file) throw IOError("write", temp.path(), "failed writing JSON");
    }
    temp.commit();
}

void copy_file_atomic(const std::string& source, const std::string& directory) {
    namespace fs = std::filesystem;
    const fs::path destination = fs::path(directory) / fs::path(source).filename();
    if (fs::exists(destination) && fs::equivalent(source, destination)) {
        return;
    }
    TempFile temp(destination.string());
    std::error_code ec;
    fs::copy_file(source, temp.path(), fs::copy_options::overwrite_existing, ec);
    if (ec) throw IOError("copy", source, "cannot copy file: " + ec.message());
    temp.commit();
}

} // namespace remora
