// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef REMORA_SRC_UTILS_SAFETENSORS_H
#define REMORA_SRC_UTILS_SAFETENSORS_H

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "tensor.h"

class MappedFile;

/**
 * @brief One tensor entry of a SafeTensors archive: name, dtype, shape and the
 * byte range of its data inside the (memory mapped) backing file.
 */
class SafeTensorEntry {
public:
    SafeTensorEntry(const std::string& name, const std::vector<long>& shape, ETensorDType dtype,
                    std::shared_ptr<MappedFile> file, std::ptrdiff_t data_begin, std::ptrdiff_t data_end);

    [[nodiscard]] const std::string& name() const { return mName; }
    [[nodiscard]] const std::vector<long>& shape() const { return mShape; }
    [[nodiscard]] ETensorDType dtype() const { return mDType; }
    [[nodiscard]] const std::string& file_name() const;

    //! Copy the entry's bytes into a freshly allocated host tensor.
    [[nodiscard]] Tensor read() const;

private:
    std::string mName;
    std::vector<long> mShape;
    ETensorDType mDType;
    std::shared_ptr<MappedFile> mFile;
    std::ptrdiff_t mDataBegin;
    std::ptrdiff_t mDataEnd;
};

/**
 * @brief Reader for a single `.safetensors` file, a HF-style `.index.json` of shards,
 * or a directory containing either.
 *
 * The header is validated completely on construction; any inconsistency (truncated
 * file, malformed JSON, offsets outside the data section, byte counts that do not
 * match dtype and shape, duplicate names across shards) raises remora::FormatError.
 */
class SafeTensorsReader {
public:
    explicit SafeTensorsReader(const std::string& file_name);

    [[nodiscard]] const std::vector<SafeTensorEntry>& entries() const { return mEntries; }
    [[nodiscard]] const SafeTensorEntry& find_entry(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const;

    //! Contents of `__metadata__` across all shards (string values only).
    [[nodiscard]] const std::map<std::string, std::string>& metadata() const { return mMetadata; }

private:
    void parse_single_file(const std::string& file_path);
    void parse_index_file(const std::string& index_file);

    std::vector<SafeTensorEntry> mEntries;
    std::map<std::string, std::string> mMetadata;
};

/**
 * @brief Writer producing a single `.safetensors` file.
 *
 * Usage: register_tensor() for every tensor, prepare_metadata(), write_tensor() for every
 * registered tensor, finalize(). All data goes to `<file>.tmp`, which is flushed to disk and
 * renamed over the final path by finalize(). If the writer is destroyed before finalize()
 * completed, the temporary file is removed and the final path is left untouched.
 *
 * The header lists tensors in lexicographic order and data blocks follow that order, so the
 * output depends only on the registered names, dtypes, shapes and bytes.
 */
class SafeTensorWriter {
public:
    explicit SafeTensorWriter(std::string file_name);
    ~SafeTensorWriter();
    SafeTensorWriter(const SafeTensorWriter&) = delete;
    SafeTensorWriter& operator=(const SafeTensorWriter&) = delete;

    void register_tensor(const std::string& name, const Tensor& tensor);
    void prepare_metadata(const std::map<std::string, std::string>& extra_metadata = {});
    void write_tensor(const std::string& name, const Tensor& tensor);
    void finalize();

    [[nodiscard]] const std::string& file_name() const { return mFileName; }

private:
    struct sRegisteredTensor {
        ETensorDType DType;
        std::vector<long> Shape;
        long Begin;
        long Size;
        bool Done = false;
    };

    void discard_temp_file() noexcept;

    std::string mFileName;
    std::map<std::string, sRegisteredTensor> mRegisteredTensors;
    bool mMetaFinalized = false;
    int mFileDescriptor = -1;
    std::byte* mMappedFile = nullptr;
    std::size_t mTotalSize = 0;
    std::size_t mHeaderSize = 0;
};

/// Write @p tensors (name-ordered) into @p file_name atomically.
void write_safetensors(const std::string& file_name, const std::map<std::string, Tensor>& tensors,
                       const std::map<std::string, std::string>& extra_metadata = {});

#endif //REMORA_SRC_UTILS_SAFETENSORS_H
