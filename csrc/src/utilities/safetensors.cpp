// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "safetensors.h"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <string>
#include <system_error>
#include <unordered_set>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "errors.h"

using remora::FormatError;
using remora::IOError;

namespace {

/// SafeTensors refuses headers above 100MB; so do we.
constexpr std::uint64_t MAX_HEADER_SIZE = 100'000'000;

std::string errno_message() {
    return std::system_category().message(errno);
}

} // namespace

/**
 * @brief Read-only memory mapping of a whole file, unmapped on destruction.
 */
class MappedFile {
public:
    explicit MappedFile(std::string file_name) : mFileName(std::move(file_name)) {
        int fd = open(mFileName.c_str(), O_RDONLY);
        if (fd == -1)
            throw IOError("read", mFileName, "cannot open file: " + errno_message());

        struct stat st{};
        if (fstat(fd, &st) != 0) {
            std::string msg = errno_message();
            close(fd);
            throw IOError("read", mFileName, "cannot stat file: " + msg);
        }
        mSize = static_cast<std::size_t>(st.st_size);

        if (mSize > 0) {
            void* ptr = mmap(nullptr, mSize, PROT_READ, MAP_PRIVATE, fd, 0);
            if (ptr == MAP_FAILED) {
                std::string msg = errno_message();
                close(fd);
                throw IOError("read", mFileName, "cannot memory-map file: " + msg);
            }
            mData = static_cast<const std::byte*>(ptr);
        }
        close(fd);
    }

    ~MappedFile() {
        if (mData) {
            munmap(const_cast<std::byte*>(mData), mSize);
        }
    }

    MappedFile(const MappedFile&) = delete;
    MappedFile& operator=(const MappedFile&) = delete;

    [[nodiscard]] const std::byte* data() const { return mData; }
    [[nodiscard]] std::size_t size() const { return mSize; }
    [[nodiscard]] const std::string& name() const { return mFileName; }

private:
    std::string mFileName;
    const std::byte* mData = nullptr;
    std::size_t mSize = 0;
};

// SafeTensorEntry implementation

/**
 * @brief Construct a tensor entry view into a SafeTensors file.
 *
 * @param name Tensor name (as stored in SafeTensors JSON).
 * @param shape Tensor shape as a list of dimension sizes.
 * @param dtype Element data type stored in the file.
 * @param file Shared mapping of the backing file.
 * @param data_begin Absolute byte offset in file where tensor data begins.
 * @param data_end Absolute byte offset in file where tensor data ends (exclusive).
 */
SafeTensorEntry::SafeTensorEntry(const std::string& name, const std::vector<long>& shape, ETensorDType dtype,
                                 std::shared_ptr<MappedFile> file, std::ptrdiff_t data_begin, std::ptrdiff_t data_end)
    : mName(name), mShape(shape), mDType(dtype), mFile(std::move(file)), mDataBegin(data_begin), mDataEnd(data_end) {
}

const std::string& SafeTensorEntry::file_name() const {
    return mFile->name();
}

Tensor SafeTensorEntry::read() const {
    std::span<const std::byte> bytes{mFile->data() + mDataBegin, static_cast<std::size_t>(mDataEnd - mDataBegin)};
    return Tensor::from_bytes(mDType, mShape, bytes);
}

// SafeTensorsReader implementation

/**
 * @brief Construct a reader for a SafeTensors file or an HF-style `.index.json`.
 *
 * If @p file_name ends with `.index.json`, the index is parsed and all referenced
 * shard files are added; a directory is searched for `model.safetensors.index.json`
 * and then `model.safetensors`; otherwise, the single SafeTensors file is parsed.
 *
 * @param file_name Path to a `.safetensors` file, a `.safetensors.index.json` or a directory.
 *
 * @throws remora::IOError if a file cannot be opened.
 * @throws remora::FormatError if a header or index is malformed.
 */
SafeTensorsReader::SafeTensorsReader(const std::string& file_name) {
    namespace fs = std::filesystem;

    if (file_name.ends_with(".index.json")) {
        parse_index_file(file_name);
    } else if (fs::is_directory(file_name)) {
        fs::path dir(file_name);
        fs::path index_file = dir / "model.safetensors.index.json";
        fs::path single_file = dir / "model.safetensors";

        if (fs::exists(index_file)) {
            parse_index_file(index_file.string());
        } else if (fs::exists(single_file)) {
            parse_single_file(single_file.string());
        } else {
            throw IOError("read", file_name, "no safetensors files found in directory");
        }
    } else {
        parse_single_file(file_name);
    }
}

/**
 * @brief Parse a single `.safetensors` file and append all tensor entries to this reader.
 *
 * The file starts with an 8-byte little-endian unsigned integer giving the JSON header
 * size, followed by the JSON header, followed by the data section that all
 * `data_offsets` are relative to.
 *
 * @param file_path Path to a `.safetensors` file.
 */
void SafeTensorsReader::parse_single_file(const std::string& file_path) {
    auto file = std::make_shared<MappedFile>(file_path);

    std::uint64_t header_size = 0;
    if (file->size() < sizeof(header_size))
        throw FormatError("read", "", fmt::format("'{}' is too short to hold a safetensors header ({} bytes)",
                                                  file_path, file->size()));
    std::memcpy(&header_size, file->data(), sizeof(header_size));

    const std::uint64_t available = file->size() - sizeof(header_size);
    if (header_size > available || header_size > MAX_HEADER_SIZE)
        throw FormatError("read", "", fmt::format("'{}' declares a {} byte header but only {} bytes follow",
                                                  file_path, header_size, available));

    const char* header_begin = reinterpret_cast<const char*>(file->data()) + sizeof(header_size);
    nlohmann::json meta_data;
    try {
        meta_data = nlohmann::json::parse(header_begin, header_begin + header_size);
    } catch (const nlohmann::json::parse_error& e) {
        throw FormatError("read", "", fmt::format("malformed header in '{}': {}", file_path, e.what()));
    }
    if (!meta_data.is_object())
        throw FormatError("read", "", fmt::format("header of '{}' is not a JSON object", file_path));

    const std::ptrdiff_t data_start = static_cast<std::ptrdiff_t>(sizeof(header_size) + header_size);
    const std::ptrdiff_t data_size = static_cast<std::ptrdiff_t>(available - header_size);

    for (const auto& el : meta_data.items()) {
        const std::string& name = el.key();
        const auto& value = el.value();
        if (name == "__metadata__") {
            if (value.is_object()) {
                for (const auto& meta : value.items()) {
                    if (meta.value().is_string())
                        mMetadata[meta.key()] = meta.value().get<std::string>();
                }
            }
            continue;
        }

        if (!value.is_object() || !value.contains("dtype") || !value.contains("shape") || !value.contains("data_offsets"))
            throw FormatError("read", name, "header entry must have dtype, shape and data_offsets");

        const auto& j_dtype = value["dtype"];
        const auto& j_shape = value["shape"];
        const auto& j_offsets = value["data_offsets"];
        if (!j_dtype.is_string() || !j_shape.is_array() || !j_offsets.is_array() || j_offsets.size() != 2)
            throw FormatError("read", name, "header entry has ill-typed dtype, shape or data_offsets");

        ETensorDType dtype;
        try {
            dtype = dtype_from_str(j_dtype.get<std::string_view>());
        } catch (const FormatError& e) {
            throw FormatError("read", name, e.what());
        }

        if (j_shape.size() > MAX_TENSOR_DIM)
            throw FormatError("read", name, fmt::format("rank {} exceeds the supported maximum of {}",
                                                        j_shape.size(), MAX_TENSOR_DIM));
        std::vector<long> shape;
        std::size_t nelem = 1;
        std::size_t nbytes = 0;
        for (const auto& dim : j_shape) {
            if (!dim.is_number_unsigned())
                throw FormatError("read", name, "shape entries must be non-negative integers");
            const auto extent = dim.get<std::uint64_t>();
            if (extent > static_cast<std::uint64_t>(std::numeric_limits<long>::max()))
                throw FormatError("read", name, fmt::format("shape entry {} is out of range", extent));
            shape.push_back(static_cast<long>(extent));
            if (__builtin_mul_overflow(nelem, static_cast<std::size_t>(extent), &nelem))
                throw FormatError("read", name, fmt::format("element count of shape {} overflows", shape_to_str(shape)));
        }
        if (__builtin_mul_overflow(nelem, get_dtype_size(dtype), &nbytes))
            throw FormatError("read", name, fmt::format("byte count of {} {} overflows", dtype_to_str(dtype),
                                                        shape_to_str(shape)));

        if (!j_offsets[0].is_number_unsigned() || !j_offsets[1].is_number_unsigned())
            throw FormatError("read", name, "data_offsets must be non-negative integers");
        auto begin = j_offsets[0].get<std::ptrdiff_t>();
        auto end = j_offsets[1].get<std::ptrdiff_t>();
        if (begin > end || end > data_size)
            throw FormatError("read", name, fmt::format("data_offsets [{}, {}) out of bounds of the {} byte data section",
                                                        begin, end, data_size));
        if (static_cast<std::size_t>(end - begin) != nbytes)
            throw FormatError("read", name, fmt::format("{} bytes stored but {} {} needs {}", end - begin,
                                                        dtype_to_str(dtype), shape_to_str(shape), nbytes));
        if (contains(name))
            throw FormatError("read", name, fmt::format("duplicate tensor name (second occurrence in '{}')", file_path));

        mEntries.emplace_back(SafeTensorEntry{name, shape, dtype, file, begin + data_start, end + data_start});
    }
}

/**
 * @brief Parse a HuggingFace SafeTensors index file and load all referenced shard files.
 *
 * The index file maps tensor names to shard filenames in `weight_map`. Each shard
 * is processed once and parsed via parse_single_file().
 *
 * @param index_file Path to a `.index.json` file.
 */
void SafeTensorsReader::parse_index_file(const std::string& index_file) {
    std::ifstream file(index_file);
    if (!file.is_open())
        throw IOError("read", index_file, "cannot open index file");

    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw FormatError("read", "", fmt::format("malformed index '{}': {}", index_file, e.what()));
    }
    if (!parsed.contains("weight_map") || !parsed["weight_map"].is_object())
        throw FormatError("read", "", fmt::format("index '{}' has no weight_map object", index_file));

    std::unordered_set<std::string> processed_files;
    std::filesystem::path index_path(index_file);

    // nlohmann::json objects iterate in key order, so shards are visited deterministically
    for (const auto& el : parsed["weight_map"].items()) {
        if (!el.value().is_string())
            throw FormatError("read", el.key(), fmt::format("index '{}' maps the tensor to a non-string shard", index_file));
        auto f_name = el.value().get<std::string>();
        if (processed_files.contains(f_name))
            continue;
        processed_files.insert(f_name);

        std::filesystem::path full_path = index_path.parent_path() / f_name;
        parse_single_file(full_path.string());
    }
}

/**
 * @brief Find an entry by tensor name.
 *
 * @param name Tensor name to look up.
 * @return Reference to the matching entry.
 *
 * @throws std::out_of_range If no entry with this name exists.
 */
const SafeTensorEntry& SafeTensorsReader::find_entry(std::string_view name) const {
    for (auto& entry : mEntries)
        if (entry.name() == name)
            return entry;
    throw std::out_of_range(fmt::format("Entry not found: {}", name));
}

bool SafeTensorsReader::contains(std::string_view name) const {
    for (auto& entry : mEntries)
        if (entry.name() == name)
            return true;
    return false;
}

/**
 * @brief Construct a SafeTensors writer targeting @p file_name.
 *
 * The writer uses a temporary file (`<file>.tmp`) and renames it to the final name on finalize().
 *
 * @param file_name Output file path for the final `.safetensors`.
 */
SafeTensorWriter::SafeTensorWriter(std::string file_name) : mFileName(std::move(file_name)) {
}

/**
 * @brief Destroy the writer; if finalize() did not complete, the temporary file is removed.
 */
SafeTensorWriter::~SafeTensorWriter() {
    discard_temp_file();
}

void SafeTensorWriter::discard_temp_file() noexcept {
    if (mMappedFile) {
        // Never throw from a destructor path; report and keep cleaning up.
        if (munmap(mMappedFile, mTotalSize) != 0)
            fprintf(stderr, "[SafeTensorWriter] WARNING: munmap of %s.tmp failed\n", mFileName.c_str());
        mMappedFile = nullptr;
    }
    if (mFileDescriptor >= 0) {
        close(mFileDescriptor);
        mFileDescriptor = -1;
        std::string temp_name = mFileName + ".tmp";
        unlink(temp_name.c_str());
    }
}

/**
 * @brief Register a tensor for later writing (metadata + offsets are derived from registrations).
 *
 * Must be called before prepare_metadata().
 *
 * @param name Tensor name to store in the SafeTensors header.
 * @param tensor Tensor describing dtype and shape.
 *
 * @throws std::logic_error If metadata has already been finalized or the name is taken.
 */
void SafeTensorWriter::register_tensor(const std::string& name, const Tensor& tensor) {
    if (mMetaFinalized)
        throw std::logic_error("Cannot register tensor after metadata has been finalized");
    if (name == "__metadata__")
        throw std::logic_error("`__metadata__` is reserved");
    auto [it, inserted] = mRegisteredTensors.insert({name, {tensor.DType, tensor.shape(), 0, static_cast<long>(tensor.bytes())}});
    if (!inserted)
        throw std::logic_error("Tensor " + name + " registered twice");
}

/**
 * @brief Finalize metadata, create and map the temporary output file, and write the header.
 *
 * Builds the JSON header with dtype/shape/data_offsets for every registered tensor. The
 * header is padded with spaces to a multiple of 8 bytes so the data section stays aligned.
 *
 * @param extra_metadata Additional string entries for `__metadata__`.
 *
 * @throws remora::IOError On file open/truncate/mmap failures.
 */
void SafeTensorWriter::prepare_metadata(const std::map<std::string, std::string>& extra_metadata) {
    nlohmann::json meta_data;
    meta_data["__metadata__"] = nlohmann::json::object({{"format", "pt"},
                                                        {"writer", "remora"}});
    for (const auto& [key, value] : extra_metadata)
        meta_data["__metadata__"][key] = value;

    long offset = 0;
    for (auto& [name, tensor] : mRegisteredTensors) {
        meta_data[name]["dtype"] = dtype_to_str(tensor.DType);
        meta_data[name]["shape"] = tensor.Shape;
        tensor.Begin = offset;
        meta_data[name]["data_offsets"] = std::vector<long>{offset, offset + tensor.Size};
        offset += tensor.Size;
    }

    std::string header = meta_data.dump();
    header.append((8 - header.size() % 8) % 8, ' ');
    std::uint64_t header_size = header.size();
    mHeaderSize = header_size + sizeof(header_size);

    std::filesystem::path parent = std::filesystem::path(mFileName).parent_path();
    std::error_code ec;
    if (!parent.empty())
        std::filesystem::create_directories(parent, ec);
    if (ec)
        throw IOError("write", parent.string(), "cannot create output directory: " + ec.message());

    std::string temp_name = mFileName + ".tmp";
    mFileDescriptor = open(temp_name.c_str(), O_RDWR | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (mFileDescriptor == -1)
        throw IOError("write", temp_name, "cannot open file for writing: " + errno_message());
    mTotalSize = sizeof(header_size) + header_size + offset;
    if (ftruncate(mFileDescriptor, static_cast<off_t>(mTotalSize)) < 0)
        throw IOError("write", temp_name, "cannot resize file: " + errno_message());

    void* host_ptr = mmap(nullptr, mTotalSize, PROT_READ | PROT_WRITE, MAP_SHARED, mFileDescriptor, 0);
    if (host_ptr == MAP_FAILED)
        throw IOError("write", temp_name, "cannot memory-map file: " + errno_message());
    mMappedFile = static_cast<std::byte*>(host_ptr);

    // write the header
    std::memcpy(mMappedFile, &header_size, sizeof(header_size));
    std::memcpy(mMappedFile + sizeof(header_size), header.data(), header_size);
    mMetaFinalized = true;
}

/**
 * @brief Write an entire tensor into the output file.
 *
 * @param name Registered tensor name to write.
 * @param tensor Tensor whose dtype and shape must match the registration.
 *
 * @throws std::logic_error If metadata is not finalized, the tensor was already written, or it
 *         does not match its registration.
 * @throws std::out_of_range If @p name was not registered.
 */
void SafeTensorWriter::write_tensor(const std::string& name, const Tensor& tensor) {
    if (!mMetaFinalized)
        throw std::logic_error("Cannot write tensor before metadata has been finalized");

    auto found = mRegisteredTensors.find(name);
    if (found == mRegisteredTensors.end())
        throw std::out_of_range("Invalid tensor " + name);

    if (found->second.Done)
        throw std::logic_error("Tensor " + name + " has already been written");

    if (found->second.DType != tensor.DType || found->second.Shape != tensor.shape())
        throw std::logic_error(fmt::format("Tensor `{}` registered as {} {}, writing {} {}", name,
                                           dtype_to_str(found->second.DType), shape_to_str(found->second.Shape),
                                           dtype_to_str(tensor.DType), tensor.shape_str()));

    if (tensor.bytes() > 0)
        std::memcpy(mMappedFile + mHeaderSize + found->second.Begin, tensor.Data, tensor.bytes());
    found->second.Done = true;
}

/**
 * @brief Finalize the file: verify all tensors written, flush, close and rename the temp file.
 *
 * @throws std::logic_error If any registered tensor has not been written.
 * @throws remora::IOError On unmap, flush or rename failures; the temporary file is removed.
 */
void SafeTensorWriter::finalize() {
    if (!mMetaFinalized)
        throw std::logic_error("Cannot finalize before metadata has been finalized");

    for (auto& [name, tensor] : mRegisteredTensors)
        if (!tensor.Done)
            throw std::logic_error("Tensor " + name + " has not been written");

    std::string temp_name = mFileName + ".tmp";
    if (msync(mMappedFile, mTotalSize, MS_SYNC) != 0)
        throw IOError("write", temp_name, "cannot flush mapping: " + errno_message());
    if (munmap(mMappedFile, mTotalSize) != 0)
        throw IOError("write", temp_name, "cannot unmap file: " + errno_message());
    mMappedFile = nullptr;

    if (fsync(mFileDescriptor) != 0)
        throw IOError("write", temp_name, "cannot sync file: " + errno_message());
    close(mFileDescriptor);
    mFileDescriptor = -1;

    std::error_code ec;
    std::filesystem::rename(temp_name, mFileName, ec);
    if (ec) {
        unlink(temp_name.c_str());
        throw IOError("write", mFileName, "cannot move temporary file into place: " + ec.message());
    }
}

/**
 * @brief Convenience function to write a name-ordered set of tensors into a SafeTensors file.
 *
 * Registers all tensors, writes metadata, writes each tensor in full, then finalizes.
 *
 * @param file_name Output `.safetensors` path.
 * @param tensors Tensors to serialize.
 * @param extra_metadata Additional `__metadata__` entries.
 */
void write_safetensors(const std::string& file_name, const std::map<std::string, Tensor>& tensors,
                       const std::map<std::string, std::string>& extra_metadata) {
    SafeTensorWriter writer(file_name);
    for (const auto& [name, tensor] : tensors)
        writer.register_tensor(name, tensor);
    writer.prepare_metadata(extra_metadata);
    for (const auto& [name, tensor] : tensors)
        writer.write_tensor(name, tensor);
    writer.finalize();
}
