// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//
// Error taxonomy for checkpoint conversion. Every fatal condition is reported
// through one of these exceptions; the stage and the offending tensor are kept
// separately so that the command line tool and the log can report them.

#ifndef REMORA_SRC_UTILS_ERRORS_H
#define REMORA_SRC_UTILS_ERRORS_H

#include <stdexcept>
#include <string>
#include <utility>

namespace remora {

/// Base class of all fatal conversion errors.
class ConversionError : public std::runtime_error {
public:
    ConversionError(const std::string& kind, std::string stage, std::string tensor, const std::string& message)
        : std::runtime_error(format_what(kind, stage, tensor, message)),
          mKind(kind), mStage(std::move(stage)), mTensor(std::move(tensor)) {}

    [[nodiscard]] const std::string& kind() const { return mKind; }
    [[nodiscard]] const std::string& stage() const { return mStage; }
    [[nodiscard]] const std::string& tensor() const { return mTensor; }

private:
    static std::string format_what(const std::string& kind, const std::string& stage,
                                   const std::string& tensor, const std::string& message) {
        std::string result = kind + " [" + stage + "]";
        if (!tensor.empty()) {
            result += " `" + tensor + "`";
        }
        return result + ": " + message;
    }

    std::string mKind;
    std::string mStage;
    std::string mTensor;
};

/// Malformed or truncated archive, or a tensor the schema requires is absent from the source.
class FormatError : public ConversionError {
public:
    FormatError(std::string stage, std::string tensor, const std::string& message)
        : ConversionError("FormatError", std::move(stage), std::move(tensor), message) {}
};

/// Incompatible dimensions encountered while merging, padding or stacking.
class ShapeMismatch : public ConversionError {
public:
    ShapeMismatch(std::string stage, std::string tensor, const std::string& message)
        : ConversionError("ShapeMismatch", std::move(stage), std::move(tensor), message) {}
};

/// A tensor, or the declared configuration itself, disagrees with the expected schema.
class ConfigMismatch : public ConversionError {
public:
    ConfigMismatch(std::string stage, std::string tensor, const std::string& message)
        : ConversionError("ConfigMismatch", std::move(stage), std::move(tensor), message) {}
};

/// Read or write failure at the filesystem boundary.
class IOError : public ConversionError {
public:
    IOError(std::string stage, std::string path, const std::string& message)
        : ConversionError("IOError", std::move(stage), std::move(path), message) {}
};

} // namespace remora

#endif //REMORA_SRC_UTILS_ERRORS_H
