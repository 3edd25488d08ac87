// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#include "conversion/logging.h"

#include <filesystem>

#include <fmt/core.h>
#include <fmt/chrono.h>

#include "config/architecture_config.h"
#include "conversion/conversion_report.h"
#include "utilities/errors.h"
#include "utilities/utils.h"

namespace remora {

namespace {

std::string now_str() {
    return fmt::format("{}", std::chrono::system_clock::now());
}

} // namespace

/**
 * @brief Create a logger; if @p file_name is non-empty, it is initialized as a JSON array.
 *
 * @param file_name Output path for the JSON log, or empty for console output only.
 * @param verbosity Verbosity level controlling stderr printing.
 *
 * @throws remora::IOError if the log file cannot be created.
 */
ConversionLogger::ConversionLogger(std::string file_name, EVerbosity verbosity) :
    mFileName(std::move(file_name)), mVerbosity(verbosity)
{
    if(!mFileName.empty()) {
        auto log_path = std::filesystem::path(mFileName).parent_path();
        if (!log_path.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(log_path, ec);
        }
        mLogFile.open(mFileName, std::fstream::out);
        if (!mLogFile.is_open()) {
            throw IOError("log", mFileName, "could not open log file");
        }
        mLogFile << "[\n";
        mLogFile << "\n]\n";
    }
}

/**
 * @brief Destructor; closes the log file if open.
 */
ConversionLogger::~ConversionLogger()
{
    if(mLogFile.is_open()) mLogFile.close();
}

/**
 * @brief Set a callback invoked for each JSON log line before file append.
 *
 * @param cb Callback taking the JSON line as a string_view; may be empty/null.
 */
void ConversionLogger::set_callback(std::function<void(std::string_view)> cb) {
    mCallback = std::move(cb);
}

void ConversionLogger::log_line(nlohmann::json record) {
    std::lock_guard<std::mutex> lock(mMutex);
    record["time"] = now_str();
    const std::string line = "  " + record.dump();
    if(mCallback)
        mCallback(line);
    if(!mLogFile.is_open())
        return;

    mLogFile.seekp(-3, std::ios::end);  // overwrite the array closing part
    if (!mFirst)
    {
        mLogFile << ",\n";
    }
    mLogFile << line << "\n]" << std::endl;
    mFirst = false;
}

void ConversionLogger::log_cmd(int argc, const char** argv)
{
    std::vector<std::string> cmd(argv, argv + argc);
    log_line({{"log", "cmd"}, {"cmd", cmd}});
}

/**
 * @brief Log the effective command line options.
 *
 * Each option is written as a JSON log line and, in verbose mode, printed.
 *
 * @param options Vector of (name, value) pairs; value may be bool, int64, float, or std::string.
 */
void ConversionLogger::log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options) {
    for(auto& [name, value]: options) {
        std::visit([&](auto&& v) {
            log_line({{"log", "option"}, {"name", std::string(name)}, {"value", v}});
            if (mVerbosity >= VERBOSE) {
                fmt::print(stderr, "  {:<20} {}\n", name, v);
            }
        }, value);
    }
}

void ConversionLogger::log_config(const ArchitectureConfig& config) {
    log_line({{"log", "config"},
              {"layers", config.NumLayers},
              {"hidden_size", config.HiddenSize},
              {"heads", config.NumAttentionHeads},
              {"vocab_size", config.VocabSize},
              {"routed_experts", config.NumRoutedExperts},
              {"experts_per_token", config.NumExpertsPerTok},
              {"shared_experts", config.NumSharedExperts},
              {"routed_intermediate_size", config.RoutedIntermediateSize},
              {"shared_intermediate_size", config.SharedIntermediateSize},
              {"weight_layout", std::string(weight_layout_name(config.Layout))}});

    if (mVerbosity >= DEFAULT) {
        fmt::print(stderr, "[Architecture]\n");
        fmt::print(stderr, "  layers: {}  hidden: {}  heads: {}  vocab: {}\n",
                   config.NumLayers, config.HiddenSize, config.NumAttentionHeads, config.VocabSize);
        fmt::print(stderr, "  experts: {} routed ({} per token), {} shared\n",
                   config.NumRoutedExperts, config.NumExpertsPerTok, config.NumSharedExperts);
        fmt::print(stderr, "  intermediate: routed {}, shared {}\n",
                   config.RoutedIntermediateSize, config.SharedIntermediateSize);
        if (config.needs_expert_padding()) {
            fmt::print(stderr, "  routed experts will be padded from {} to {}\n",
                       config.RoutedIntermediateSize, config.unified_intermediate_size());
        }
        fmt::print(stderr, "\n");
    }
}

void ConversionLogger::log_message(const std::string& msg) {
    if(mVerbosity >= DEFAULT) {
        fmt::print(stderr, "{}\n", msg);
    }
    log_line({{"log", "info"}, {"message", msg}});
}

void ConversionLogger::log_verbose(const std::string& msg) {
    if(mVerbosity >= VERBOSE) {
        fmt::print(stderr, "{}\n", msg);
    }
    log_line({{"log", "debug"}, {"message", msg}});
}

// Warnings are shown even in quiet mode.
void ConversionLogger::log_warning(const std::string& msg) {
    fmt::print(stderr, "WARNING: {}\n", msg);
    log_line({{"log", "warning"}, {"message", msg}});
}

void ConversionLogger::log_error(const std::string& stage, const std::string& tensor, const std::string& msg) {
    fmt::print(stderr, "ERROR: {}\n", msg);
    log_line({{"log", "error"}, {"stage", stage}, {"tensor", tensor}, {"message", msg}});
}

void ConversionLogger::log_report(const ConversionReport& report) {
    log_line({{"log", "report"}, {"report", report.to_json()}});
    report.print(mVerbosity >= VERBOSE);
    if (mVerbosity >= DEFAULT) {
        fmt::print(stderr, "{} precision warning(s), {} report entries\n",
                   report.warning_count(), report.entries().size());
    }
}

void ConversionLogger::log_progress(int done, int total) {
    if (mVerbosity < DEFAULT || total <= 0) return;
    std::lock_guard<std::mutex> lock(mMutex);
    show_progress_bar(done - 1, total, "Converting layers");
}

/**
 * @brief Begin a timed logging section.
 *
 * Stores section metadata in the logger and returns an RAII handle that will
 * call log_section_end() on destruction.
 *
 * @param info Human-readable description printed to stderr and stored in JSON.
 * @return RAII_Section handle.
 */
ConversionLogger::RAII_Section ConversionLogger::log_section_start(const std::string& info) {
    mSectionInfo = info;
    mSectionStart = std::chrono::steady_clock::now();
    if(mVerbosity >= DEFAULT) {
        fmt::print(stderr, "{} ...\n", info);
    }
    return RAII_Section{this};
}

/**
 * @brief End the current timed section and emit its duration.
 *
 * Computes elapsed time since log_section_start(), writes a JSON "section" record
 * including duration_ms, and prints a completion line (verbosity-dependent).
 */
void ConversionLogger::log_section_end() {
    auto duration = std::chrono::steady_clock::now() - mSectionStart;
    long milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
    log_line({{"log", "section"}, {"message", mSectionInfo}, {"duration_ms", milliseconds}});

    if(mVerbosity >= DEFAULT) {
        if(milliseconds < 2000) {
            fmt::print(stderr, "  done in {} ms\n", milliseconds);
        } else {
            fmt::print(stderr, "  done in {} s\n", milliseconds / 1000);
        }
    }
}

} // namespace remora
