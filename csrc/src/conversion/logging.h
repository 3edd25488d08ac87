// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef REMORA_SRC_CONVERSION_LOGGING_H
#define REMORA_SRC_CONVERSION_LOGGING_H

#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace remora {

struct ArchitectureConfig;
class ConversionReport;

/**
 * @brief Console and JSON log of one conversion run.
 *
 * Human readable output goes to stderr, filtered by verbosity. When a file name is
 * given, every event is also appended to a JSON array in that file, which stays valid
 * JSON after each write.
 */
class ConversionLogger
{
public:
    enum EVerbosity {
        QUIET = -1,
        DEFAULT = 0,
        VERBOSE = 1
    };

    ConversionLogger(std::string file_name, EVerbosity verbosity);
    ~ConversionLogger();

    ConversionLogger(const ConversionLogger&) = delete;
    ConversionLogger& operator=(const ConversionLogger&) = delete;

    void set_callback(std::function<void(std::string_view)> cb);
    [[nodiscard]] EVerbosity verbosity() const { return mVerbosity; }

    void log_cmd(int argc, const char** argv);
    void log_options(const std::vector<std::pair<std::string_view, std::variant<bool, std::int64_t, float, std::string>>>& options);
    void log_config(const ArchitectureConfig& config);
    void log_message(const std::string& msg);
    void log_verbose(const std::string& msg);
    void log_warning(const std::string& msg);
    void log_error(const std::string& stage, const std::string& tensor, const std::string& msg);
    void log_report(const ConversionReport& report);
    void log_progress(int done, int total);

    // call at the beginning and end of a section of processing.
    // will record the time between the two calls
    class RAII_Section {
    public:
        ~RAII_Section() noexcept {
            if(mLogger)
                mLogger->log_section_end();
        };
        RAII_Section(RAII_Section&& other) noexcept : mLogger(std::exchange(other.mLogger, nullptr)) {}
    private:
        explicit RAII_Section(ConversionLogger* l) : mLogger(l) {}
        ConversionLogger* mLogger;

        friend class ConversionLogger;
    };

    RAII_Section log_section_start(const std::string& info);
    void log_section_end();

private:
    void log_line(nlohmann::json record);

    std::string mFileName;
    std::fstream mLogFile;
    bool mFirst = true;
    EVerbosity mVerbosity;
    std::mutex mMutex;

    // arbitrary callback for log lines
    std::function<void(std::string_view)> mCallback;

    // log section is a two-step process, here we save intermediaries
    std::string mSectionInfo;
    std::chrono::steady_clock::time_point mSectionStart;
};

} // namespace remora

#endif //REMORA_SRC_CONVERSION_LOGGING_H
