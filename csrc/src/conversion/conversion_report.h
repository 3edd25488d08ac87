// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#ifndef REMORA_SRC_CONVERSION_CONVERSION_REPORT_H
#define REMORA_SRC_CONVERSION_CONVERSION_REPORT_H

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace remora {

enum class ReportSeverity {
    Info,
    PrecisionWarning,
};

/**
 * @brief One non-fatal observation made during conversion.
 *
 * For precision warnings, `DiscardedL2` and `DiscardedMaxAbs` describe the values that did
 * not make it into the output.
 */
struct ReportEntry {
    ReportSeverity Severity = ReportSeverity::Info;
    std::string Stage;
    std::string Tensor;
    std::string Message;
    double DiscardedL2 = 0.0;
    double DiscardedMaxAbs = 0.0;
};

/**
 * @brief Ordered collection of non-fatal observations of one run.
 *
 * A report is not synchronized. Concurrent stages each fill their own report, which are
 * merged with append() in a fixed order afterwards.
 */
class ConversionReport {
public:
    void add_info(std::string stage, std::string tensor, std::string message);
    void add_precision_warning(std::string stage, std::string tensor, std::string message,
                               double discarded_l2, double discarded_max_abs);
    void append(const ConversionReport& other);

    [[nodiscard]] const std::vector<ReportEntry>& entries() const { return mEntries; }
    [[nodiscard]] std::size_t warning_count() const;
    [[nodiscard]] bool empty() const { return mEntries.empty(); }

    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Print entries to stderr; info entries only when @p include_info is set.
     */
    void print(bool include_info) const;

    /**
     * @brief Write the report as JSON, atomically through a temporary sibling file.
     *
     * @throws remora::IOError if the file cannot be written.
     */
    void save(const std::string& file_name) const;

private:
    std::vector<ReportEntry> mEntries;
};

} // namespace remora

#endif // REMORA_SRC_CONVERSION_CONVERSION_REPORT_H
