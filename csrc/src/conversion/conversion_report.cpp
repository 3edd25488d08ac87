// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// SPDX-License-Identifier: Apache-2.0
//

#include "conversion/conversion_report.h"

#include <algorithm>

#include <fmt/core.h>

#include "conversion/checkpoint.h"

namespace remora {

void ConversionReport::add_info(std::string stage, std::string tensor, std::string message) {
    mEntries.push_back({ReportSeverity::Info, std::move(stage), std::move(tensor), std::move(message), 0.0, 0.0});
}

void ConversionReport::add_precision_warning(std::string stage, std::string tensor, std::string message,
                                             double discarded_l2, double discarded_max_abs) {
    mEntries.push_back({ReportSeverity::PrecisionWarning, std::move(stage), std::move(tensor), std::move(message),
                        discarded_l2, discarded_max_abs});
}

void ConversionReport::append(const ConversionReport& other) {
    mEntries.insert(mEntries.end(), other.mEntries.begin(), other.mEntries.end());
}

std::size_t ConversionReport::warning_count() const {
    return std::count_if(mEntries.begin(), mEntries.end(),
                         [](const ReportEntry& e) { return e.Severity == ReportSeverity::PrecisionWarning; });
}

nlohmann::json ConversionReport::to_json() const {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& e : mEntries) {
        nlohmann::json entry{
            {"severity", e.Severity == ReportSeverity::Info ? "info" : "precision_warning"},
            {"stage", e.Stage},
            {"tensor", e.Tensor},
            {"message", e.Message},
        };
        if (e.Severity == ReportSeverity::PrecisionWarning) {
            entry["discarded_l2"] = e.DiscardedL2;
            entry["discarded_max_abs"] = e.DiscardedMaxAbs;
        }
        entries.push_back(std::move(entry));
    }
    return nlohmann::json{{"warnings", warning_count()}, {"entries", std::move(entries)}};
}

void ConversionReport::print(bool include_info) const {
    for (const auto& e : mEntries) {
        if (e.Severity == ReportSeverity::PrecisionWarning) {
            fmt::print(stderr, "[PrecisionWarning] {} `{}`: {} (discarded L2 {:.6g}, max-abs {:.6g})\n",
                       e.Stage, e.Tensor, e.Message, e.DiscardedL2, e.DiscardedMaxAbs);
        } else if (include_info) {
            fmt::print(stderr, "[Info] {} `{}`: {}\n", e.Stage, e.Tensor, e.Message);
        }
    }
}

void ConversionReport::save(const std::string& file_name) const {
    write_json_atomic(file_name, to_json());
}

} // namespace remora
