#pragma once

#include "pystyle/core/corrector.hpp"
#include "pystyle/core/rules.hpp"
#include "pystyle/core/source_document.hpp"
#include "pystyle/core/violation.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace pystyle {

// Engine boundary. Pure: no I/O, and every text yields a report.

auto analyze(std::string_view source_text, const AnalysisOptions& options = {})
    -> ViolationReport;

auto analyze_document(const SourceDocument& document, const AnalysisOptions& options = {})
    -> ViolationReport;

auto correct(std::string_view source_text, const ViolationReport& report,
             const AnalysisOptions& options = {}) -> std::string;

auto correct_with_details(std::string_view source_text, const ViolationReport& report,
                          const AnalysisOptions& options = {}) -> CorrectionResult;

// Flat record for tooling output
struct ReportEntry {
    std::string file;
    size_t line{};
    std::string code;
    std::string message;

    auto operator==(const ReportEntry& other) const -> bool = default;
};

auto to_report_entries(const std::string& file, const ViolationReport& report)
    -> std::vector<ReportEntry>;

} // namespace pystyle
