#include "pystyle/core/engine.hpp"

namespace pystyle {

auto analyze(std::string_view source_text, const AnalysisOptions& options) -> ViolationReport {
    auto document = build_source_document(std::string(source_text));
    return analyze_document(document, options);
}

auto analyze_document(const SourceDocument& document, const AnalysisOptions& options)
    -> ViolationReport {
    return ViolationReport{.violations = rules::run_all_rules(document, options),
                           .parse_error = document.parse_error};
}

auto correct(std::string_view source_text, const ViolationReport& report,
             const AnalysisOptions& options) -> std::string {
    return correct_with_details(source_text, report, options).text;
}

auto correct_with_details(std::string_view source_text, const ViolationReport& report,
                          const AnalysisOptions& options) -> CorrectionResult {
    auto document = build_source_document(std::string(source_text));
    return run_corrector(document, report, options);
}

auto to_report_entries(const std::string& file, const ViolationReport& report)
    -> std::vector<ReportEntry> {
    std::vector<ReportEntry> entries;
    entries.reserve(report.violations.size());
    for (const auto& violation : report.violations) {
        entries.push_back(ReportEntry{.file = file,
                                      .line = violation.line,
                                      .code = code_name(violation.code),
                                      .message = violation.message});
    }
    return entries;
}

} // namespace pystyle
