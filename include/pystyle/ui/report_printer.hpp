#pragma once

#include "pystyle/core/corrector.hpp"
#include "pystyle/core/violation.hpp"
#include "pystyle/interfaces.hpp"
#include <ftxui/dom/elements.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace pystyle {

// Plain text, one entry per line: "file:line:column: code message [category]"
auto format_violation(const std::string& file, const Violation& violation) -> std::string;
auto format_report_lines(const std::string& file, const ViolationReport& report)
    -> std::vector<std::string>;
auto format_correction_lines(const std::string& file, const CorrectionResult& result,
                             bool written) -> std::vector<std::string>;
auto format_summary_lines(const std::vector<CodeStats>& stats) -> std::vector<std::string>;

// Colored renderings of the same content
auto render_report(const std::string& file, const ViolationReport& report) -> ftxui::Element;
auto render_summary(const std::vector<CodeStats>& stats) -> ftxui::Element;

auto element_to_string(ftxui::Element element) -> std::string;

class TerminalReportPrinter : public IReportPrinter {
public:
    TerminalReportPrinter(std::ostream& out, std::ostream& err, bool use_color);

    auto print_report(const std::string& file, const ViolationReport& report) -> void override;
    auto print_correction(const std::string& file, const CorrectionResult& result,
                          bool written) -> void override;
    auto print_summary(const std::vector<CodeStats>& stats) -> void override;
    auto print_error(const std::string& message) -> void override;

private:
    auto print_lines(const std::vector<std::string>& lines) -> void;

    std::ostream& out_;
    std::ostream& err_;
    bool use_color_;
};

} // namespace pystyle
