#include "pystyle/ui/report_printer.hpp"

#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/screen.hpp>

#include <iomanip>
#include <sstream>

namespace pystyle {

namespace {

auto location(const std::string& file, const Violation& violation) -> std::string {
    return file + ":" + std::to_string(violation.line) + ":" + std::to_string(violation.column)
           + ":";
}

auto parse_note(const std::string& file, const ParseDiagnostic& diagnostic) -> std::string {
    return file + ":" + std::to_string(diagnostic.line)
           + ": note: structure not parsed, naming and import checks skipped ("
           + diagnostic.message + ")";
}

auto correction_header(const std::string& file, const CorrectionResult& result, bool written)
    -> std::string {
    if (result.rolled_back) {
        return file + ": correction rolled back, file left unchanged";
    }
    if (result.resolved.empty()) {
        return file + ": nothing fixed";
    }
    return file + (written ? ": fixed " : ": would fix ") + std::to_string(result.resolved.size())
           + " violation(s)";
}

auto conflict_line(const std::string& file, const FixerConflict& conflict) -> std::string {
    return location(file, conflict.violation) + " " + code_name(conflict.violation.code)
           + " not fixed: " + conflict.reason;
}

auto manual_line(const std::string& file, const CorrectionResult& result) -> std::string {
    return file + ": " + std::to_string(result.manual.size())
           + " violation(s) need manual attention";
}

auto code_color(RuleCode code) -> ftxui::Color {
    return is_autofixable(code) ? ftxui::Color::Yellow : ftxui::Color::Red;
}

auto render_correction(const std::string& file, const CorrectionResult& result, bool written)
    -> ftxui::Element {
    using namespace ftxui;

    Elements elements;
    auto header_color = result.rolled_back ? Color::Red : Color::Green;
    elements.push_back(text(correction_header(file, result, written)) | color(header_color) | bold);

    for (const auto& conflict : result.conflicts) {
        elements.push_back(hbox({
            text(location(file, conflict.violation) + " ") | color(Color::Cyan),
            text(code_name(conflict.violation.code)) | color(Color::Yellow),
            text(" not fixed: " + conflict.reason) | dim,
        }));
    }
    if (!result.manual.empty()) {
        elements.push_back(text(manual_line(file, result)) | color(Color::Red));
    }
    return vbox(elements);
}

} // namespace

auto format_violation(const std::string& file, const Violation& violation) -> std::string {
    return location(file, violation) + " " + code_name(violation.code) + " " + violation.message
           + " [" + category_name(category_of(violation.code)) + "]";
}

auto format_report_lines(const std::string& file, const ViolationReport& report)
    -> std::vector<std::string> {
    std::vector<std::string> lines;
    if (report.parse_error) {
        lines.push_back(parse_note(file, *report.parse_error));
    }
    for (const auto& violation : report.violations) {
        lines.push_back(format_violation(file, violation));
    }
    return lines;
}

auto format_correction_lines(const std::string& file, const CorrectionResult& result,
                             bool written) -> std::vector<std::string> {
    std::vector<std::string> lines;
    lines.push_back(correction_header(file, result, written));
    for (const auto& conflict : result.conflicts) {
        lines.push_back(conflict_line(file, conflict));
    }
    if (!result.manual.empty()) {
        lines.push_back(manual_line(file, result));
    }
    return lines;
}

auto format_summary_lines(const std::vector<CodeStats>& stats) -> std::vector<std::string> {
    std::vector<std::string> lines;
    if (stats.empty()) {
        return lines;
    }

    std::ostringstream header;
    header << std::left << std::setw(26) << "Code" << std::right << std::setw(7) << "Total"
           << std::setw(13) << "Autofixable" << std::setw(7) << "Fixed" << std::setw(9)
           << "Fixed %";
    lines.push_back(header.str());
    lines.push_back(std::string(62, '-'));

    for (const auto& stat : stats) {
        std::ostringstream row;
        row << std::left << std::setw(26) << code_name(stat.code) << std::right << std::setw(7)
            << stat.total_count << std::setw(13) << stat.autofixable_count << std::setw(7)
            << stat.fixed_count << std::setw(8) << stat.fixed_percentage() << "%";
        lines.push_back(row.str());
    }
    return lines;
}

auto render_report(const std::string& file, const ViolationReport& report) -> ftxui::Element {
    using namespace ftxui;

    Elements elements;
    if (report.parse_error) {
        elements.push_back(text(parse_note(file, *report.parse_error)) | dim);
    }
    for (const auto& violation : report.violations) {
        elements.push_back(hbox({
            text(location(file, violation) + " ") | color(Color::Cyan),
            text(code_name(violation.code)) | color(code_color(violation.code)) | bold,
            text(" " + violation.message),
            text(" [" + category_name(category_of(violation.code)) + "]") | dim,
        }));
    }
    return vbox(elements);
}

auto render_summary(const std::vector<CodeStats>& stats) -> ftxui::Element {
    using namespace ftxui;

    Elements rows;
    rows.push_back(hbox({
        text("Code") | bold | size(WIDTH, EQUAL, 26),
        text("Total") | bold | size(WIDTH, EQUAL, 7),
        text("Autofixable") | bold | size(WIDTH, EQUAL, 13),
        text("Fixed") | bold | size(WIDTH, EQUAL, 7),
        text("Fixed %") | bold | size(WIDTH, EQUAL, 9),
    }) | color(Color::Cyan));
    rows.push_back(separator());

    for (const auto& stat : stats) {
        auto fixed_color = stat.fixed_count == stat.total_count ? Color::Green : Color::Yellow;
        rows.push_back(hbox({
            text(code_name(stat.code)) | size(WIDTH, EQUAL, 26),
            text(std::to_string(stat.total_count)) | size(WIDTH, EQUAL, 7),
            text(std::to_string(stat.autofixable_count)) | size(WIDTH, EQUAL, 13),
            text(std::to_string(stat.fixed_count)) | size(WIDTH, EQUAL, 7) | color(fixed_color),
            text(std::to_string(stat.fixed_percentage()) + "%") | size(WIDTH, EQUAL, 9),
        }));
    }
    return vbox(rows) | border;
}

auto element_to_string(ftxui::Element element) -> std::string {
    auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
    ftxui::Render(screen, element);
    return screen.ToString();
}

TerminalReportPrinter::TerminalReportPrinter(std::ostream& out, std::ostream& err, bool use_color)
    : out_(out), err_(err), use_color_(use_color) {}

auto TerminalReportPrinter::print_report(const std::string& file, const ViolationReport& report)
    -> void {
    if (report.violations.empty() && !report.parse_error) {
        return;
    }
    if (use_color_) {
        out_ << element_to_string(render_report(file, report)) << "\n";
    } else {
        print_lines(format_report_lines(file, report));
    }
}

auto TerminalReportPrinter::print_correction(const std::string& file,
                                             const CorrectionResult& result, bool written)
    -> void {
    if (use_color_) {
        out_ << element_to_string(render_correction(file, result, written)) << "\n";
    } else {
        print_lines(format_correction_lines(file, result, written));
    }
}

auto TerminalReportPrinter::print_summary(const std::vector<CodeStats>& stats) -> void {
    if (stats.empty()) {
        return;
    }
    if (use_color_) {
        out_ << element_to_string(render_summary(stats)) << "\n";
    } else {
        out_ << "\n";
        print_lines(format_summary_lines(stats));
    }
}

auto TerminalReportPrinter::print_error(const std::string& message) -> void {
    err_ << "Error: " << message << "\n";
}

auto TerminalReportPrinter::print_lines(const std::vector<std::string>& lines) -> void {
    for (const auto& line : lines) {
        out_ << line << "\n";
    }
}

} // namespace pystyle
