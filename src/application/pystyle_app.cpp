#include "pystyle/application/pystyle_app.hpp"
#include <iostream>

namespace pystyle {

PystyleApp::PystyleApp(std::unique_ptr<IFileSystem> filesystem,
                       std::unique_ptr<IReportPrinter> printer)
    : filesystem_(std::move(filesystem)), printer_(std::move(printer)) {}

auto PystyleApp::run(const Config& config) -> int {
    if (config.files.empty()) {
        printer_->print_error("no input files");
        return exit_error;
    }

    AnalysisOptions options{.local_packages = config.local_packages};

    std::vector<Violation> found;
    std::vector<Violation> fixed;
    bool remaining = false;
    bool failed = false;

    for (const auto& path : config.files) {
        auto outcome = process_file(path, config, options);
        found.insert(found.end(), outcome.found.begin(), outcome.found.end());
        fixed.insert(fixed.end(), outcome.fixed.begin(), outcome.fixed.end());
        remaining = remaining || outcome.remaining;
        failed = failed || outcome.failed;
    }

    printer_->print_summary(summarize_by_code(found, fixed));

    std::cout << "Checked " << config.files.size() << " file(s): " << found.size()
              << " violation(s)";
    if (config.auto_correct) {
        std::cout << ", " << fixed.size() << (config.dry_run ? " fixable" : " fixed");
    }
    std::cout << ".\n";

    if (failed) {
        return exit_error;
    }
    return remaining ? exit_violations : exit_clean;
}

auto PystyleApp::process_file(const std::string& path, const Config& config,
                              const AnalysisOptions& options) -> FileOutcome {
    if (!filesystem_->file_exists(path)) {
        printer_->print_error("cannot open " + path);
        return FileOutcome{.failed = true};
    }

    auto content = filesystem_->read_file(path);
    if (!content) {
        printer_->print_error("cannot read " + path);
        return FileOutcome{.failed = true};
    }

    if (config.auto_correct) {
        return correct_file(path, *content, config, options);
    }
    return check_file(path, *content, options);
}

auto PystyleApp::check_file(const std::string& path, const std::string& content,
                            const AnalysisOptions& options) -> FileOutcome {
    auto report = analyze(content, options);
    printer_->print_report(path, report);
    return FileOutcome{.found = report.violations, .remaining = !report.violations.empty()};
}

auto PystyleApp::correct_file(const std::string& path, const std::string& content,
                              const Config& config, const AnalysisOptions& options)
    -> FileOutcome {
    auto report = analyze(content, options);
    if (report.violations.empty()) {
        printer_->print_report(path, report);
        return FileOutcome{};
    }

    auto result = correct_with_details(content, report, options);
    FileOutcome outcome{.found = report.violations, .fixed = result.resolved};

    bool written = false;
    if (result.text != content && !config.dry_run) {
        if (filesystem_->write_file(path, result.text)) {
            written = true;
        } else {
            printer_->print_error("failed to write " + path);
            outcome.failed = true;
        }
    }
    printer_->print_correction(path, result, written);

    // What is left is reported against the corrected text
    auto after = analyze(result.text, options);
    printer_->print_report(path, after);
    outcome.remaining = !after.violations.empty();
    return outcome;
}

} // namespace pystyle
