#pragma once

#include "pystyle/core/engine.hpp"
#include "pystyle/interfaces.hpp"
#include <memory>
#include <string>
#include <vector>

namespace pystyle {

struct Config {
    std::vector<std::string> files;
    bool auto_correct = false;
    bool dry_run = false;                     // With auto_correct: report without writing
    bool use_color = true;
    std::vector<std::string> local_packages;  // First-party package names
};

// Exit status
constexpr int exit_clean = 0;
constexpr int exit_violations = 1;
constexpr int exit_error = 2;

class PystyleApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<IReportPrinter> printer_;

public:
    PystyleApp(std::unique_ptr<IFileSystem> filesystem, std::unique_ptr<IReportPrinter> printer);

    auto run(const Config& config) -> int;

private:
    struct FileOutcome {
        std::vector<Violation> found;
        std::vector<Violation> fixed;
        bool remaining = false;  // Violations left after this file was handled
        bool failed = false;
    };

    auto process_file(const std::string& path, const Config& config,
                      const AnalysisOptions& options) -> FileOutcome;
    auto check_file(const std::string& path, const std::string& content,
                    const AnalysisOptions& options) -> FileOutcome;
    auto correct_file(const std::string& path, const std::string& content, const Config& config,
                      const AnalysisOptions& options) -> FileOutcome;
};

} // namespace pystyle
