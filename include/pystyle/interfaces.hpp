#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pystyle {

// Forward declarations
struct ViolationReport;
struct CorrectionResult;
struct CodeStats;

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_file(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto write_file(const std::string& path, const std::string& content) -> bool = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
};

class IReportPrinter {
public:
    virtual ~IReportPrinter() = default;
    virtual auto print_report(const std::string& file, const ViolationReport& report) -> void = 0;
    virtual auto print_correction(const std::string& file, const CorrectionResult& result,
                                  bool written) -> void = 0;
    virtual auto print_summary(const std::vector<CodeStats>& stats) -> void = 0;
    virtual auto print_error(const std::string& message) -> void = 0;
};

} // namespace pystyle
