#pragma once

#include <optional>
#include <string>
#include <vector>

namespace pystyle {

// Closed catalog of checks. Registry order, not report order.
enum class RuleCode {
    LINE_TOO_LONG,
    BAD_INDENTATION,
    MISSING_OPERATOR_SPACE,
    IMPORT_ORDER,
    CLASS_NAMING,
    FUNCTION_NAMING,
    TRAILING_WHITESPACE
};

enum class Category {
    STYLE,
    NAMING,
    WHITESPACE,
    IMPORT_ORDER
};

struct Violation {
    size_t line{};     // 1-based, original document
    size_t column{};   // 1-based
    RuleCode code{};
    std::string message;

    auto operator==(const Violation& other) const -> bool = default;
};

// Structural parse failure recorded in a report
struct ParseDiagnostic {
    size_t line{};
    std::string message;

    auto operator==(const ParseDiagnostic& other) const -> bool = default;
};

struct ViolationReport {
    std::vector<Violation> violations;           // sorted by (line, code)
    std::optional<ParseDiagnostic> parse_error;
};

// Per-code totals for the summary table
struct CodeStats {
    RuleCode code{};
    size_t total_count{};
    size_t autofixable_count{};
    size_t fixed_count{};

    auto fixed_percentage() const -> int
    {
        return total_count > 0 ? static_cast<int>((fixed_count * 100) / total_count) : 0;
    }
};

// Taxonomy lookups
auto code_name(RuleCode code) -> std::string;
auto category_of(RuleCode code) -> Category;
auto category_name(Category category) -> std::string;
auto is_autofixable(RuleCode code) -> bool;
auto is_autofixable(const Violation& violation) -> bool;

// Deterministic report order: (line, code name), then column and message
auto violation_less(const Violation& a, const Violation& b) -> bool;
auto sort_violations(std::vector<Violation>& violations) -> void;

auto summarize_by_code(const std::vector<Violation>& violations,
                       const std::vector<Violation>& fixed) -> std::vector<CodeStats>;

} // namespace pystyle
