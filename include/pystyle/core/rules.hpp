#pragma once

#include "pystyle/core/source_document.hpp"
#include "pystyle/core/violation.hpp"
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace pystyle {

struct AnalysisOptions {
    std::vector<std::string> local_packages;  // Treated as first-party imports
};

namespace rules {

constexpr size_t max_line_length = 100;
constexpr size_t indent_size = 4;
constexpr size_t tab_size = 4;

// Fixed registry; every rule is pure and independent of the others
auto registry() -> const std::vector<RuleCode>&;

auto run_rule(RuleCode code, const SourceDocument& document, const AnalysisOptions& options)
    -> std::vector<Violation>;

// All rules, sorted by (line, code)
auto run_all_rules(const SourceDocument& document, const AnalysisOptions& options)
    -> std::vector<Violation>;

auto check_line_length(const SourceDocument& document) -> std::vector<Violation>;
auto check_indentation(const SourceDocument& document) -> std::vector<Violation>;
auto check_operator_spacing(const SourceDocument& document) -> std::vector<Violation>;
auto check_import_order(const SourceDocument& document, const AnalysisOptions& options)
    -> std::vector<Violation>;
auto check_class_naming(const SourceDocument& document) -> std::vector<Violation>;
auto check_function_naming(const SourceDocument& document) -> std::vector<Violation>;
auto check_trailing_whitespace(const SourceDocument& document) -> std::vector<Violation>;

// Code points, tabs advancing to the next multiple of tab_size
auto display_width(std::string_view text) -> size_t;

// First physical line of a logical line, with its indentation
struct IndentSite {
    size_t line{};
    std::string indent;
};

// Every logical line start; stops at a tokenizer error
auto indentation_sites(const SourceDocument& document) -> std::vector<IndentSite>;

auto is_bad_indentation(std::string_view indent) -> bool;

// A binary operator missing whitespace on at least one side
struct OperatorSite {
    size_t line{};
    size_t column{};  // 0-based
    std::string op;
    bool space_before = true;
    bool space_after = true;
};

auto operator_spacing_sites(const SourceDocument& document) -> std::vector<OperatorSite>;

// Offset where trailing spaces/tabs begin, if any
auto trailing_whitespace_start(const std::string& text) -> std::optional<size_t>;

// Lines whose end lies inside a multi-line string literal
auto string_interior_lines(const SourceDocument& document) -> std::set<size_t>;

inline const std::regex class_name_pattern{R"(^[A-Z][A-Za-z0-9]*$)"};
inline const std::regex function_name_pattern{R"(^[a-z_][a-z0-9_]*$)"};

} // namespace rules

} // namespace pystyle
