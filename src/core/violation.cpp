#include "pystyle/core/violation.hpp"
#include <algorithm>
#include <map>
#include <tuple>

namespace pystyle {

auto code_name(RuleCode code) -> std::string {
    switch (code) {
    case RuleCode::LINE_TOO_LONG:
        return "line-too-long";
    case RuleCode::BAD_INDENTATION:
        return "bad-indentation";
    case RuleCode::MISSING_OPERATOR_SPACE:
        return "missing-operator-space";
    case RuleCode::IMPORT_ORDER:
        return "import-order";
    case RuleCode::CLASS_NAMING:
        return "class-naming";
    case RuleCode::FUNCTION_NAMING:
        return "function-naming";
    case RuleCode::TRAILING_WHITESPACE:
        return "trailing-whitespace";
    }
    return "unknown";
}

auto category_of(RuleCode code) -> Category {
    switch (code) {
    case RuleCode::LINE_TOO_LONG:
    case RuleCode::BAD_INDENTATION:
        return Category::STYLE;
    case RuleCode::MISSING_OPERATOR_SPACE:
    case RuleCode::TRAILING_WHITESPACE:
        return Category::WHITESPACE;
    case RuleCode::IMPORT_ORDER:
        return Category::IMPORT_ORDER;
    case RuleCode::CLASS_NAMING:
    case RuleCode::FUNCTION_NAMING:
        return Category::NAMING;
    }
    return Category::STYLE;
}

auto category_name(Category category) -> std::string {
    switch (category) {
    case Category::STYLE:
        return "style";
    case Category::NAMING:
        return "naming";
    case Category::WHITESPACE:
        return "whitespace";
    case Category::IMPORT_ORDER:
        return "import-order";
    }
    return "unknown";
}

auto is_autofixable(RuleCode code) -> bool {
    switch (code) {
    case RuleCode::BAD_INDENTATION:
    case RuleCode::MISSING_OPERATOR_SPACE:
    case RuleCode::IMPORT_ORDER:
    case RuleCode::TRAILING_WHITESPACE:
        return true;
    case RuleCode::LINE_TOO_LONG:
    case RuleCode::CLASS_NAMING:
    case RuleCode::FUNCTION_NAMING:
        return false;
    }
    return false;
}

auto is_autofixable(const Violation& violation) -> bool {
    return is_autofixable(violation.code);
}

auto violation_less(const Violation& a, const Violation& b) -> bool {
    return std::forward_as_tuple(a.line, code_name(a.code), a.column, a.message)
           < std::forward_as_tuple(b.line, code_name(b.code), b.column, b.message);
}

auto sort_violations(std::vector<Violation>& violations) -> void {
    std::sort(violations.begin(), violations.end(), violation_less);
}

auto summarize_by_code(const std::vector<Violation>& violations,
                       const std::vector<Violation>& fixed) -> std::vector<CodeStats> {
    // Keyed by name so the table comes out alphabetical
    std::map<std::string, CodeStats> stats_map;

    for (const auto& violation : violations) {
        auto& stats = stats_map[code_name(violation.code)];
        stats.code = violation.code;
        stats.total_count++;
        if (is_autofixable(violation)) {
            stats.autofixable_count++;
        }
    }

    for (const auto& violation : fixed) {
        auto it = stats_map.find(code_name(violation.code));
        if (it != stats_map.end()) {
            it->second.fixed_count++;
        }
    }

    std::vector<CodeStats> result;
    result.reserve(stats_map.size());
    for (const auto& [name, stats] : stats_map) {
        result.push_back(stats);
    }
    return result;
}

} // namespace pystyle
