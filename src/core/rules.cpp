#include "pystyle/core/rules.hpp"
#include "pystyle/core/import_classifier.hpp"
#include "pystyle/parsers/indentation.hpp"
#include <iterator>
#include <limits>
#include <unordered_set>

namespace pystyle::rules {

namespace {

const std::unordered_set<std::string_view> binary_operators{
    "=", "==", "!=", "<", ">", "<=", ">=", "+", "-", "*", "/", "//", "%",
    "+=", "-=", "*=", "/=", "//=", "%=", "**=", "@=", "&=", "|=", "^=", "<<=", ">>="};

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t';
}

// First line the tokenizer could not make sense of
auto first_unreliable_line(const SourceDocument& document) -> size_t {
    return document.tokens.error ? document.tokens.error->line
                                 : std::numeric_limits<size_t>::max();
}

// "=" that belongs to a lambda parameter list at the same bracket depth
auto in_lambda_parameters(const std::vector<Token>& tokens, size_t index) -> bool {
    size_t depth = tokens[index].depth;
    for (size_t j = index; j-- > 0;) {
        const auto& token = tokens[j];
        if (token.depth < depth) {
            return false;
        }
        if (token.depth != depth) {
            continue;
        }
        if (is_op(token, ":")) {
            return false;
        }
        if (is_name(token, "lambda")) {
            return true;
        }
    }
    return false;
}

// "match"/"case" opening a compound statement header are keywords there
auto starts_soft_keyword_header(const std::vector<Token>& tokens) -> bool {
    if (tokens.size() < 3 || tokens.front().kind != TokenKind::NAME) {
        return false;
    }
    const auto& head = tokens.front().text;
    const auto& tail = tokens.back();
    return (head == "match" || head == "case") && is_op(tail, ":") && tail.depth == 0;
}

auto make_violation(size_t line, size_t column, RuleCode code, std::string message) -> Violation {
    return Violation{.line = line, .column = column, .code = code, .message = std::move(message)};
}

} // namespace

auto registry() -> const std::vector<RuleCode>& {
    static const std::vector<RuleCode> codes{
        RuleCode::LINE_TOO_LONG,  RuleCode::BAD_INDENTATION, RuleCode::MISSING_OPERATOR_SPACE,
        RuleCode::IMPORT_ORDER,   RuleCode::CLASS_NAMING,    RuleCode::FUNCTION_NAMING,
        RuleCode::TRAILING_WHITESPACE};
    return codes;
}

auto run_rule(RuleCode code, const SourceDocument& document, const AnalysisOptions& options)
    -> std::vector<Violation> {
    switch (code) {
    case RuleCode::LINE_TOO_LONG:
        return check_line_length(document);
    case RuleCode::BAD_INDENTATION:
        return check_indentation(document);
    case RuleCode::MISSING_OPERATOR_SPACE:
        return check_operator_spacing(document);
    case RuleCode::IMPORT_ORDER:
        return check_import_order(document, options);
    case RuleCode::CLASS_NAMING:
        return check_class_naming(document);
    case RuleCode::FUNCTION_NAMING:
        return check_function_naming(document);
    case RuleCode::TRAILING_WHITESPACE:
        return check_trailing_whitespace(document);
    }
    return {};
}

auto run_all_rules(const SourceDocument& document, const AnalysisOptions& options)
    -> std::vector<Violation> {
    std::vector<Violation> violations;
    for (auto code : registry()) {
        auto found = run_rule(code, document, options);
        violations.insert(violations.end(), std::make_move_iterator(found.begin()),
                          std::make_move_iterator(found.end()));
    }
    sort_violations(violations);
    return violations;
}

auto check_line_length(const SourceDocument& document) -> std::vector<Violation> {
    std::vector<Violation> violations;
    for (const auto& line : document.lines) {
        auto width = display_width(line.text);
        if (width > max_line_length) {
            violations.push_back(make_violation(
                line.number, max_line_length + 1, RuleCode::LINE_TOO_LONG,
                "Line too long (" + std::to_string(width) + " > "
                    + std::to_string(max_line_length) + " characters)"));
        }
    }
    return violations;
}

auto check_indentation(const SourceDocument& document) -> std::vector<Violation> {
    std::vector<Violation> violations;
    for (const auto& site : indentation_sites(document)) {
        if (!is_bad_indentation(site.indent)) {
            continue;
        }
        std::string message = mixes_tabs_and_spaces(site.indent)
                                  ? "Indentation mixes tabs and spaces"
                                  : "Indentation is not a multiple of "
                                        + std::to_string(indent_size) + " (width "
                                        + std::to_string(indentation_width(site.indent, tab_size))
                                        + ")";
        violations.push_back(make_violation(site.line, 1, RuleCode::BAD_INDENTATION, message));
    }
    return violations;
}

auto check_operator_spacing(const SourceDocument& document) -> std::vector<Violation> {
    std::vector<Violation> violations;
    for (const auto& site : operator_spacing_sites(document)) {
        violations.push_back(make_violation(site.line, site.column + 1,
                                            RuleCode::MISSING_OPERATOR_SPACE,
                                            "Missing whitespace around operator \"" + site.op
                                                + "\""));
    }
    return violations;
}

auto check_import_order(const SourceDocument& document, const AnalysisOptions& options)
    -> std::vector<Violation> {
    std::vector<Violation> violations;
    for (const auto& block : find_import_blocks(document, options.local_packages)) {
        auto expected = expected_order(block);
        for (size_t i = 0; i < block.statements.size(); ++i) {
            const auto& actual = block.statements[i];
            if (actual.start_line == expected[i].start_line) {
                continue;
            }
            violations.push_back(make_violation(
                actual.start_line, 1, RuleCode::IMPORT_ORDER,
                "Import \"" + actual.module + "\" is out of order; expected \""
                    + expected[i].module + "\" (" + import_group_name(expected[i].group)
                    + ") at this position"));
        }
    }
    return violations;
}

auto check_class_naming(const SourceDocument& document) -> std::vector<Violation> {
    std::vector<Violation> violations;
    for (const auto& declaration : document.declarations) {
        if (declaration.kind == DeclarationKind::CLASS
            && !std::regex_match(declaration.name, class_name_pattern)) {
            violations.push_back(make_violation(declaration.start_line, declaration.column,
                                                RuleCode::CLASS_NAMING,
                                                "Class name \"" + declaration.name
                                                    + "\" should use CapWords convention"));
        }
    }
    return violations;
}

auto check_function_naming(const SourceDocument& document) -> std::vector<Violation> {
    std::vector<Violation> violations;
    for (const auto& declaration : document.declarations) {
        if (declaration.kind == DeclarationKind::FUNCTION
            && !std::regex_match(declaration.name, function_name_pattern)) {
            violations.push_back(make_violation(declaration.start_line, declaration.column,
                                                RuleCode::FUNCTION_NAMING,
                                                "Function name \"" + declaration.name
                                                    + "\" should be lowercase_with_underscores"));
        }
        if (declaration.kind == DeclarationKind::VARIABLE_ASSIGNMENT
            && !std::regex_match(declaration.name, function_name_pattern)) {
            violations.push_back(make_violation(declaration.start_line, declaration.column,
                                                RuleCode::FUNCTION_NAMING,
                                                "Variable name \"" + declaration.name
                                                    + "\" should be lowercase_with_underscores"));
        }
    }
    return violations;
}

auto check_trailing_whitespace(const SourceDocument& document) -> std::vector<Violation> {
    std::vector<Violation> violations;
    auto interior = string_interior_lines(document);

    for (const auto& line : document.lines) {
        if (interior.contains(line.number)) {
            continue;
        }
        if (auto start = trailing_whitespace_start(line.text)) {
            violations.push_back(make_violation(line.number, *start + 1,
                                                RuleCode::TRAILING_WHITESPACE,
                                                "Trailing whitespace"));
        }
    }
    return violations;
}

auto display_width(std::string_view text) -> size_t {
    size_t width = 0;
    for (char c : text) {
        auto uc = static_cast<unsigned char>(c);
        if ((uc & 0xC0) == 0x80) {
            continue;  // UTF-8 continuation byte
        }
        if (c == '\t') {
            width = (width / tab_size + 1) * tab_size;
        } else {
            ++width;
        }
    }
    return width;
}

auto indentation_sites(const SourceDocument& document) -> std::vector<IndentSite> {
    std::vector<IndentSite> sites;
    auto unreliable = first_unreliable_line(document);

    for (const auto& logical : logical_lines(document.tokens)) {
        if (logical.end_line >= unreliable) {
            break;
        }
        sites.push_back(IndentSite{
            .line = logical.start_line,
            .indent = extract_indentation(document.lines[logical.start_line - 1].text)});
    }
    return sites;
}

auto is_bad_indentation(std::string_view indent) -> bool {
    return mixes_tabs_and_spaces(indent) || indentation_width(indent, tab_size) % indent_size != 0;
}

auto operator_spacing_sites(const SourceDocument& document) -> std::vector<OperatorSite> {
    std::vector<OperatorSite> sites;
    auto unreliable = first_unreliable_line(document);

    for (const auto& logical : logical_lines(document.tokens)) {
        if (logical.end_line >= unreliable) {
            break;
        }

        const auto& tokens = logical.tokens;
        bool soft_keyword = starts_soft_keyword_header(tokens);
        for (size_t i = 1; i + 1 < tokens.size(); ++i) {
            const auto& token = tokens[i];
            if (token.kind != TokenKind::OP || !binary_operators.contains(token.text)) {
                continue;
            }
            // Unary, star-argument and positional-only markers have no left operand
            if (!ends_operand(tokens[i - 1]) || (i == 1 && soft_keyword)) {
                continue;
            }
            // Keyword arguments, parameter defaults and lambda defaults
            if (token.text == "="
                && (token.enclosing == '(' || in_lambda_parameters(tokens, i))) {
                continue;
            }

            const auto& text = document.lines[token.line - 1].text;
            bool before = token.column == 0 || is_space(text[token.column - 1]);
            bool after = token.end_column >= text.size() || is_space(text[token.end_column]);
            if (before && after) {
                continue;
            }
            sites.push_back(OperatorSite{.line = token.line,
                                         .column = token.column,
                                         .op = token.text,
                                         .space_before = before,
                                         .space_after = after});
        }
    }
    return sites;
}

auto trailing_whitespace_start(const std::string& text) -> std::optional<size_t> {
    auto last = text.find_last_not_of(" \t");
    if (last == std::string::npos) {
        return text.empty() ? std::nullopt : std::optional<size_t>{0};
    }
    if (last + 1 < text.size()) {
        return last + 1;
    }
    return std::nullopt;
}

auto string_interior_lines(const SourceDocument& document) -> std::set<size_t> {
    std::set<size_t> lines;
    for (const auto& token : document.tokens.tokens) {
        if (token.kind != TokenKind::STRING) {
            continue;
        }
        for (size_t line = token.line; line < token.end_line; ++line) {
            lines.insert(line);
        }
    }
    return lines;
}

} // namespace pystyle::rules
