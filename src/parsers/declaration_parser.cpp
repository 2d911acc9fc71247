#include "pystyle/parsers/declaration_parser.hpp"
#include "pystyle/parsers/indentation.hpp"
#include <algorithm>
#include <array>

namespace pystyle {

namespace {

constexpr std::array<std::string_view, 12> compound_keywords{
    "if", "elif", "else", "while", "for", "try", "except", "finally", "with", "class", "def",
    "async"};

auto is_compound_keyword(const Token& token) -> bool {
    return token.kind == TokenKind::NAME
           && std::find(compound_keywords.begin(), compound_keywords.end(), token.text)
                  != compound_keywords.end();
}

auto is_identifier(const Token& token) -> bool {
    return token.kind == TokenKind::NAME && !is_keyword(token.text);
}

auto ends_with_colon(const LogicalLine& line) -> bool {
    const auto& last = line.tokens.back();
    return is_op(last, ":") && last.depth == 0;
}

class DeclarationParser {
public:
    DeclarationParser(const std::vector<std::string>& lines, std::vector<LogicalLine> logical)
        : lines_(lines), logical_(std::move(logical)) {}

    auto run() -> std::vector<Declaration> {
        compute_levels();
        check_block_structure();

        for (current_ = 0; current_ < logical_.size(); ++current_) {
            const auto& tokens = logical_[current_].tokens;
            parse_statement_list(tokens, 0, tokens.size());
        }

        std::stable_sort(declarations_.begin(), declarations_.end(),
                         [](const Declaration& a, const Declaration& b) {
                             return a.start_line != b.start_line ? a.start_line < b.start_line
                                                                 : a.column < b.column;
                         });
        return std::move(declarations_);
    }

private:
    const std::vector<std::string>& lines_;
    std::vector<LogicalLine> logical_;
    std::vector<size_t> levels_;
    std::vector<Declaration> declarations_;
    size_t current_ = 0;  // Logical line being parsed

    auto compute_levels() -> void {
        std::vector<std::string> indents;
        indents.reserve(logical_.size());
        for (const auto& line : logical_) {
            indents.push_back(extract_indentation(lines_[line.start_line - 1]));
        }

        auto result = compute_indent_levels(indents);
        if (result.failed_index) {
            throw ParseError(logical_[*result.failed_index].start_line, result.failure);
        }
        levels_ = std::move(result.levels);
    }

    auto check_block_structure() const -> void {
        for (size_t i = 0; i < logical_.size(); ++i) {
            bool opens_block = i > 0 && ends_with_colon(logical_[i - 1]);
            size_t previous_level = i > 0 ? levels_[i - 1] : 0;

            if (levels_[i] > previous_level && !opens_block) {
                throw ParseError(logical_[i].start_line, "unexpected indent");
            }
            if (levels_[i] <= previous_level && opens_block) {
                throw ParseError(logical_[i].start_line, "expected an indented block");
            }
        }
        if (!logical_.empty() && ends_with_colon(logical_.back())) {
            throw ParseError(logical_.back().end_line, "expected an indented block");
        }
    }

    // Last physical line of the block opened by logical line `index`
    auto block_end(size_t index) const -> size_t {
        size_t end = logical_[index].end_line;
        for (size_t j = index + 1; j < logical_.size() && levels_[j] > levels_[index]; ++j) {
            end = logical_[j].end_line;
        }
        return end;
    }

    auto parse_statement_list(const std::vector<Token>& tokens, size_t begin, size_t end) -> void {
        if (begin >= end) {
            return;
        }

        if (is_compound_keyword(tokens[begin])) {
            parse_compound(tokens, begin, end);
            return;
        }

        size_t start = begin;
        for (size_t i = begin; i <= end; ++i) {
            if (i == end || (is_op(tokens[i], ";") && tokens[i].depth == 0)) {
                parse_simple(tokens, start, i);
                start = i + 1;
            }
        }
    }

    auto find_header_colon(const std::vector<Token>& tokens, size_t begin, size_t end) const
        -> size_t {
        bool in_lambda = false;
        for (size_t i = begin; i < end; ++i) {
            if (tokens[i].depth != 0) {
                continue;
            }
            if (is_name(tokens[i], "lambda")) {
                in_lambda = true;
            } else if (is_op(tokens[i], ":")) {
                if (!in_lambda) {
                    return i;
                }
                in_lambda = false;
            }
        }
        throw ParseError(tokens[begin].line, "expected ':' after '" + tokens[begin].text + "'");
    }

    auto parse_compound(const std::vector<Token>& tokens, size_t begin, size_t end) -> void {
        size_t keyword = begin;
        if (is_name(tokens[keyword], "async")) {
            if (keyword + 1 >= end
                || !(is_name(tokens[keyword + 1], "def") || is_name(tokens[keyword + 1], "for")
                     || is_name(tokens[keyword + 1], "with"))) {
                throw ParseError(tokens[keyword].line, "invalid syntax after 'async'");
            }
            ++keyword;
        }

        size_t colon = find_header_colon(tokens, keyword, end);
        bool inline_body = colon + 1 < end;
        size_t end_line = inline_body ? logical_[current_].end_line : block_end(current_);

        if (is_name(tokens[keyword], "class")) {
            if (keyword + 1 >= colon || !is_identifier(tokens[keyword + 1])) {
                throw ParseError(tokens[keyword].line, "expected class name");
            }
            add(DeclarationKind::CLASS, tokens[keyword + 1], end_line);
        } else if (is_name(tokens[keyword], "def")) {
            if (keyword + 1 >= colon || !is_identifier(tokens[keyword + 1])) {
                throw ParseError(tokens[keyword].line, "expected function name");
            }
            if (keyword + 2 >= colon || !is_op(tokens[keyword + 2], "(")) {
                throw ParseError(tokens[keyword + 1].line, "expected '(' after function name");
            }
            add(DeclarationKind::FUNCTION, tokens[keyword + 1], end_line);
        }

        parse_statement_list(tokens, colon + 1, end);
    }

    auto parse_simple(const std::vector<Token>& tokens, size_t begin, size_t end) -> void {
        if (begin >= end) {
            return;
        }
        if (is_name(tokens[begin], "import")) {
            parse_import(tokens, begin, end);
        } else if (is_name(tokens[begin], "from")) {
            parse_from_import(tokens, begin, end);
        } else if (!is_op(tokens[begin], "@")) {
            parse_assignment(tokens, begin, end);
        }
    }

    // Dotted module name starting at pos; returns the position after it
    auto read_dotted(const std::vector<Token>& tokens, size_t pos, size_t end, std::string& name)
        const -> size_t {
        if (pos >= end || !is_identifier(tokens[pos])) {
            throw ParseError(tokens[pos < end ? pos : end - 1].line, "invalid import statement");
        }
        name += tokens[pos++].text;
        while (pos + 1 < end && is_op(tokens[pos], ".") && is_identifier(tokens[pos + 1])) {
            name += "." + tokens[pos + 1].text;
            pos += 2;
        }
        return pos;
    }

    auto parse_import(const std::vector<Token>& tokens, size_t begin, size_t end) -> void {
        size_t pos = begin + 1;
        while (true) {
            std::string module;
            size_t first = pos;
            pos = read_dotted(tokens, pos, end, module);
            add_import(module, tokens[first]);

            if (pos + 1 < end && is_name(tokens[pos], "as") && is_identifier(tokens[pos + 1])) {
                pos += 2;
            }
            if (pos == end) {
                return;
            }
            if (!is_op(tokens[pos], ",")) {
                throw ParseError(tokens[pos].line, "invalid import statement");
            }
            ++pos;
        }
    }

    auto parse_from_import(const std::vector<Token>& tokens, size_t begin, size_t end) -> void {
        size_t pos = begin + 1;
        std::string module;

        while (pos < end && (is_op(tokens[pos], ".") || is_op(tokens[pos], "..."))) {
            module += tokens[pos++].text;
        }
        if (pos < end && !is_name(tokens[pos], "import")) {
            pos = read_dotted(tokens, pos, end, module);
        }
        if (module.empty() || pos >= end || !is_name(tokens[pos], "import")) {
            throw ParseError(tokens[begin].line, "invalid 'from ... import' statement");
        }
        if (pos + 1 >= end) {
            throw ParseError(tokens[pos].line, "expected names after 'import'");
        }
        add_import(module, tokens[begin + 1]);
    }

    auto parse_assignment(const std::vector<Token>& tokens, size_t begin, size_t end) -> void {
        // Annotated assignment: name ':' annotation ['=' value]
        if (begin + 1 < end && is_identifier(tokens[begin]) && is_op(tokens[begin + 1], ":")
            && tokens[begin + 1].depth == 0) {
            add(DeclarationKind::VARIABLE_ASSIGNMENT, tokens[begin], logical_[current_].end_line);
            return;
        }

        std::vector<size_t> splits;
        bool in_lambda = false;
        for (size_t i = begin; i < end; ++i) {
            if (tokens[i].depth != 0) {
                continue;
            }
            if (is_name(tokens[i], "lambda")) {
                in_lambda = true;
            } else if (in_lambda && is_op(tokens[i], ":")) {
                in_lambda = false;
            } else if (!in_lambda && is_op(tokens[i], "=")) {
                splits.push_back(i);
            }
        }

        size_t start = begin;
        for (size_t split : splits) {
            add_targets(tokens, start, split);
            start = split + 1;
        }
    }

    // Plain names, optionally unpacked through tuples, lists or starred names
    auto add_targets(const std::vector<Token>& tokens, size_t begin, size_t end) -> void {
        std::vector<const Token*> names;
        for (size_t i = begin; i < end; ++i) {
            const auto& token = tokens[i];
            if (is_identifier(token)) {
                if (i > begin && is_identifier(tokens[i - 1])) {
                    return;  // Soft keyword statement such as "type X = ..."
                }
                names.push_back(&token);
            } else if (!(is_op(token, ",") || is_op(token, "(") || is_op(token, ")")
                         || is_op(token, "[") || is_op(token, "]") || is_op(token, "*"))) {
                return;  // Attribute, subscript or call target
            }
        }
        for (const auto* token : names) {
            add(DeclarationKind::VARIABLE_ASSIGNMENT, *token, logical_[current_].end_line);
        }
    }

    auto add_import(const std::string& module, const Token& anchor) -> void {
        declarations_.push_back(Declaration{.kind = DeclarationKind::IMPORT,
                                            .name = module,
                                            .start_line = logical_[current_].start_line,
                                            .end_line = logical_[current_].end_line,
                                            .column = anchor.column + 1});
    }

    auto add(DeclarationKind kind, const Token& name, size_t end_line) -> void {
        declarations_.push_back(Declaration{.kind = kind,
                                            .name = name.text,
                                            .start_line = name.line,
                                            .end_line = std::max(end_line, name.line),
                                            .column = name.column + 1});
    }
};

} // namespace

auto parse_declarations(const std::vector<std::string>& lines, const TokenStream& tokens)
    -> std::vector<Declaration> {
    if (tokens.error) {
        throw ParseError(tokens.error->line, tokens.error->message);
    }

    DeclarationParser parser(lines, logical_lines(tokens));
    return parser.run();
}

} // namespace pystyle
