#include "pystyle/parsers/python_tokenizer.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace pystyle {

namespace {

constexpr std::array<std::string_view, 5> three_char_ops{"**=", "//=", ">>=", "<<=", "..."};
constexpr std::array<std::string_view, 19> two_char_ops{
    "**", "//", "<<", ">>", "<=", ">=", "==", "!=", "->", ":=",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@="};
constexpr std::string_view one_char_ops = "+-*/%@&|^~<>()[]{},:;.=";

constexpr std::array<std::string_view, 35> keywords{
    "False",  "None",   "True",    "and",      "as",       "assert", "async",
    "await",  "break",  "class",   "continue", "def",      "del",    "elif",
    "else",   "except", "finally", "for",      "from",     "global", "if",
    "import", "in",     "is",      "lambda",   "nonlocal", "not",    "or",
    "pass",   "raise",  "return",  "try",      "while",    "with",   "yield"};

auto is_identifier_start(char c) -> bool {
    auto uc = static_cast<unsigned char>(c);
    return std::isalpha(uc) || c == '_' || uc >= 0x80;
}

auto is_identifier_char(char c) -> bool {
    return is_identifier_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

auto is_string_prefix_char(char c) -> bool {
    return c == 'r' || c == 'R' || c == 'b' || c == 'B' || c == 'u' || c == 'U' || c == 'f'
           || c == 'F';
}

auto matching_open(char close) -> char {
    switch (close) {
    case ')':
        return '(';
    case ']':
        return '[';
    case '}':
        return '{';
    default:
        return '\0';
    }
}

struct ScanResult {
    std::optional<size_t> end;  // Position after the closing quote
    bool escaped_newline = false;
};

// Scan a string body starting at pos for the closing quote sequence
auto scan_string_body(const std::string& text, size_t pos, const std::string& quote)
    -> ScanResult {
    size_t i = pos;
    while (i < text.size()) {
        if (text[i] == '\\') {
            if (i + 1 >= text.size()) {
                return {.end = std::nullopt, .escaped_newline = true};
            }
            i += 2;
            continue;
        }
        if (text.compare(i, quote.size(), quote) == 0) {
            return {.end = i + quote.size(), .escaped_newline = false};
        }
        ++i;
    }
    return {.end = std::nullopt, .escaped_newline = false};
}

class Lexer {
public:
    explicit Lexer(const std::vector<std::string>& lines) : lines_(lines) {}

    auto run() -> TokenStream {
        for (size_t index = 0; index < lines_.size(); ++index) {
            lex_line(index);
        }
        finish();
        return std::move(stream_);
    }

private:
    struct OpenBracket {
        char ch{};
        size_t line{};
        size_t column{};
    };

    struct PendingString {
        Token token;
        std::string quote;
    };

    const std::vector<std::string>& lines_;
    TokenStream stream_;
    std::vector<OpenBracket> brackets_;
    std::optional<PendingString> pending_;
    bool logical_has_code_ = false;

    auto make_token(TokenKind kind, std::string text, size_t line, size_t column) const -> Token {
        Token token;
        token.kind = kind;
        token.line = line;
        token.column = column;
        token.end_line = line;
        token.end_column = column + text.size();
        token.text = std::move(text);
        token.depth = brackets_.size();
        token.enclosing = brackets_.empty() ? '\0' : brackets_.back().ch;
        return token;
    }

    auto push(Token token) -> void {
        if (token.kind != TokenKind::COMMENT && token.kind != TokenKind::NL
            && token.kind != TokenKind::NEWLINE) {
            logical_has_code_ = true;
        }
        stream_.tokens.push_back(std::move(token));
    }

    auto record_error(size_t line, size_t column, std::string message) -> void {
        if (!stream_.error) {
            stream_.error =
                TokenizeError{.line = line, .column = column, .message = std::move(message)};
        }
    }

    auto lex_line(size_t index) -> void {
        const std::string& text = lines_[index];
        size_t line = index + 1;
        size_t pos = 0;

        if (pending_) {
            auto resumed = continue_string(text, line);
            if (!resumed) {
                return;  // Whole line belongs to the string
            }
            pos = *resumed;
        }

        bool continued = false;
        while (pos < text.size()) {
            char c = text[pos];

            if (c == ' ' || c == '\t' || c == '\f' || c == '\r') {
                ++pos;
                continue;
            }

            if (c == '#') {
                push(make_token(TokenKind::COMMENT, text.substr(pos), line, pos));
                pos = text.size();
                break;
            }

            if (c == '\\') {
                if (pos + 1 == text.size()) {
                    continued = true;
                    pos = text.size();
                    break;
                }
                record_error(line, pos, "unexpected character after line continuation character");
                ++pos;
                continue;
            }

            if (auto quote_pos = string_start(text, pos)) {
                if (!lex_string(text, line, pos, *quote_pos, pos)) {
                    return;  // String continues on the next line
                }
                continue;
            }

            auto uc = static_cast<unsigned char>(c);
            if (std::isdigit(uc)
                || (c == '.' && pos + 1 < text.size()
                    && std::isdigit(static_cast<unsigned char>(text[pos + 1])))) {
                pos = lex_number(text, line, pos);
                continue;
            }

            if (is_identifier_start(c)) {
                size_t end = pos + 1;
                while (end < text.size() && is_identifier_char(text[end])) {
                    ++end;
                }
                push(make_token(TokenKind::NAME, text.substr(pos, end - pos), line, pos));
                pos = end;
                continue;
            }

            if (auto length = operator_length(text, pos)) {
                lex_operator(text.substr(pos, length), line, pos);
                pos += length;
                continue;
            }

            record_error(line, pos, std::string("invalid character '") + c + "'");
            ++pos;
        }

        if (continued) {
            return;
        }
        end_physical_line(line, text.size());
    }

    auto end_physical_line(size_t line, size_t column) -> void {
        if (brackets_.empty() && logical_has_code_) {
            push(make_token(TokenKind::NEWLINE, "", line, column));
            logical_has_code_ = false;
        } else {
            push(make_token(TokenKind::NL, "", line, column));
        }
    }

    // Returns the position of the opening quote when a string literal starts at pos
    auto string_start(const std::string& text, size_t pos) const -> std::optional<size_t> {
        size_t quote_pos = pos;
        while (quote_pos < text.size() && quote_pos - pos < 2
               && is_string_prefix_char(text[quote_pos])) {
            ++quote_pos;
        }
        if (quote_pos < text.size() && (text[quote_pos] == '\'' || text[quote_pos] == '"')) {
            return quote_pos;
        }
        return std::nullopt;
    }

    // Lex a string literal; false when it continues past this line
    auto lex_string(const std::string& text, size_t line, size_t start, size_t quote_pos,
                    size_t& next_pos) -> bool {
        char q = text[quote_pos];
        bool triple = text.compare(quote_pos, 3, std::string(3, q)) == 0;
        std::string quote = triple ? std::string(3, q) : std::string(1, q);

        auto scan = scan_string_body(text, quote_pos + quote.size(), quote);
        if (scan.end) {
            push(make_token(TokenKind::STRING, text.substr(start, *scan.end - start), line, start));
            next_pos = *scan.end;
            return true;
        }

        if (triple || scan.escaped_newline) {
            auto token = make_token(TokenKind::STRING, text.substr(start) + "\n", line, start);
            token.end_column = text.size();
            pending_ = PendingString{.token = std::move(token), .quote = quote};
            logical_has_code_ = true;
            return false;
        }

        record_error(line, start, "unterminated string literal");
        push(make_token(TokenKind::STRING, text.substr(start), line, start));
        next_pos = text.size();
        return true;
    }

    // Resume a string opened on an earlier line; position after it or nullopt
    auto continue_string(const std::string& text, size_t line) -> std::optional<size_t> {
        auto& pending = *pending_;
        auto scan = scan_string_body(text, 0, pending.quote);

        if (scan.end) {
            pending.token.text += text.substr(0, *scan.end);
            pending.token.end_line = line;
            pending.token.end_column = *scan.end;
            push(std::move(pending.token));
            pending_.reset();
            return *scan.end;
        }

        if (pending.quote.size() == 1 && !scan.escaped_newline) {
            record_error(pending.token.line, pending.token.column, "unterminated string literal");
            pending.token.text += text;
            pending.token.end_line = line;
            pending.token.end_column = text.size();
            push(std::move(pending.token));
            pending_.reset();
            return text.size();
        }

        pending.token.text += text + "\n";
        pending.token.end_line = line;
        pending.token.end_column = text.size();
        return std::nullopt;
    }

    auto lex_number(const std::string& text, size_t line, size_t start) -> size_t {
        bool hex = text.compare(start, 2, "0x") == 0 || text.compare(start, 2, "0X") == 0;
        size_t end = start;
        while (end < text.size()) {
            char c = text[end];
            if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.') {
                ++end;
                continue;
            }
            // Signed exponent, e.g. 1e-5
            if ((c == '+' || c == '-') && !hex && end > start
                && (text[end - 1] == 'e' || text[end - 1] == 'E') && end + 1 < text.size()
                && std::isdigit(static_cast<unsigned char>(text[end + 1]))) {
                ++end;
                continue;
            }
            break;
        }
        push(make_token(TokenKind::NUMBER, text.substr(start, end - start), line, start));
        return end;
    }

    auto operator_length(const std::string& text, size_t pos) const -> size_t {
        for (auto op : three_char_ops) {
            if (text.compare(pos, op.size(), op) == 0) {
                return op.size();
            }
        }
        for (auto op : two_char_ops) {
            if (text.compare(pos, op.size(), op) == 0) {
                return op.size();
            }
        }
        if (one_char_ops.find(text[pos]) != std::string_view::npos) {
            return 1;
        }
        return 0;
    }

    auto lex_operator(std::string op, size_t line, size_t column) -> void {
        char c = op.size() == 1 ? op[0] : '\0';

        if (c == '(' || c == '[' || c == '{') {
            push(make_token(TokenKind::OP, std::move(op), line, column));
            brackets_.push_back(OpenBracket{.ch = c, .line = line, .column = column});
            return;
        }

        if (c == ')' || c == ']' || c == '}') {
            if (brackets_.empty()) {
                record_error(line, column, std::string("unmatched '") + c + "'");
            } else {
                if (brackets_.back().ch != matching_open(c)) {
                    record_error(line, column,
                                 std::string("closing '") + c + "' does not match opening '"
                                     + brackets_.back().ch + "'");
                }
                brackets_.pop_back();
            }
        }
        push(make_token(TokenKind::OP, std::move(op), line, column));
    }

    auto finish() -> void {
        size_t last_line = lines_.size();
        size_t last_column = lines_.empty() ? 0 : lines_.back().size();

        if (pending_) {
            record_error(pending_->token.line, pending_->token.column,
                         pending_->quote.size() == 3 ? "unterminated triple-quoted string literal"
                                                     : "unterminated string literal");
            push(std::move(pending_->token));
            pending_.reset();
        }

        if (!brackets_.empty()) {
            const auto& open = brackets_.front();
            record_error(open.line, open.column, std::string("'") + open.ch + "' was never closed");
            brackets_.clear();
        }

        if (logical_has_code_) {
            push(make_token(TokenKind::NEWLINE, "", last_line, last_column));
            logical_has_code_ = false;
        }
    }
};

} // namespace

auto tokenize(const std::vector<std::string>& lines) -> TokenStream {
    Lexer lexer(lines);
    return lexer.run();
}

auto logical_lines(const TokenStream& stream) -> std::vector<LogicalLine> {
    std::vector<LogicalLine> result;
    LogicalLine current;

    for (const auto& token : stream.tokens) {
        switch (token.kind) {
        case TokenKind::COMMENT:
        case TokenKind::NL:
            break;
        case TokenKind::NEWLINE:
            if (!current.tokens.empty()) {
                current.end_line = token.line;
                result.push_back(std::move(current));
                current = LogicalLine{};
            }
            break;
        default:
            if (current.tokens.empty()) {
                current.start_line = token.line;
            }
            current.tokens.push_back(token);
            break;
        }
    }

    if (!current.tokens.empty()) {
        current.end_line = current.tokens.back().end_line;
        result.push_back(std::move(current));
    }

    return result;
}

auto is_keyword(std::string_view name) -> bool {
    return std::find(keywords.begin(), keywords.end(), name) != keywords.end();
}

auto ends_operand(const Token& token) -> bool {
    switch (token.kind) {
    case TokenKind::NAME:
        return !is_keyword(token.text) || token.text == "True" || token.text == "False"
               || token.text == "None";
    case TokenKind::NUMBER:
    case TokenKind::STRING:
        return true;
    case TokenKind::OP:
        return token.text == ")" || token.text == "]" || token.text == "}";
    default:
        return false;
    }
}

auto is_op(const Token& token, std::string_view text) -> bool {
    return token.kind == TokenKind::OP && token.text == text;
}

auto is_name(const Token& token, std::string_view text) -> bool {
    return token.kind == TokenKind::NAME && token.text == text;
}

} // namespace pystyle
