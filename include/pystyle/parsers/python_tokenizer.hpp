#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pystyle {

enum class TokenKind {
    NAME,
    NUMBER,
    STRING,
    OP,
    COMMENT,
    NEWLINE,  // End of a logical line
    NL        // Line break that does not end a logical line
};

struct Token {
    TokenKind kind{};
    std::string text;
    size_t line{};        // 1-based
    size_t column{};      // 0-based byte offset
    size_t end_line{};
    size_t end_column{};  // One past the last byte on end_line
    size_t depth{};       // Bracket depth outside this token
    char enclosing{};     // Innermost open bracket, '\0' at top level
};

struct TokenizeError {
    size_t line{};
    size_t column{};
    std::string message;
};

struct TokenStream {
    std::vector<Token> tokens;
    std::optional<TokenizeError> error;  // First error only
};

// A statement line: significant tokens between two NEWLINE tokens
struct LogicalLine {
    std::vector<Token> tokens;  // No COMMENT, NL or NEWLINE tokens
    size_t start_line{};
    size_t end_line{};
};

// Lex Python source given as physical lines without terminators.
// Never throws; the first problem is recorded in TokenStream::error.
auto tokenize(const std::vector<std::string>& lines) -> TokenStream;

auto logical_lines(const TokenStream& stream) -> std::vector<LogicalLine>;

auto is_keyword(std::string_view name) -> bool;

// True when a token can end an operand (name, literal, closing bracket)
auto ends_operand(const Token& token) -> bool;

auto is_op(const Token& token, std::string_view text) -> bool;
auto is_name(const Token& token, std::string_view text) -> bool;

} // namespace pystyle
