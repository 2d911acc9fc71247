#pragma once

#include "pystyle/core/violation.hpp"
#include "pystyle/parsers/python_tokenizer.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace pystyle {

// Physical line; text + ending reproduces the input bytes
struct Line {
    size_t number{};     // 1-based
    std::string text;    // Without terminator
    std::string ending;  // "\n", "\r\n" or "" for a final unterminated line

    auto operator==(const Line& other) const -> bool = default;
};

enum class DeclarationKind {
    CLASS,
    FUNCTION,
    VARIABLE_ASSIGNMENT,
    IMPORT
};

struct Declaration {
    DeclarationKind kind{};
    std::string name;     // Module path for imports
    size_t start_line{};
    size_t end_line{};
    size_t column{};      // 1-based column of the name

    auto operator==(const Declaration& other) const -> bool = default;
};

// Structural syntax is malformed; line-based checks still apply
class ParseError : public std::runtime_error {
public:
    ParseError(size_t line, const std::string& message);

    auto line() const -> size_t { return line_; }
    auto detail() const -> const std::string& { return detail_; }

private:
    size_t line_;
    std::string detail_;
};

// Dual line/structural view of one Python text
struct SourceDocument {
    std::string text;                       // Original input, never modified
    std::vector<Line> lines;
    TokenStream tokens;
    std::vector<Declaration> declarations;  // Empty when parse_error is set
    std::optional<ParseDiagnostic> parse_error;
};

auto build_source_document(std::string text) -> SourceDocument;

// Rebuild a document from edited lines (numbers are reassigned)
auto build_source_document(const std::vector<Line>& lines) -> SourceDocument;

auto render_lines(const std::vector<Line>& lines) -> std::string;

auto split_lines(std::string_view text) -> std::vector<Line>;

} // namespace pystyle
