#include "pystyle/core/source_document.hpp"
#include "pystyle/parsers/declaration_parser.hpp"

namespace pystyle {

ParseError::ParseError(size_t line, const std::string& message)
    : std::runtime_error("line " + std::to_string(line) + ": " + message),
      line_(line),
      detail_(message) {}

auto build_source_document(std::string text) -> SourceDocument {
    SourceDocument document;
    document.lines = split_lines(text);
    document.text = std::move(text);

    std::vector<std::string> texts;
    texts.reserve(document.lines.size());
    for (const auto& line : document.lines) {
        texts.push_back(line.text);
    }
    document.tokens = tokenize(texts);

    try {
        document.declarations = parse_declarations(texts, document.tokens);
    } catch (const ParseError& e) {
        // Structural checks are skipped, line checks still run
        document.declarations.clear();
        document.parse_error = ParseDiagnostic{.line = e.line(), .message = e.detail()};
    }

    return document;
}

auto build_source_document(const std::vector<Line>& lines) -> SourceDocument {
    return build_source_document(render_lines(lines));
}

auto render_lines(const std::vector<Line>& lines) -> std::string {
    std::string output;
    size_t total = 0;
    for (const auto& line : lines) {
        total += line.text.size() + line.ending.size();
    }
    output.reserve(total);

    for (const auto& line : lines) {
        output += line.text;
        output += line.ending;
    }
    return output;
}

auto split_lines(std::string_view text) -> std::vector<Line> {
    std::vector<Line> lines;
    size_t start = 0;

    while (start < text.size()) {
        auto newline = text.find('\n', start);
        Line line;
        line.number = lines.size() + 1;

        if (newline == std::string_view::npos) {
            line.text = std::string(text.substr(start));
            lines.push_back(std::move(line));
            break;
        }

        size_t end = newline;
        if (end > start && text[end - 1] == '\r') {
            --end;
            line.ending = "\r\n";
        } else {
            line.ending = "\n";
        }
        line.text = std::string(text.substr(start, end - start));
        lines.push_back(std::move(line));
        start = newline + 1;
    }

    return lines;
}

} // namespace pystyle
