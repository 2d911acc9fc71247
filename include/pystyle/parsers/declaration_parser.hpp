#pragma once

#include "pystyle/core/source_document.hpp"
#include "pystyle/parsers/python_tokenizer.hpp"
#include <string>
#include <vector>

namespace pystyle {

// Extract class, function, variable and import declarations.
// Throws ParseError on tokenizer errors, broken indentation structure or
// malformed class/def/import statements.
auto parse_declarations(const std::vector<std::string>& lines, const TokenStream& tokens)
    -> std::vector<Declaration>;

} // namespace pystyle
