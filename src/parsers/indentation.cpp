#include "pystyle/parsers/indentation.hpp"

namespace pystyle {

auto compute_indent_levels(const std::vector<std::string>& indents) -> IndentLevels {
    IndentLevels result;
    result.levels.reserve(indents.size());

    // Parallel stacks: Python rejects indentation whose meaning depends on tab size
    std::vector<size_t> wide_stack{0};
    std::vector<size_t> narrow_stack{0};

    for (size_t i = 0; i < indents.size(); ++i) {
        size_t wide = indentation_width(indents[i], 8);
        size_t narrow = indentation_width(indents[i], 1);

        if (wide > wide_stack.back()) {
            if (narrow <= narrow_stack.back()) {
                result.failed_index = i;
                result.failure = "inconsistent use of tabs and spaces in indentation";
                return result;
            }
            wide_stack.push_back(wide);
            narrow_stack.push_back(narrow);
        } else if (wide == wide_stack.back()) {
            if (narrow != narrow_stack.back()) {
                result.failed_index = i;
                result.failure = "inconsistent use of tabs and spaces in indentation";
                return result;
            }
        } else {
            while (wide_stack.size() > 1 && wide_stack.back() > wide) {
                wide_stack.pop_back();
                narrow_stack.pop_back();
            }
            if (wide_stack.back() != wide) {
                result.failed_index = i;
                result.failure = "unindent does not match any outer indentation level";
                return result;
            }
            if (narrow_stack.back() != narrow) {
                result.failed_index = i;
                result.failure = "inconsistent use of tabs and spaces in indentation";
                return result;
            }
        }

        result.levels.push_back(wide_stack.size() - 1);
    }

    return result;
}

auto indentation_width(std::string_view indent, size_t tab_size) -> size_t {
    size_t width = 0;
    for (char c : indent) {
        if (c == '\t') {
            width = (width / tab_size + 1) * tab_size;
        } else {
            ++width;
        }
    }
    return width;
}

auto extract_indentation(const std::string& line) -> std::string {
    auto first_non_space = line.find_first_not_of(" \t\f");
    if (first_non_space == std::string::npos) {
        return "";
    }
    return line.substr(0, first_non_space);
}

auto mixes_tabs_and_spaces(std::string_view indent) -> bool {
    return indent.find('\t') != std::string_view::npos
           && indent.find(' ') != std::string_view::npos;
}

} // namespace pystyle
