#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pystyle {

// Block levels for a sequence of logical-line indentations, following
// Python's rules: widths are compared with tab stops of 8 and of 1 and
// both comparisons must agree.
struct IndentLevels {
    std::vector<size_t> levels;          // One per input until a failure
    std::optional<size_t> failed_index;  // Input index that broke the structure
    std::string failure;
};

auto compute_indent_levels(const std::vector<std::string>& indents) -> IndentLevels;

// Column width with tabs advancing to the next multiple of tab_size
auto indentation_width(std::string_view indent, size_t tab_size) -> size_t;

auto extract_indentation(const std::string& line) -> std::string;

auto mixes_tabs_and_spaces(std::string_view indent) -> bool;

} // namespace pystyle
