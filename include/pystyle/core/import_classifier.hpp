#pragma once

#include "pystyle/core/source_document.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace pystyle {

// Groups in required order
enum class ImportGroup {
    FUTURE,
    STANDARD_LIBRARY,
    THIRD_PARTY,
    LOCAL
};

// One module-level import statement, possibly spanning several lines
struct ImportStatement {
    std::string module;  // First module path, sort key
    ImportGroup group{};
    size_t start_line{};
    size_t end_line{};
};

// Statements separated only by blank lines
struct ImportBlock {
    std::vector<ImportStatement> statements;  // Source order
};

auto classify_module(std::string_view module_path, const std::vector<std::string>& local_packages)
    -> ImportGroup;

auto import_group_name(ImportGroup group) -> std::string;

auto is_standard_library_module(std::string_view top_level_name) -> bool;

auto find_import_blocks(const SourceDocument& document,
                        const std::vector<std::string>& local_packages)
    -> std::vector<ImportBlock>;

// Statements of a block in the order they should appear
auto expected_order(const ImportBlock& block) -> std::vector<ImportStatement>;

auto import_less(const ImportStatement& a, const ImportStatement& b) -> bool;

} // namespace pystyle
