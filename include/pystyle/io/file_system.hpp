#pragma once

#include "pystyle/interfaces.hpp"
#include <optional>
#include <string>

namespace pystyle {

class FileSystem : public IFileSystem {
public:
    auto read_file(const std::string& path) -> std::optional<std::string> override;
    auto write_file(const std::string& path, const std::string& content) -> bool override;
    auto file_exists(const std::string& path) -> bool override;

private:
    auto write_atomic(const std::string& path, const std::string& content) -> bool;
};

} // namespace pystyle
