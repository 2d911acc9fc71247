#include "pystyle/io/file_system.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace pystyle {

auto FileSystem::read_file(const std::string& path) -> std::optional<std::string> {
    // Binary so "\r\n" endings survive the round trip
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }
    return buffer.str();
}

auto FileSystem::write_file(const std::string& path, const std::string& content) -> bool {
    return write_atomic(path, content);
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

auto FileSystem::write_atomic(const std::string& path, const std::string& content) -> bool {
    std::string temp_path = path + ".tmp";
    try {
        {
            std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                return false;
            }
            file << content;
            file.flush();
            if (file.fail()) {
                file.close();
                std::filesystem::remove(temp_path);
                return false;
            }
        }

        // Replace the original in one step
        std::filesystem::rename(temp_path, path);
        return true;

    } catch (const std::filesystem::filesystem_error&) {
        std::error_code ec;
        std::filesystem::remove(temp_path, ec);
        return false;
    }
}

} // namespace pystyle
