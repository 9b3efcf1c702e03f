#include "build/file_io.hpp"

#include <fstream>
#include <sstream>

namespace stylebook::build {

auto read_file(const std::filesystem::path& path) -> Result<std::string, IoError> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return IoError{"Cannot open file: " + path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return IoError{"Cannot read file: " + path.string()};
    }
    return buffer.str();
}

auto write_file(const std::filesystem::path& path, std::string_view content)
    -> Result<Unit, IoError> {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return IoError{"Cannot open file for writing: " + path.string()};
    }
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        return IoError{"Cannot write file: " + path.string()};
    }
    return Unit{};
}

} // namespace stylebook::build
