//! # File I/O Helpers
//!
//! Whole-file read and write used by the loaders and the materializer.
//! Failures come back as a message instead of an exception.

#ifndef STYLEBOOK_BUILD_FILE_IO_HPP
#define STYLEBOOK_BUILD_FILE_IO_HPP

#include "common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace stylebook::build {

/// A failed read or write.
struct IoError {
    std::string message;
};

/// Reads the whole file as bytes.
[[nodiscard]] auto read_file(const std::filesystem::path& path) -> Result<std::string, IoError>;

/// Writes `content`, truncating any existing file.
[[nodiscard]] auto write_file(const std::filesystem::path& path, std::string_view content)
    -> Result<Unit, IoError>;

} // namespace stylebook::build

#endif // STYLEBOOK_BUILD_FILE_IO_HPP
