#pragma once

#include <string>

namespace sqlscribe::cli {

/// Reads a whole file; throws std::runtime_error when it cannot be opened.
std::string read_file(const std::string& path);
/// Reads stdin until EOF.
std::string read_stdin();

}  // namespace sqlscribe::cli
