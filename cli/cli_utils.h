#pragma once

#include <iosfwd>
#include <string>

namespace jnav::cli {

/// Reads a whole file as bytes. Throws std::runtime_error when it cannot be opened or read.
std::string read_file(const std::string& path);
/// Reads stdin until EOF. Throws std::runtime_error on a read error.
std::string read_stdin();
/// Reads `input` as a path, or stdin when it is empty or "-".
std::string read_input(const std::string& input);

}  // namespace jnav::cli
