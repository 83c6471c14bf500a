#include "cli_utils.h"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace jnav::cli {

std::string read_file(const std::string& path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file) {
    throw std::runtime_error("Failed to open file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw std::runtime_error("Failed to read file: " + path);
  }
  return buffer.str();
}

std::string read_stdin() {
  std::string data((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
  if (std::cin.bad()) {
    throw std::runtime_error("Failed to read stdin");
  }
  return data;
}

std::string read_input(const std::string& input) {
  if (input.empty() || input == "-") return read_stdin();
  return read_file(input);
}

}  // namespace jnav::cli
