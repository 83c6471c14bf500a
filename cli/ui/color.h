#pragma once

namespace jnav::cli {

/// ANSI escape sequences used by the CLI and the interactive screen.
struct AnsiColors {
  const char* red;
  const char* green;
  const char* yellow;
  const char* blue;
  const char* magenta;
  const char* cyan;
  const char* dim;
  const char* bold;
  const char* reverse;
  const char* reset;
};

inline constexpr AnsiColors kColor{
    "\033[31m", "\033[32m", "\033[33m", "\033[34m", "\033[35m",
    "\033[36m", "\033[2m",  "\033[1m",  "\033[7m",  "\033[0m",
};

}  // namespace jnav::cli
