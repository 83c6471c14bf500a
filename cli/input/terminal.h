#pragma once

#include <cstddef>
#include <ostream>
#include <termios.h>

namespace jnav::cli {

/// Puts a terminal file descriptor in raw mode and restores it on destruction.
class TermiosGuard {
 public:
  explicit TermiosGuard(int fd);
  ~TermiosGuard();
  TermiosGuard(const TermiosGuard&) = delete;
  TermiosGuard& operator=(const TermiosGuard&) = delete;

  bool ok() const { return ok_; }

 private:
  int fd_;
  termios original_{};
  bool ok_ = false;
};

/// Switches to the alternate screen and restores the main screen and cursor on exit.
class AlternateScreenGuard {
 public:
  explicit AlternateScreenGuard(std::ostream& out);
  ~AlternateScreenGuard();
  AlternateScreenGuard(const AlternateScreenGuard&) = delete;
  AlternateScreenGuard& operator=(const AlternateScreenGuard&) = delete;

 private:
  std::ostream& out_;
};

/// Owns the descriptor keys are read from: stdin when it is a terminal,
/// otherwise /dev/tty so JSON can arrive on a pipe.
class TtyInput {
 public:
  TtyInput();
  ~TtyInput();
  TtyInput(const TtyInput&) = delete;
  TtyInput& operator=(const TtyInput&) = delete;

  int fd() const { return fd_; }
  bool ok() const { return fd_ >= 0; }

 private:
  int fd_ = -1;
  bool owned_ = false;
};

/// Reads the window size of `fd`. MUST fall back to 24x80 when the ioctl fails.
void terminal_size(int fd, size_t& rows, size_t& columns);

}  // namespace jnav::cli
