#include "input/terminal.h"

#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace jnav::cli {

TermiosGuard::TermiosGuard(int fd) : fd_(fd) {
  if (tcgetattr(fd_, &original_) != 0) return;
  termios raw = original_;
  raw.c_iflag &= static_cast<tcflag_t>(~(BRKINT | ICRNL | INPCK | ISTRIP | IXON));
  raw.c_oflag &= static_cast<tcflag_t>(~OPOST);
  raw.c_cflag |= CS8;
  raw.c_lflag &= static_cast<tcflag_t>(~(ECHO | ICANON | IEXTEN | ISIG));
  raw.c_cc[VMIN] = 0;
  raw.c_cc[VTIME] = 0;
  ok_ = tcsetattr(fd_, TCSAFLUSH, &raw) == 0;
}

TermiosGuard::~TermiosGuard() {
  if (ok_) tcsetattr(fd_, TCSAFLUSH, &original_);
}

AlternateScreenGuard::AlternateScreenGuard(std::ostream& out) : out_(out) {
  out_ << "\033[?1049h\033[H\033[2J" << std::flush;
}

AlternateScreenGuard::~AlternateScreenGuard() {
  out_ << "\033[0m\033[?25h\033[?1049l" << std::flush;
}

TtyInput::TtyInput() {
  if (isatty(STDIN_FILENO)) {
    fd_ = STDIN_FILENO;
    return;
  }
  fd_ = ::open("/dev/tty", O_RDONLY | O_CLOEXEC);
  owned_ = fd_ >= 0;
}

TtyInput::~TtyInput() {
  if (owned_) ::close(fd_);
}

void terminal_size(int fd, size_t& rows, size_t& columns) {
  winsize ws{};
  if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_row > 0 && ws.ws_col > 0) {
    rows = ws.ws_row;
    columns = ws.ws_col;
    return;
  }
  rows = 24;
  columns = 80;
}

}  // namespace jnav::cli
