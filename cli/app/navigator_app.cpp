#include "app/navigator_app.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <fcntl.h>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <sys/select.h>
#include <unistd.h>

#include "input/key_decoder.h"
#include "input/terminal.h"
#include "jnav/background.h"
#include "jnav/filter_engine.h"
#include "jnav/navigator.h"
#include "ui/render.h"

namespace jnav::cli {

namespace {

constexpr std::chrono::milliseconds kEscapeTimeout{25};

volatile std::sig_atomic_t g_resized = 0;

void on_sigwinch(int) { g_resized = 1; }

/// Self-pipe that lets worker threads interrupt select().
/// Shared with the mailbox notifiers so it outlives any detached worker.
class WakePipe {
 public:
  WakePipe() {
    int fds[2];
    if (::pipe(fds) == 0) {
      read_fd_ = fds[0];
      write_fd_ = fds[1];
      ::fcntl(read_fd_, F_SETFL, ::fcntl(read_fd_, F_GETFL) | O_NONBLOCK);
      ::fcntl(write_fd_, F_SETFL, ::fcntl(write_fd_, F_GETFL) | O_NONBLOCK);
    }
  }
  ~WakePipe() {
    if (read_fd_ >= 0) ::close(read_fd_);
    if (write_fd_ >= 0) ::close(write_fd_);
  }
  WakePipe(const WakePipe&) = delete;
  WakePipe& operator=(const WakePipe&) = delete;

  bool ok() const { return read_fd_ >= 0 && write_fd_ >= 0; }
  int read_fd() const { return read_fd_; }

  void wake() {
    const char byte = 1;
    // A full pipe already guarantees a pending wakeup.
    ssize_t written = ::write(write_fd_, &byte, 1);
    (void)written;
  }

  void drain() {
    char buf[64];
    while (::read(read_fd_, buf, sizeof(buf)) > 0) {
    }
  }

 private:
  int read_fd_ = -1;
  int write_fd_ = -1;
};

/// Installs the SIGWINCH handler for the lifetime of the screen.
class ResizeSignalGuard {
 public:
  ResizeSignalGuard() {
    struct sigaction action {};
    action.sa_handler = on_sigwinch;
    sigemptyset(&action.sa_mask);
    installed_ = ::sigaction(SIGWINCH, &action, &previous_) == 0;
  }
  ~ResizeSignalGuard() {
    if (installed_) ::sigaction(SIGWINCH, &previous_, nullptr);
  }
  ResizeSignalGuard(const ResizeSignalGuard&) = delete;
  ResizeSignalGuard& operator=(const ResizeSignalGuard&) = delete;

 private:
  struct sigaction previous_ {};
  bool installed_ = false;
};

timeval to_timeval(std::chrono::milliseconds ms) {
  if (ms.count() < 0) ms = std::chrono::milliseconds(0);
  timeval tv{};
  tv.tv_sec = static_cast<long>(ms.count() / 1000);
  tv.tv_usec = static_cast<long>((ms.count() % 1000) * 1000);
  return tv;
}

void flush_output(const std::string& data) {
  size_t offset = 0;
  while (offset < data.size()) {
    ssize_t n = ::write(STDOUT_FILENO, data.data() + offset, data.size() - offset);
    if (n < 0) {
      if (errno == EINTR) continue;
      return;
    }
    offset += static_cast<size_t>(n);
  }
}

}  // namespace

int run_navigator_app(std::vector<Json> documents, const CliOptions& options, std::ostream& err) {
  if (!isatty(STDOUT_FILENO)) {
    err << "Error: jnav requires an interactive terminal on stdout." << std::endl;
    return 2;
  }
  TtyInput tty;
  if (!tty.ok()) {
    err << "Error: failed to open /dev/tty for keyboard input." << std::endl;
    return 2;
  }
  auto wake = std::make_shared<WakePipe>();
  if (!wake->ok()) {
    err << "Error: failed to create wakeup pipe." << std::endl;
    return 1;
  }

  SteadyClock clock;
  ThreadExecutor query_executor;
  ThreadExecutor completion_executor;
  Navigator navigator(options.config, std::move(documents), std::make_shared<PathFilterEngine>(),
                      query_executor, completion_executor, clock);
  navigator.set_wake_callback([wake]() { wake->wake(); });

  TermiosGuard raw(tty.fd());
  if (!raw.ok()) {
    err << "Error: failed to initialize terminal raw mode." << std::endl;
    return 1;
  }
  AlternateScreenGuard screen(std::cout);
  ResizeSignalGuard resize_guard;

  size_t rows = 0;
  size_t columns = 0;
  terminal_size(STDOUT_FILENO, rows, columns);
  navigator.set_viewport(rows, columns);

  RenderOptions render_options;
  render_options.color = options.color;
  KeyDecoder decoder;
  std::string out;
  std::optional<SteadyTime> escape_deadline;

  while (!navigator.quit_requested()) {
    navigator.tick();
    out.clear();
    write_frame(render_frame(navigator, render_options), out);
    flush_output(out);

    std::optional<SteadyTime> wakeup = navigator.next_wakeup();
    if (escape_deadline.has_value()) {
      wakeup = wakeup.has_value() ? std::min(*wakeup, *escape_deadline) : *escape_deadline;
    }

    fd_set readfds;
    FD_ZERO(&readfds);
    FD_SET(tty.fd(), &readfds);
    FD_SET(wake->read_fd(), &readfds);
    const int max_fd = std::max(tty.fd(), wake->read_fd());
    timeval tv{};
    timeval* timeout = nullptr;
    if (wakeup.has_value()) {
      tv = to_timeval(std::chrono::duration_cast<std::chrono::milliseconds>(*wakeup - clock.now()) +
                      std::chrono::milliseconds(1));
      timeout = &tv;
    }
    const int ready = ::select(max_fd + 1, &readfds, nullptr, nullptr, timeout);
    if (ready < 0 && errno != EINTR) {
      err << "Error: select failed." << std::endl;
      return 1;
    }

    if (g_resized != 0) {
      g_resized = 0;
      terminal_size(STDOUT_FILENO, rows, columns);
      navigator.resize(rows, columns);
    }
    if (ready > 0 && FD_ISSET(wake->read_fd(), &readfds)) {
      wake->drain();
    }
    if (ready > 0 && FD_ISSET(tty.fd(), &readfds)) {
      char buf[256];
      ssize_t n = ::read(tty.fd(), buf, sizeof(buf));
      if (n > 0) decoder.feed(buf, static_cast<size_t>(n));
    }

    const bool flush = escape_deadline.has_value() && clock.now() >= *escape_deadline;
    KeyChord chord;
    while (!navigator.quit_requested() && decoder.next(chord, flush)) {
      navigator.handle_key(chord);
    }
    if (decoder.pending_escape()) {
      if (!escape_deadline.has_value()) escape_deadline = clock.now() + kEscapeTimeout;
    } else {
      escape_deadline.reset();
    }
  }
  return 0;
}

}  // namespace jnav::cli
