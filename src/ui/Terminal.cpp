#include "ui/Terminal.hpp"
#include <unistd.h>
#include <csignal>
#include <cstdlib>

namespace mapwatch::ui {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop.store(true); }

void install_signal_handlers() {
  struct sigaction sa{};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  ::sigaction(SIGINT, &sa, nullptr);
  ::sigaction(SIGTERM, &sa, nullptr);
  // Broken SMTP/PRTG connections must not kill the process
  ::signal(SIGPIPE, SIG_IGN);
}

bool tty_stdout() {
  return ::isatty(STDOUT_FILENO) == 1;
}

bool color_stdout() {
  const char* nc = std::getenv("NO_COLOR");
  if (nc && *nc) return false;
  return tty_stdout();
}

std::string sgr(const char* code) {
  std::string s = "\x1B[";
  s += code;
  s += 'm';
  return s;
}

std::string sgr_reset() { return "\x1B[0m"; }

} // namespace mapwatch::ui
