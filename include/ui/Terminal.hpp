#pragma once

#include <atomic>
#include <string>

namespace mapwatch::ui {

// Set from SIGINT/SIGTERM; the main thread turns it into a stop request
extern std::atomic<bool> g_stop;

void on_signal(int);
void install_signal_handlers();

// Terminal capability detection
[[nodiscard]] bool tty_stdout();
// tty and NO_COLOR unset
[[nodiscard]] bool color_stdout();

// SGR code generation
[[nodiscard]] std::string sgr(const char* code);
[[nodiscard]] std::string sgr_reset();

} // namespace mapwatch::ui
