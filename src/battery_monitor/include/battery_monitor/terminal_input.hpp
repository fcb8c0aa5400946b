#ifndef BATTERY_MONITOR__TERMINAL_INPUT_HPP_
#define BATTERY_MONITOR__TERMINAL_INPUT_HPP_

#include "battery_monitor/monitor_context.hpp"
#include <string>
#include <termios.h>
#include <vector>

namespace battery_monitor
{

// Translate raw key bytes into commands. Unknown keys are dropped; a
// trailing incomplete escape sequence is left in `pending`.
std::vector<Command> parseKeys(std::string& pending);

// Puts the terminal in non-canonical, no-echo mode for its lifetime.
// Signals (Ctrl+C) stay enabled so the process can still be interrupted.
class TerminalInput
{
public:
  explicit TerminalInput(int fd = 0);
  ~TerminalInput();

  TerminalInput(const TerminalInput&) = delete;
  TerminalInput& operator=(const TerminalInput&) = delete;

  // False if fd is not a terminal or its mode cannot be changed
  bool enable();

  bool enabled() const { return enabled_; }

  // Non-blocking: commands for whatever keys arrived since the last call
  std::vector<Command> poll();

private:
  void restore();

  int fd_;
  bool enabled_;
  struct termios saved_;
  std::string pending_;
};

} // namespace battery_monitor

#endif // BATTERY_MONITOR__TERMINAL_INPUT_HPP_
