#include "battery_monitor/terminal_input.hpp"
#include <poll.h>
#include <unistd.h>

namespace battery_monitor
{

std::vector<Command> parseKeys(std::string& pending)
{
  std::vector<Command> commands;
  size_t i = 0;

  while (i < pending.size()) {
    char key = pending[i];

    if (key == '\x1b') {
      // Arrow keys arrive as ESC [ C / ESC [ D (or ESC O x in application mode)
      if (i + 1 >= pending.size()) {
        break;
      }
      if (pending[i + 1] != '[' && pending[i + 1] != 'O') {
        i += 1;
        continue;
      }
      if (i + 2 >= pending.size()) {
        break;
      }
      char final_byte = pending[i + 2];
      if (final_byte == 'C') {
        commands.push_back(Command::PanRight);
      } else if (final_byte == 'D') {
        commands.push_back(Command::PanLeft);
      }
      i += 3;
      continue;
    }

    switch (key) {
      case 'q':
        commands.push_back(Command::Quit);
        break;
      case 'd':
        commands.push_back(Command::ShowDashboard);
        break;
      case 'h':
        commands.push_back(Command::ShowHistory);
        break;
      case '1':
        commands.push_back(Command::ShowFirstSession);
        break;
      case '2':
        commands.push_back(Command::ShowSecondSession);
        break;
      case '+':
      case '=':
        commands.push_back(Command::ZoomIn);
        break;
      case '-':
        commands.push_back(Command::ZoomOut);
        break;
      case 'f':
        commands.push_back(Command::FitToData);
        break;
      default:
        break;
    }
    i += 1;
  }

  pending.erase(0, i);
  return commands;
}

TerminalInput::TerminalInput(int fd)
: fd_(fd), enabled_(false), saved_()
{
}

TerminalInput::~TerminalInput()
{
  restore();
}

bool TerminalInput::enable()
{
  if (enabled_) {
    return true;
  }
  if (!isatty(fd_) || tcgetattr(fd_, &saved_) != 0) {
    return false;
  }

  struct termios raw = saved_;
  raw.c_lflag &= ~(ICANON | ECHO);
  raw.c_cc[VMIN] = 0;
  raw.c_cc[VTIME] = 0;

  if (tcsetattr(fd_, TCSANOW, &raw) != 0) {
    return false;
  }
  enabled_ = true;
  return true;
}

std::vector<Command> TerminalInput::poll()
{
  if (!enabled_) {
    return std::vector<Command>();
  }

  struct pollfd pfd;
  pfd.fd = fd_;
  pfd.events = POLLIN;
  pfd.revents = 0;

  while (::poll(&pfd, 1, 0) > 0 && (pfd.revents & POLLIN)) {
    char buffer[64];
    ssize_t count = read(fd_, buffer, sizeof(buffer));
    if (count <= 0) {
      break;
    }
    pending_.append(buffer, static_cast<size_t>(count));
  }

  return parseKeys(pending_);
}

void TerminalInput::restore()
{
  if (enabled_) {
    tcsetattr(fd_, TCSANOW, &saved_);
    enabled_ = false;
  }
}

} // namespace battery_monitor
