#ifndef __RT_PSEUDO_TERMINAL_CONSOLE__
#define __RT_PSEUDO_TERMINAL_CONSOLE__

#include "Console.hpp"

namespace rt {
/**
 * @brief Console over the process's own tty (stdin/stdout).
 */
class PseudoTerminalConsole : public Console {
 public:
  PseudoTerminalConsole() : saved(false) {}

  virtual ~PseudoTerminalConsole() {}

  virtual void setup() {
    if (!isatty(STDIN_FILENO)) {
      return;
    }
    termios terminal_local;
    FATAL_FAIL(tcgetattr(STDIN_FILENO, &terminal_local));
    memcpy(&terminal_backup, &terminal_local, sizeof(struct termios));
    saved = true;
    cfmakeraw(&terminal_local);
    FATAL_FAIL(tcsetattr(STDIN_FILENO, TCSANOW, &terminal_local));
  }

  virtual void teardown() {
    if (saved) {
      tcsetattr(STDIN_FILENO, TCSANOW, &terminal_backup);
      saved = false;
    }
  }

  virtual TerminalSize getTerminalSize() {
    TerminalSize size;
    winsize win;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &win) == 0 && win.ws_col > 0) {
      size.set_cols(win.ws_col);
      size.set_rows(win.ws_row);
    } else {
      size.set_cols(80);
      size.set_rows(24);
    }
    return size;
  }

  virtual int getFd() { return STDOUT_FILENO; }
  virtual int getInputFd() { return STDIN_FILENO; }

 protected:
  termios terminal_backup;
  bool saved;
};
}  // namespace rt

#endif  // __RT_PSEUDO_TERMINAL_CONSOLE__
