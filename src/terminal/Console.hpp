#ifndef __RT_CONSOLE__
#define __RT_CONSOLE__

#include "Headers.hpp"
#include "RawSocketUtils.hpp"

namespace rt {
/**
 * @brief Local terminal used by interactive sessions.
 */
class Console {
 public:
  virtual ~Console() {}

  /** @brief Current window size in character cells. */
  virtual TerminalSize getTerminalSize() = 0;
  /** @brief Puts the terminal into raw mode, saving the previous mode. */
  virtual void setup() = 0;
  /** @brief Restores the mode saved by setup(). */
  virtual void teardown() = 0;
  virtual int getFd() = 0;
  virtual int getInputFd() = 0;

  virtual void write(const string& s) {
    RawSocketUtils::writeAll(getFd(), &s[0], s.length());
  }
};

/**
 * @brief Holds a console in raw mode for its own lifetime.
 */
class RawModeGuard {
 public:
  explicit RawModeGuard(Console* _console) : console(_console) {
    console->setup();
  }
  ~RawModeGuard() { console->teardown(); }

  RawModeGuard(const RawModeGuard&) = delete;
  RawModeGuard& operator=(const RawModeGuard&) = delete;

 protected:
  Console* console;
};
}  // namespace rt

#endif  // __RT_CONSOLE__
