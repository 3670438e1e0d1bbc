#ifndef __RT_COMMAND_MARKERS__
#define __RT_COMMAND_MARKERS__

#include "Headers.hpp"

namespace rt {
/**
 * @brief A command bracketed by start/end sentinels for one execution.
 */
struct MarkerCommand {
  string id;
  string command;
  // <<CMD:{id}:START>>
  string startMarker;
  // <<CMD:{id}:END: (followed by the exit status and >>)
  string endMarkerPrefix;
  // Text written to the shell
  string wrapped;
};

/**
 * @brief Builds and parses the sentinel convention used to run a command in
 * a shared shell and recover its output from a polled buffer.
 */
class CommandMarkers {
 public:
  struct Scan {
    bool sawStart = false;
    bool sawEnd = false;
    size_t startPos = string::npos;
    size_t endPos = string::npos;
    int exitCode = -1;
  };

  static MarkerCommand wrap(const string& command, const string& id);

  /**
   * @brief Looks for the sentinels of `marker` in `buffer`.
   *
   * The end sentinel only counts with a numeric status, which skips the
   * shell's echo of the printf format.  The start sentinel used is the last
   * one before the end sentinel, so output left over from earlier commands in
   * the buffer is ignored.
   */
  static Scan scan(const string& buffer, const MarkerCommand& marker);

  /**
   * @brief Clean output between the sentinels found by scan().
   *
   * Drops marker and echo lines and prompt shaped lines, carriage returns and
   * terminal escape sequences, and blank lines at both ends.
   */
  static string extractOutput(const string& buffer, const MarkerCommand& marker,
                              const Scan& scan);

  /**
   * @brief Prompt heuristic: the trimmed line ends in '$', '#' or '>' and
   * contains '@' or ':'.  Approximate; unusual PS1 settings can slip through
   * and output lines that look like prompts are dropped.
   */
  static bool isPromptLine(const string& line);

  /** @brief Removes CSI, OSC and two byte escape sequences. */
  static string stripTerminalEscapes(const string& data);

 protected:
  static bool isEchoedMarker(const string& buffer, size_t pos);
};
}  // namespace rt

#endif  // __RT_COMMAND_MARKERS__
