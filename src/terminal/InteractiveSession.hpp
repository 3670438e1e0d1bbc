#ifndef __RT_INTERACTIVE_SESSION__
#define __RT_INTERACTIVE_SESSION__

#include "Console.hpp"
#include "Headers.hpp"
#include "TerminalStream.hpp"

namespace rt {
/**
 * @brief Bridges a local Console and a TerminalStream until the user leaves
 * (Ctrl+D or end of input) or the remote side ends the session.
 *
 * Leaving detaches the stream, so the remote shell keeps running.
 */
class InteractiveSession {
 public:
  InteractiveSession(shared_ptr<TerminalStream> _stream,
                     shared_ptr<Console> _console);

  /**
   * @brief Attaches to `sessionId` (or starts a new session when it is
   * empty) and pumps input/output until the session ends.
   * @return The reason the session ended.
   */
  string run(const string& sessionId, std::chrono::milliseconds timeout);

  /** @brief Makes run() return at its next poll.  Safe from any thread. */
  void requestStop() { stopRequested = true; }

 protected:
  void pumpInput();
  void markEnded(const string& reason);

  shared_ptr<TerminalStream> stream;
  shared_ptr<Console> console;
  atomic<bool> stopRequested;
  atomic<bool> remoteEnded;
  mutex reasonMutex;
  string endReason;
};
}  // namespace rt

#endif  // __RT_INTERACTIVE_SESSION__
