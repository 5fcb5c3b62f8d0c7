#pragma once
/*
 * TtySession
 *
 * Purpose: owns the controlling terminal (/dev/tty) for a short query exchange.
 * Usage: open(), then send()/read_until(); unread input is discarded, the saved termios
 * mode restored and the descriptor closed when the session goes out of scope.
 */
#include <string>
#include <termios.h>

class TtySession {
public:
  TtySession() = default;
  TtySession(const TtySession&) = delete;
  TtySession& operator=(const TtySession&) = delete;
  ~TtySession();

  // opens the terminal in non-canonical, no-echo mode; false when there is no terminal
  bool open(const char* path = "/dev/tty");
  bool send(const std::string& bytes);
  // reads until `terminator` shows up or `budget_ms` has passed
  std::string read_until(char terminator, int budget_ms);

private:
  int fd_ = -1;
  bool restore_ = false;
  struct termios saved_{};
};
