#include "tty_session.hpp"
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <sys/select.h>
#include <unistd.h>

TtySession::~TtySession() {
  if (fd_ < 0) return;
  if (restore_) {
    // a late reply must not reach the next reader of the terminal
    tcflush(fd_, TCIFLUSH);
    tcsetattr(fd_, TCSANOW, &saved_);
  }
  ::close(fd_);
}

bool TtySession::open(const char* path) {
  fd_ = ::open(path, O_RDWR | O_NOCTTY);
  if (fd_ < 0) return false;
  if (tcgetattr(fd_, &saved_) != 0) return false;
  struct termios quiet = saved_;
  quiet.c_lflag &= ~(ICANON | ECHO);
  quiet.c_cc[VMIN] = 0;
  quiet.c_cc[VTIME] = 0;
  if (tcsetattr(fd_, TCSANOW, &quiet) != 0) return false;
  restore_ = true;
  tcflush(fd_, TCIFLUSH);
  return true;
}

bool TtySession::send(const std::string& bytes) {
  if (fd_ < 0) return false;
  size_t off = 0;
  while (off < bytes.size()) {
    ssize_t n = ::write(fd_, bytes.data() + off, bytes.size() - off);
    if (n <= 0) return false;
    off += static_cast<size_t>(n);
  }
  return true;
}

std::string TtySession::read_until(char terminator, int budget_ms) {
  using Clock = std::chrono::steady_clock;
  std::string reply;
  if (fd_ < 0) return reply;
  const Clock::time_point deadline = Clock::now() + std::chrono::milliseconds(budget_ms);
  while (reply.find(terminator) == std::string::npos) {
    auto left = std::chrono::duration_cast<std::chrono::microseconds>(deadline - Clock::now()).count();
    if (left <= 0) break;
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(fd_, &fds);
    struct timeval tv{static_cast<time_t>(left / 1000000), static_cast<suseconds_t>(left % 1000000)};
    int ready = select(fd_ + 1, &fds, nullptr, nullptr, &tv);
    if (ready < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (ready == 0) break;
    char buf[128];
    ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0 && (errno == EAGAIN || errno == EINTR)) continue;
    if (n <= 0) break; // hangup
    reply.append(buf, static_cast<size_t>(n));
  }
  return reply;
}
