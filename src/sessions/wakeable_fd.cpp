#include "sessions/wakeable_fd.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace hwbridge::sessions {

WakeableFd::~WakeableFd() {
  Close();
}

bool WakeableFd::Adopt(int fd, std::string& error) {
  std::lock_guard<std::mutex> close_lock(close_mutex_);
  const int wake = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (wake < 0) {
    error = std::string("failed to create wake descriptor: ") + std::strerror(errno);
    ::close(fd);
    return false;
  }
  std::scoped_lock io_lock(read_mutex_, write_mutex_);
  fd_ = fd;
  wake_fd_ = wake;
  return true;
}

void WakeableFd::Close() {
  std::lock_guard<std::mutex> close_lock(close_mutex_);
  if (wake_fd_ >= 0) {
    // The counter stays readable until closed, so every waiter sees it. An
    // eventfd write fails only when the counter is saturated, which is
    // already readable.
    static_cast<void>(::eventfd_write(wake_fd_, 1));
  }

  std::scoped_lock io_lock(read_mutex_, write_mutex_);
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  if (wake_fd_ >= 0) {
    ::close(wake_fd_);
    wake_fd_ = -1;
  }
}

WakeableFd::WaitResult WakeableFd::Wait(short events, std::chrono::milliseconds timeout,
                                        short& revents) {
  revents = 0;
  if (fd_ < 0) {
    return WaitResult::kClosed;
  }
  pollfd waiters[2] = {
      {.fd = fd_, .events = events, .revents = 0},
      {.fd = wake_fd_, .events = POLLIN, .revents = 0},
  };
  const int ready = ::poll(waiters, 2, static_cast<int>(timeout.count()));
  if (ready == 0) {
    return WaitResult::kTimeout;
  }
  if (ready < 0) {
    return errno == EINTR ? WaitResult::kTimeout : WaitResult::kError;
  }
  if (waiters[1].revents != 0) {
    return WaitResult::kClosed;
  }
  revents = waiters[0].revents;
  return WaitResult::kReady;
}

} // namespace hwbridge::sessions
