#pragma once

#include <chrono>
#include <mutex>
#include <string>

namespace hwbridge::sessions {

// Owns a non-blocking descriptor that one reader and one writer may wait on
// while another thread closes it.
//
// Readers and writers hold their lock for as long as they touch the
// descriptor. Close() signals an eventfd that every Wait() also polls, then
// takes both locks, so the descriptor is closed only after the waiters have
// left it and its number cannot be reused underneath them.
class WakeableFd {
public:
  enum class WaitResult { kReady, kTimeout, kClosed, kError };

  WakeableFd() = default;
  ~WakeableFd();

  WakeableFd(const WakeableFd&) = delete;
  WakeableFd& operator=(const WakeableFd&) = delete;

  // Takes ownership of `fd`; it is closed on failure.
  bool Adopt(int fd, std::string& error);
  void Close();

  std::unique_lock<std::mutex> LockReader() {
    return std::unique_lock<std::mutex>(read_mutex_);
  }
  std::unique_lock<std::mutex> LockWriter() {
    return std::unique_lock<std::mutex>(write_mutex_);
  }

  // The accessors and Wait() require the reader or writer lock.
  bool IsOpen() const {
    return fd_ >= 0;
  }
  int Get() const {
    return fd_;
  }

  // kTimeout also covers EINTR. `revents` holds the descriptor's poll flags
  // when the result is kReady.
  WaitResult Wait(short events, std::chrono::milliseconds timeout, short& revents);

private:
  std::mutex close_mutex_;
  std::mutex read_mutex_;
  std::mutex write_mutex_;
  int fd_ = -1;
  int wake_fd_ = -1;
};

} // namespace hwbridge::sessions
