#include "sessions/hidraw_channel.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace hwbridge::sessions {

HidrawChannel::HidrawChannel(std::string device_path) : device_path_(std::move(device_path)) {}

HidrawChannel::~HidrawChannel() {
  Close();
}

bool HidrawChannel::Open(std::string& error) {
  const int fd = ::open(device_path_.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    error = "failed to open HID device " + device_path_ + ": " + std::strerror(errno);
    return false;
  }
  return fd_.Adopt(fd, error);
}

void HidrawChannel::Close() {
  fd_.Close();
}

bool HidrawChannel::Write(const core::Bytes& data, std::size_t& bytes_written,
                          std::string& error) {
  bytes_written = 0;
  const auto lock = fd_.LockWriter();
  short revents = 0;
  switch (fd_.Wait(POLLOUT, std::chrono::milliseconds(5000), revents)) {
  case WakeableFd::WaitResult::kReady:
    break;
  case WakeableFd::WaitResult::kClosed:
    error = "HID device is closed";
    return false;
  case WakeableFd::WaitResult::kTimeout:
  case WakeableFd::WaitResult::kError:
    error = "HID output report timed out";
    return false;
  }
  const ssize_t n = ::write(fd_.Get(), data.data(), data.size());
  if (n < 0) {
    error = std::string("HID write failed: ") + std::strerror(errno);
    return false;
  }
  bytes_written = static_cast<std::size_t>(n);
  return true;
}

bool HidrawChannel::Read(std::size_t max_bytes, std::chrono::milliseconds timeout,
                         core::Bytes& data, std::string& error) {
  data.clear();
  const auto lock = fd_.LockReader();
  short revents = 0;
  switch (fd_.Wait(POLLIN, timeout, revents)) {
  case WakeableFd::WaitResult::kReady:
    break;
  case WakeableFd::WaitResult::kTimeout:
    return true;
  case WakeableFd::WaitResult::kClosed:
    error = "HID device is closed";
    return false;
  case WakeableFd::WaitResult::kError:
    error = "HID device disconnected";
    return false;
  }
  if ((revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
    error = "HID device disconnected";
    return false;
  }

  data.resize(max_bytes);
  const ssize_t n = ::read(fd_.Get(), data.data(), max_bytes);
  if (n < 0) {
    data.clear();
    if (errno == EAGAIN) {
      return true;
    }
    error = std::string("HID read failed: ") + std::strerror(errno);
    return false;
  }
  data.resize(static_cast<std::size_t>(n));
  return true;
}

} // namespace hwbridge::sessions
