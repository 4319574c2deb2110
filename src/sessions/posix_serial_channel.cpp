#include "sessions/posix_serial_channel.hpp"

#include <cerrno>
#include <cstring>
#include <string_view>
#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace hwbridge::sessions {

namespace {

std::string ErrnoText(std::string_view what) {
  return std::string(what) + ": " + std::strerror(errno);
}

bool ToSpeed(std::uint32_t baud_rate, speed_t& speed) {
  switch (baud_rate) {
  case 9600:
    speed = B9600;
    return true;
  case 19200:
    speed = B19200;
    return true;
  case 38400:
    speed = B38400;
    return true;
  case 57600:
    speed = B57600;
    return true;
  case 115200:
    speed = B115200;
    return true;
  case 230400:
    speed = B230400;
    return true;
  default:
    return false;
  }
}

bool ApplyConfig(termios& tty, const SerialConfig& config, std::string& error) {
  speed_t speed = B9600;
  if (!ToSpeed(config.baud_rate, speed)) {
    error = "unsupported baud rate for this port: " + std::to_string(config.baud_rate);
    return false;
  }
  cfsetospeed(&tty, speed);
  cfsetispeed(&tty, speed);

  // Raw mode: no line discipline, no output processing.
  tty.c_lflag = 0;
  tty.c_oflag = 0;
  tty.c_iflag &= ~(IGNBRK | BRKINT | ICRNL | INLCR | PARMRK | INPCK | ISTRIP | IXON | IXOFF |
                   IXANY);
  tty.c_cflag |= (CLOCAL | CREAD);

  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= config.data_bits == 7U ? CS7 : CS8;

  tty.c_cflag &= ~(PARENB | PARODD);
#if defined(CMSPAR)
  tty.c_cflag &= ~CMSPAR;
#endif
  switch (config.parity) {
  case Parity::kNone:
    break;
  case Parity::kOdd:
    tty.c_cflag |= (PARENB | PARODD);
    break;
  case Parity::kEven:
    tty.c_cflag |= PARENB;
    break;
  case Parity::kMark:
  case Parity::kSpace:
#if defined(CMSPAR)
    tty.c_cflag |= (PARENB | CMSPAR);
    if (config.parity == Parity::kMark) {
      tty.c_cflag |= PARODD;
    }
    break;
#else
    error = "mark/space parity is not supported on this platform";
    return false;
#endif
  }

  switch (config.stop_bits) {
  case StopBits::kOne:
    tty.c_cflag &= ~CSTOPB;
    break;
  case StopBits::kTwo:
    tty.c_cflag |= CSTOPB;
    break;
  case StopBits::kOnePointFive:
    error = "1.5 stop bits are not supported by termios ports";
    return false;
  }

  tty.c_cflag &= ~CRTSCTS;
  if (config.flow_control == FlowControl::kXOnXOff ||
      config.flow_control == FlowControl::kRequestToSendXOnXOff) {
    tty.c_iflag |= (IXON | IXOFF);
  }
  if (config.flow_control == FlowControl::kRequestToSend ||
      config.flow_control == FlowControl::kRequestToSendXOnXOff) {
    tty.c_cflag |= CRTSCTS;
  }

  // Reads are driven by poll(); the fd itself never blocks.
  tty.c_cc[VMIN] = 0;
  tty.c_cc[VTIME] = 0;
  return true;
}

} // namespace

PosixSerialChannel::PosixSerialChannel(std::string device_path, SerialConfig config)
    : device_path_(std::move(device_path)), config_(config) {}

PosixSerialChannel::~PosixSerialChannel() {
  Close();
}

bool PosixSerialChannel::Open(std::string& error) {
  const int fd = ::open(device_path_.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC);
  if (fd < 0) {
    error = ErrnoText("failed to open serial port " + device_path_);
    return false;
  }

  termios tty{};
  if (tcgetattr(fd, &tty) != 0) {
    error = ErrnoText("failed to read terminal attributes");
    ::close(fd);
    return false;
  }
  if (!ApplyConfig(tty, config_, error)) {
    ::close(fd);
    return false;
  }
  if (tcsetattr(fd, TCSANOW, &tty) != 0) {
    error = ErrnoText("failed to apply terminal attributes");
    ::close(fd);
    return false;
  }
  tcflush(fd, TCIOFLUSH);
  return fd_.Adopt(fd, error);
}

void PosixSerialChannel::Close() {
  fd_.Close();
}

bool PosixSerialChannel::Write(const core::Bytes& data, std::size_t& bytes_written,
                               std::string& error) {
  bytes_written = 0;
  const auto lock = fd_.LockWriter();
  if (!fd_.IsOpen()) {
    error = "serial port is closed";
    return false;
  }
  const int fd = fd_.Get();

  while (bytes_written < data.size()) {
    const ssize_t n = ::write(fd, data.data() + bytes_written, data.size() - bytes_written);
    if (n > 0) {
      bytes_written += static_cast<std::size_t>(n);
      continue;
    }
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      short revents = 0;
      switch (fd_.Wait(POLLOUT, std::chrono::milliseconds(1000), revents)) {
      case WakeableFd::WaitResult::kReady:
        continue;
      case WakeableFd::WaitResult::kClosed:
        error = "serial port is closed";
        return false;
      case WakeableFd::WaitResult::kTimeout:
      case WakeableFd::WaitResult::kError:
        error = "serial write stalled";
        return false;
      }
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    error = ErrnoText("serial write failed");
    return false;
  }

  if (tcdrain(fd) != 0) {
    error = ErrnoText("failed to drain serial output");
    return false;
  }
  return true;
}

bool PosixSerialChannel::Read(std::size_t max_bytes, std::chrono::milliseconds timeout,
                              core::Bytes& data, std::string& error) {
  data.clear();
  const auto lock = fd_.LockReader();
  if (!fd_.IsOpen()) {
    error = "serial port is closed";
    return false;
  }

  short revents = 0;
  switch (fd_.Wait(POLLIN, timeout, revents)) {
  case WakeableFd::WaitResult::kReady:
    break;
  case WakeableFd::WaitResult::kTimeout:
    return true;
  case WakeableFd::WaitResult::kClosed:
    error = "serial port is closed";
    return false;
  case WakeableFd::WaitResult::kError:
    error = ErrnoText("serial poll failed");
    return false;
  }
  if ((revents & (POLLERR | POLLHUP | POLLNVAL)) != 0) {
    error = "serial port reported a hangup or error";
    return false;
  }

  data.resize(max_bytes);
  const ssize_t n = ::read(fd_.Get(), data.data(), max_bytes);
  if (n < 0) {
    data.clear();
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return true;
    }
    error = ErrnoText("serial read failed");
    return false;
  }
  data.resize(static_cast<std::size_t>(n));
  return true;
}

LineState PosixSerialChannel::QueryLineState() const {
  LineState state;
  const auto lock = fd_.LockWriter();
  if (!fd_.IsOpen()) {
    return state;
  }
  const int fd = fd_.Get();

  int lines = 0;
  if (ioctl(fd, TIOCMGET, &lines) == 0) {
    state.cts_holding = (lines & TIOCM_CTS) != 0;
    state.dsr_holding = (lines & TIOCM_DSR) != 0;
    state.cd_holding = (lines & TIOCM_CD) != 0;
  }
  int pending = 0;
  if (ioctl(fd, FIONREAD, &pending) == 0 && pending > 0) {
    state.bytes_to_read = static_cast<std::uint32_t>(pending);
  }
  pending = 0;
  if (ioctl(fd, TIOCOUTQ, &pending) == 0 && pending > 0) {
    state.bytes_to_write = static_cast<std::uint32_t>(pending);
  }
  return state;
}

} // namespace hwbridge::sessions
