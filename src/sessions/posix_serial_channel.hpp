#pragma once

#include "sessions/device_channel.hpp"
#include "sessions/serial_config.hpp"
#include "sessions/wakeable_fd.hpp"

#include <string>

namespace hwbridge::sessions {

// termios-backed serial port. Close() may run while another thread is blocked
// in Read or Write; it wakes them and they fail with "serial port is closed".
class PosixSerialChannel final : public IDeviceChannel {
public:
  PosixSerialChannel(std::string device_path, SerialConfig config);
  ~PosixSerialChannel() override;

  PosixSerialChannel(const PosixSerialChannel&) = delete;
  PosixSerialChannel& operator=(const PosixSerialChannel&) = delete;

  bool Open(std::string& error) override;
  void Close() override;

  bool Write(const core::Bytes& data, std::size_t& bytes_written, std::string& error) override;
  bool Read(std::size_t max_bytes, std::chrono::milliseconds timeout, core::Bytes& data,
            std::string& error) override;

  LineState QueryLineState() const override;

private:
  std::string device_path_;
  SerialConfig config_;
  mutable WakeableFd fd_;
};

} // namespace hwbridge::sessions
