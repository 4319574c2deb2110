#pragma once

#include "core/payload_encoding.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace hwbridge::sessions {

// Modem-line and driver-buffer state. Channels without hardware lines report
// everything false/zero.
struct LineState {
  bool cts_holding = false;
  bool dsr_holding = false;
  bool cd_holding = false;
  std::uint32_t bytes_to_read = 0;
  std::uint32_t bytes_to_write = 0;
};

// Byte-stream handle behind one open serial or USB HID session.
//
// Contract:
// - Open/Close bracket the underlying resource; Close is idempotent.
// - Read blocks until at least one byte arrives or `timeout` elapses. A
//   timeout is not an error: it returns true with `data` empty.
// - Any false return is an I/O failure and moves the session to ERROR.
class IDeviceChannel {
public:
  virtual ~IDeviceChannel() = default;

  virtual bool Open(std::string& error) = 0;
  virtual void Close() = 0;

  virtual bool Write(const core::Bytes& data, std::size_t& bytes_written, std::string& error) = 0;

  virtual bool Read(std::size_t max_bytes, std::chrono::milliseconds timeout, core::Bytes& data,
                    std::string& error) = 0;

  virtual LineState QueryLineState() const {
    return {};
  }
};

} // namespace hwbridge::sessions
