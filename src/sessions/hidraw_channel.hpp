#pragma once

#include "sessions/device_channel.hpp"
#include "sessions/wakeable_fd.hpp"

#include <string>

namespace hwbridge::sessions {

// Linux hidraw node. Each Write is one output report (report id first, as
// the hidraw interface expects); each Read returns one input report.
class HidrawChannel final : public IDeviceChannel {
public:
  explicit HidrawChannel(std::string device_path);
  ~HidrawChannel() override;

  HidrawChannel(const HidrawChannel&) = delete;
  HidrawChannel& operator=(const HidrawChannel&) = delete;

  bool Open(std::string& error) override;
  void Close() override;

  bool Write(const core::Bytes& data, std::size_t& bytes_written, std::string& error) override;
  bool Read(std::size_t max_bytes, std::chrono::milliseconds timeout, core::Bytes& data,
            std::string& error) override;

private:
  std::string device_path_;
  WakeableFd fd_;
};

} // namespace hwbridge::sessions
