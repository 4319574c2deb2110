#pragma once

#include "sessions/device_channel.hpp"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace hwbridge::sessions {

// In-memory channel backing simulated devices. Written bytes are echoed back
// to the read side, and tests can inject inbound bytes or a one-shot I/O
// failure.
class LoopbackChannel final : public IDeviceChannel {
public:
  explicit LoopbackChannel(bool echo_writes = true);

  bool Open(std::string& error) override;
  void Close() override;

  bool Write(const core::Bytes& data, std::size_t& bytes_written, std::string& error) override;
  bool Read(std::size_t max_bytes, std::chrono::milliseconds timeout, core::Bytes& data,
            std::string& error) override;

  LineState QueryLineState() const override;

  void InjectInbound(const core::Bytes& data);
  void FailNextOperation(std::string error);

private:
  bool ConsumeInjectedFailure(std::string& error);

  bool echo_writes_ = true;
  mutable std::mutex mutex_;
  std::condition_variable readable_;
  std::deque<std::uint8_t> inbound_;
  bool open_ = false;
  std::optional<std::string> pending_failure_;
};

} // namespace hwbridge::sessions
