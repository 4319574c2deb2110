#include "sessions/loopback_channel.hpp"

#include <algorithm>

namespace hwbridge::sessions {

LoopbackChannel::LoopbackChannel(bool echo_writes) : echo_writes_(echo_writes) {}

bool LoopbackChannel::Open(std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending_failure_.has_value()) {
    error = *pending_failure_;
    pending_failure_.reset();
    return false;
  }
  open_ = true;
  inbound_.clear();
  return true;
}

void LoopbackChannel::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    inbound_.clear();
  }
  readable_.notify_all();
}

bool LoopbackChannel::ConsumeInjectedFailure(std::string& error) {
  if (!pending_failure_.has_value()) {
    return false;
  }
  error = *pending_failure_;
  pending_failure_.reset();
  return true;
}

bool LoopbackChannel::Write(const core::Bytes& data, std::size_t& bytes_written,
                            std::string& error) {
  bytes_written = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!open_) {
      error = "channel is closed";
      return false;
    }
    if (ConsumeInjectedFailure(error)) {
      return false;
    }
    if (echo_writes_) {
      inbound_.insert(inbound_.end(), data.begin(), data.end());
    }
    bytes_written = data.size();
  }
  readable_.notify_all();
  return true;
}

bool LoopbackChannel::Read(std::size_t max_bytes, std::chrono::milliseconds timeout,
                           core::Bytes& data, std::string& error) {
  data.clear();
  std::unique_lock<std::mutex> lock(mutex_);
  if (!open_) {
    error = "channel is closed";
    return false;
  }
  if (ConsumeInjectedFailure(error)) {
    return false;
  }

  readable_.wait_for(lock, timeout, [this] { return !inbound_.empty() || !open_; });
  if (!open_) {
    error = "channel closed during read";
    return false;
  }

  const std::size_t count = std::min(max_bytes, inbound_.size());
  data.assign(inbound_.begin(), inbound_.begin() + static_cast<std::ptrdiff_t>(count));
  inbound_.erase(inbound_.begin(), inbound_.begin() + static_cast<std::ptrdiff_t>(count));
  return true;
}

LineState LoopbackChannel::QueryLineState() const {
  std::lock_guard<std::mutex> lock(mutex_);
  LineState state;
  state.cts_holding = open_;
  state.dsr_holding = open_;
  state.cd_holding = false;
  state.bytes_to_read = static_cast<std::uint32_t>(inbound_.size());
  return state;
}

void LoopbackChannel::InjectInbound(const core::Bytes& data) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    inbound_.insert(inbound_.end(), data.begin(), data.end());
  }
  readable_.notify_all();
}

void LoopbackChannel::FailNextOperation(std::string error) {
  std::lock_guard<std::mutex> lock(mutex_);
  pending_failure_ = std::move(error);
}

} // namespace hwbridge::sessions
