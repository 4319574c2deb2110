#pragma once

#include <cstddef>
#include <string>

namespace hwbridge::rpc {

// Outbound side of the transport as seen by services that push notifications.
// Implementations must be callable from any thread and must drop frames for
// connections that are already closed.
class INotificationSink {
public:
  virtual ~INotificationSink() = default;

  // Delivers `frame` once to every open connection.
  virtual void Broadcast(const std::string& frame) = 0;

  // Returns false when `connection_id` is not open.
  virtual bool SendTo(const std::string& connection_id, const std::string& frame) = 0;

  virtual std::size_t ConnectionCount() const = 0;
};

} // namespace hwbridge::rpc
