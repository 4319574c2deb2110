#pragma once

#include "core/errors/rpc_error.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hwbridge::rpc {

// Per-frame facts a handler may need about its caller.
struct RequestContext {
  std::string connection_id;
};

// Fills `result` and returns true, or fills `error` and returns false.
// `params` is always an object or array (an absent member arrives as {}).
using MethodHandler = std::function<bool(const RequestContext& context,
                                         const core::json::Value& params,
                                         core::json::Value& result,
                                         core::errors::RpcError& error)>;

// JSON-RPC 2.0 frame router.
//
// Methods are registered once at startup and the table is read-only while
// frames are served, so HandleFrame may run on many threads at once. Protocol
// errors never tear down the connection; they become error responses.
class Dispatcher {
public:
  explicit Dispatcher(core::logging::Logger logger);

  // Later registrations of the same name replace earlier ones.
  void Register(std::string method, MethodHandler handler);

  bool HasMethod(std::string_view method) const;
  std::vector<std::string> Methods() const;

  // Handles one inbound text frame. Returns the serialized response, or
  // nullopt for notifications (frames without an `id` member), which never
  // produce output even when the handler fails.
  std::optional<std::string> HandleFrame(const RequestContext& context,
                                         std::string_view frame) const;

private:
  core::logging::Logger logger_;
  std::map<std::string, MethodHandler, std::less<>> handlers_;
};

} // namespace hwbridge::rpc
