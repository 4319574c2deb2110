#pragma once

#include "core/errors/rpc_error.hpp"
#include "core/json_dom.hpp"
#include "rpc/dispatcher.hpp"
#include "rpc/request_types.hpp"
#include "sessions/session_manager.hpp"

#include <string>
#include <utility>

namespace hwbridge::rpc {

// Adapts a handler taking a typed request into a MethodHandler. The request is
// parsed before the handler runs, so handlers never see raw params.
template <typename Request, typename Fn>
MethodHandler Typed(Fn fn) {
  return [fn = std::move(fn)](const RequestContext& context, const core::json::Value& params,
                              core::json::Value& result, core::errors::RpcError& error) {
    Request request;
    if (!ParseRequest(params, request, error)) {
      return false;
    }
    return fn(context, request, result, error);
  };
}

inline bool FailWith(core::errors::RpcError& error, core::errors::RpcErrorCode code,
                     std::string message) {
  error.Set(code, std::move(message));
  return false;
}

inline bool FailWith(core::errors::RpcError& error, const sessions::SessionError& session_error) {
  error.code = sessions::ToRpcCode(session_error.kind);
  error.message = session_error.message;
  error.data.reset();
  return false;
}

inline void SetField(core::json::Value& object, std::string key, std::string value) {
  object.Set(std::move(key), core::json::MakeString(std::move(value)));
}

inline void SetField(core::json::Value& object, std::string key, const char* value) {
  object.Set(std::move(key), core::json::MakeString(value));
}

inline void SetField(core::json::Value& object, std::string key, bool value) {
  object.Set(std::move(key), core::json::MakeBool(value));
}

inline void SetField(core::json::Value& object, std::string key, double value) {
  object.Set(std::move(key), core::json::MakeNumber(value));
}

inline void SetCount(core::json::Value& object, std::string key, std::uint64_t value) {
  object.Set(std::move(key), core::json::MakeNumber(static_cast<double>(value)));
}

} // namespace hwbridge::rpc
