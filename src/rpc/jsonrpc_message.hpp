#pragma once

#include "core/errors/rpc_error.hpp"
#include "core/json_dom.hpp"

#include <string>
#include <string_view>

namespace hwbridge::rpc {

inline constexpr std::string_view kJsonRpcVersion = "2.0";

core::json::Value ToJson(const core::errors::RpcError& error);

// Frame builders. `id` is echoed exactly as received, null included.
std::string BuildResultResponse(const core::json::Value& id, core::json::Value result);
std::string BuildErrorResponse(const core::json::Value& id, const core::errors::RpcError& error);
std::string BuildNotification(std::string_view method, core::json::Value params);

} // namespace hwbridge::rpc
