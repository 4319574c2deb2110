#include "rpc/jsonrpc_message.hpp"

namespace hwbridge::rpc {

core::json::Value ToJson(const core::errors::RpcError& error) {
  core::json::Value out = core::json::MakeObject();
  out.Set("code", core::json::MakeNumber(error.code));
  out.Set("message", core::json::MakeString(error.message));
  if (error.data.has_value()) {
    out.Set("data", core::json::MakeString(*error.data));
  }
  return out;
}

std::string BuildResultResponse(const core::json::Value& id, core::json::Value result) {
  core::json::Value frame = core::json::MakeObject();
  frame.Set("jsonrpc", core::json::MakeString(std::string(kJsonRpcVersion)));
  frame.Set("result", std::move(result));
  frame.Set("id", id);
  return core::json::Serialize(frame);
}

std::string BuildErrorResponse(const core::json::Value& id, const core::errors::RpcError& error) {
  core::json::Value frame = core::json::MakeObject();
  frame.Set("jsonrpc", core::json::MakeString(std::string(kJsonRpcVersion)));
  frame.Set("error", ToJson(error));
  frame.Set("id", id);
  return core::json::Serialize(frame);
}

std::string BuildNotification(std::string_view method, core::json::Value params) {
  core::json::Value frame = core::json::MakeObject();
  frame.Set("jsonrpc", core::json::MakeString(std::string(kJsonRpcVersion)));
  frame.Set("method", core::json::MakeString(std::string(method)));
  frame.Set("params", std::move(params));
  return core::json::Serialize(frame);
}

} // namespace hwbridge::rpc
