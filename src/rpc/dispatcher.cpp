#include "rpc/dispatcher.hpp"

#include "rpc/jsonrpc_message.hpp"

#include <exception>

namespace hwbridge::rpc {

namespace {

using core::errors::RpcError;
using core::errors::RpcErrorCode;

bool IsValidId(const core::json::Value& id) {
  return id.IsString() || id.IsNumber() || id.IsNull();
}

} // namespace

Dispatcher::Dispatcher(core::logging::Logger logger) : logger_(std::move(logger)) {}

void Dispatcher::Register(std::string method, MethodHandler handler) {
  handlers_[std::move(method)] = std::move(handler);
}

bool Dispatcher::HasMethod(std::string_view method) const {
  return handlers_.find(method) != handlers_.end();
}

std::vector<std::string> Dispatcher::Methods() const {
  std::vector<std::string> methods;
  methods.reserve(handlers_.size());
  for (const auto& [name, handler] : handlers_) {
    methods.push_back(name);
  }
  return methods;
}

std::optional<std::string> Dispatcher::HandleFrame(const RequestContext& context,
                                                   std::string_view frame) const {
  core::json::Value request;
  std::string parse_error;
  if (!core::json::Parse(frame, request, parse_error)) {
    RpcError error(RpcErrorCode::kParseError, "Parse error");
    error.data = parse_error;
    return BuildErrorResponse(core::json::MakeNull(), error);
  }

  const core::json::Value null_id = core::json::MakeNull();
  if (!request.IsObject()) {
    return BuildErrorResponse(null_id, RpcError(RpcErrorCode::kInvalidRequest, "Invalid Request"));
  }

  const core::json::Value* id = request.Find("id");
  const bool is_notification = id == nullptr;
  if (id != nullptr && !IsValidId(*id)) {
    return BuildErrorResponse(null_id, RpcError(RpcErrorCode::kInvalidRequest, "Invalid Request"));
  }
  const core::json::Value& echo_id = id != nullptr ? *id : null_id;

  // Envelope problems are answered even without an id: a frame that fails
  // validation cannot be trusted to be a notification.
  const core::json::Value* version = request.Find("jsonrpc");
  if (version == nullptr || !version->IsString() || version->string_value != kJsonRpcVersion) {
    return BuildErrorResponse(echo_id, RpcError(RpcErrorCode::kInvalidRequest, "Invalid Request"));
  }
  const core::json::Value* method = request.Find("method");
  if (method == nullptr || !method->IsString() || method->string_value.empty()) {
    return BuildErrorResponse(echo_id, RpcError(RpcErrorCode::kInvalidRequest, "Invalid Request"));
  }

  core::json::Value params = core::json::MakeObject();
  if (const core::json::Value* raw_params = request.Find("params");
      raw_params != nullptr && !raw_params->IsNull()) {
    if (!raw_params->IsObject() && !raw_params->IsArray()) {
      RpcError error(RpcErrorCode::kInvalidRequest, "Invalid Request");
      error.data = "params must be an object or array";
      return BuildErrorResponse(echo_id, error);
    }
    params = *raw_params;
  }

  const auto it = handlers_.find(method->string_value);
  if (it == handlers_.end()) {
    if (is_notification) {
      return std::nullopt;
    }
    RpcError error(RpcErrorCode::kMethodNotFound, "Method not found");
    error.data = method->string_value;
    return BuildErrorResponse(echo_id, error);
  }

  core::json::Value result;
  RpcError error;
  bool ok = false;
  try {
    ok = it->second(context, params, result, error);
  } catch (const std::exception& ex) {
    ok = false;
    error = RpcError(RpcErrorCode::kInternalError, "Internal error");
    error.data = ex.what();
    logger_.Error("rpc handler threw",
                  {{"method", method->string_value},
                   {"connection_id", context.connection_id},
                   {"error", ex.what()}});
  }

  if (is_notification) {
    if (!ok) {
      logger_.Debug("notification handler failed",
                    {{"method", method->string_value}, {"error", error.message}});
    }
    return std::nullopt;
  }
  if (!ok) {
    return BuildErrorResponse(echo_id, error);
  }
  return BuildResultResponse(echo_id, std::move(result));
}

} // namespace hwbridge::rpc
