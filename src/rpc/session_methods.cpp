#include "core/time_utils.hpp"
#include "rpc/gateway_methods.hpp"
#include "rpc/method_support.hpp"

namespace hwbridge::rpc {

namespace {

using core::errors::RpcError;
using core::errors::RpcErrorCode;
using core::json::Value;
using devices::DeviceType;

bool DecodeRequestPayload(const std::string& data, core::PayloadEncoding encoding,
                          core::Bytes& bytes, RpcError& error) {
  std::string decode_error;
  if (!core::DecodePayload(data, encoding, bytes, decode_error)) {
    return FailWith(error, RpcErrorCode::kValidationFailed, decode_error);
  }
  return true;
}

void BuildOpenResult(const sessions::DeviceConnection& opened, Value& result) {
  result = sessions::ToJson(opened);
  SetField(result, "success", true);
}

void BuildCloseResult(const std::string& device_id, bool was_open, Value& result) {
  result = core::json::MakeObject();
  SetField(result, "success", true);
  SetField(result, "deviceId", device_id);
  SetField(result, "wasOpen", was_open);
}

// Zero bytes before the deadline is an answer, not an error.
void BuildReceiveResult(const sessions::ReceiveOutcome& outcome, core::PayloadEncoding encoding,
                        Value& result) {
  result = core::json::MakeObject();
  if (outcome.timed_out) {
    SetField(result, "success", false);
    SetField(result, "error", "timeout");
    SetCount(result, "bytesRead", 0);
    return;
  }
  SetField(result, "success", true);
  SetField(result, "data", core::EncodePayload(outcome.data, encoding));
  SetField(result, "encoding", core::ToString(encoding));
  SetCount(result, "bytesRead", outcome.data.size());
}

MethodHandler SendHandler(services::GatewayServices& services, DeviceType type) {
  return Typed<SendRequest>([&services, type](const RequestContext&, const SendRequest& request,
                                              Value& result, RpcError& error) {
    core::Bytes payload;
    if (!DecodeRequestPayload(request.data, request.encoding, payload, error)) {
      return false;
    }
    std::size_t written = 0;
    sessions::SessionError session_error;
    if (!services.Sessions().Send(request.device_id, type, payload, written, session_error)) {
      return FailWith(error, session_error);
    }
    result = core::json::MakeObject();
    SetField(result, "success", true);
    SetCount(result, "bytesWritten", written);
    return true;
  });
}

MethodHandler ReceiveHandler(services::GatewayServices& services, DeviceType type) {
  return Typed<ReceiveRequest>([&services, type](const RequestContext&,
                                                 const ReceiveRequest& request, Value& result,
                                                 RpcError& error) {
    sessions::ReceiveOutcome outcome;
    sessions::SessionError session_error;
    if (!services.Sessions().Receive(request.device_id, type, request.max_bytes, request.timeout,
                                     outcome, session_error)) {
      return FailWith(error, session_error);
    }
    BuildReceiveResult(outcome, request.encoding, result);
    return true;
  });
}

MethodHandler CloseHandler(services::GatewayServices& services, DeviceType type) {
  return Typed<DeviceRequest>([&services, type](const RequestContext&,
                                                const DeviceRequest& request, Value& result,
                                                RpcError&) {
    BuildCloseResult(request.device_id, services.Sessions().Close(request.device_id, type),
                     result);
    return true;
  });
}

MethodHandler StatusHandler(services::GatewayServices& services) {
  return Typed<DeviceRequest>([&services](const RequestContext&, const DeviceRequest& request,
                                          Value& result, RpcError&) {
    result = sessions::ToJson(services.Sessions().GetStatus(request.device_id));
    SetField(result, "success", true);
    return true;
  });
}

} // namespace

void RegisterSessionMethods(Dispatcher& dispatcher, services::GatewayServices& services) {
  dispatcher.Register(
      "serial.open",
      Typed<SerialOpenRequest>([&services](const RequestContext&,
                                           const SerialOpenRequest& request, Value& result,
                                           RpcError& error) {
        sessions::DeviceConnection opened;
        sessions::SessionError session_error;
        if (!services.Sessions().OpenSerial(request.device_id, request.config, opened,
                                            session_error)) {
          return FailWith(error, session_error);
        }
        BuildOpenResult(opened, result);
        return true;
      }));
  dispatcher.Register("serial.close", CloseHandler(services, DeviceType::kSerial));
  dispatcher.Register("serial.send", SendHandler(services, DeviceType::kSerial));
  dispatcher.Register("serial.receive", ReceiveHandler(services, DeviceType::kSerial));
  dispatcher.Register("serial.getStatus", StatusHandler(services));

  dispatcher.Register(
      "usb.open", Typed<DeviceRequest>([&services](const RequestContext&,
                                                   const DeviceRequest& request, Value& result,
                                                   RpcError& error) {
        sessions::DeviceConnection opened;
        sessions::SessionError session_error;
        if (!services.Sessions().OpenUsb(request.device_id, opened, session_error)) {
          return FailWith(error, session_error);
        }
        BuildOpenResult(opened, result);
        return true;
      }));
  dispatcher.Register("usb.close", CloseHandler(services, DeviceType::kUsbHid));
  dispatcher.Register(
      "usb.sendReport",
      Typed<UsbSendReportRequest>([&services](const RequestContext&,
                                              const UsbSendReportRequest& request, Value& result,
                                              RpcError& error) {
        core::Bytes payload;
        if (!DecodeRequestPayload(request.data, request.encoding, payload, error)) {
          return false;
        }
        std::size_t written = 0;
        sessions::SessionError session_error;
        if (!services.Sessions().SendReport(request.device_id, request.report_id, payload,
                                            written, session_error)) {
          return FailWith(error, session_error);
        }
        result = core::json::MakeObject();
        SetField(result, "success", true);
        SetCount(result, "reportId", request.report_id);
        SetCount(result, "bytesWritten", written);
        return true;
      }));
  dispatcher.Register(
      "usb.receiveReport",
      Typed<UsbReceiveReportRequest>([&services](const RequestContext&,
                                                 const UsbReceiveReportRequest& request,
                                                 Value& result, RpcError& error) {
        std::uint8_t report_id = 0;
        sessions::ReceiveOutcome outcome;
        sessions::SessionError session_error;
        if (!services.Sessions().ReceiveReport(request.device_id, request.timeout, report_id,
                                               outcome, session_error)) {
          return FailWith(error, session_error);
        }
        BuildReceiveResult(outcome, request.encoding, result);
        if (!outcome.timed_out) {
          SetCount(result, "reportId", report_id);
        }
        return true;
      }));
  dispatcher.Register("usb.getStatus", StatusHandler(services));
}

void RegisterNetworkMethods(Dispatcher& dispatcher, services::GatewayServices& services) {
  dispatcher.Register(
      "network.connect",
      Typed<NetworkConnectRequest>([&services](const RequestContext&,
                                               const NetworkConnectRequest& request,
                                               Value& result, RpcError& error) {
        network::ConnectResult connect;
        sessions::SessionError session_error;
        if (!services.Sessions().OpenNetwork(request.device_id, request.host, request.port,
                                             request.protocol, request.timeout, connect,
                                             session_error)) {
          return FailWith(error, session_error);
        }
        result = core::json::MakeObject();
        SetField(result, "success", connect.success);
        SetField(result, "deviceId", request.device_id);
        SetCount(result, "responseTime", static_cast<std::uint64_t>(connect.response_time.count()));
        if (!connect.success) {
          SetField(result, "error", connect.error);
          return true;
        }
        SetField(result, "status", connect.status);
        result.Set("connection", network::ToJson(connect.connection));
        return true;
      }));

  dispatcher.Register(
      "network.disconnect",
      Typed<DeviceRequest>([&services](const RequestContext&, const DeviceRequest& request,
                                       Value& result, RpcError&) {
        bool was_open = services.Sessions().Close(request.device_id, DeviceType::kNetwork);
        if (!was_open) {
          // Pool entries without a session record (a failed redial) still go.
          was_open = services.Network().Disconnect(request.device_id).status == "disconnected";
        }
        result = core::json::MakeObject();
        SetField(result, "success", true);
        SetField(result, "deviceId", request.device_id);
        SetField(result, "status", was_open ? "disconnected" : "not_connected");
        return true;
      }));

  dispatcher.Register("network.send", SendHandler(services, DeviceType::kNetwork));
  dispatcher.Register("network.receive", ReceiveHandler(services, DeviceType::kNetwork));

  dispatcher.Register(
      "network.getStatus",
      Typed<NetworkStatusRequest>([&services](const RequestContext&,
                                              const NetworkStatusRequest& request, Value& result,
                                              RpcError&) {
        result = core::json::MakeObject();
        SetField(result, "success", true);
        if (request.device_id.has_value()) {
          const auto connection = services.Network().GetConnection(*request.device_id);
          SetField(result, "deviceId", *request.device_id);
          SetField(result, "isConnected", connection.has_value() && connection->is_alive);
          if (connection.has_value()) {
            result.Set("connection", network::ToJson(*connection));
          }
          return true;
        }
        const auto connections = services.Network().ListConnections();
        Value list = core::json::MakeArray();
        for (const auto& connection : connections) {
          list.Push(network::ToJson(connection));
        }
        result.Set("connections", std::move(list));
        SetCount(result, "count", connections.size());
        return true;
      }));

  dispatcher.Register(
      "network.ping",
      Typed<NetworkPingRequest>([&services](const RequestContext&,
                                            const NetworkPingRequest& request, Value& result,
                                            RpcError&) {
        result = network::ToJson(
            services.Network().Ping(request.device_id, request.host, request.port,
                                    request.timeout));
        return true;
      }));

  dispatcher.Register("network.discover", [&services](const RequestContext&, const Value& params,
                                                      Value& result, RpcError& error) {
    network::DiscoveryOptions options;
    if (!ParseDiscoverRequest(params, services.Config().discovery, options, error)) {
      return false;
    }
    network::DiscoveryResult discovery;
    std::string discover_error;
    if (!services.Discovery().Discover(options, discovery, discover_error)) {
      return FailWith(error, RpcErrorCode::kValidationFailed, discover_error);
    }
    result = network::ToJson(discovery);
    return true;
  });
}

} // namespace hwbridge::rpc
