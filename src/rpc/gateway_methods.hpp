#pragma once

#include "rpc/dispatcher.hpp"
#include "services/gateway_services.hpp"

namespace hwbridge::rpc {

// Registers every method of the public surface. `services` must outlive the
// dispatcher.
void RegisterGatewayMethods(Dispatcher& dispatcher, services::GatewayServices& services);

// Per-namespace registration, exposed so tests can mount a subset.
void RegisterDeviceMethods(Dispatcher& dispatcher, services::GatewayServices& services);
void RegisterPrinterMethods(Dispatcher& dispatcher, services::GatewayServices& services);
void RegisterBiometricMethods(Dispatcher& dispatcher, services::GatewayServices& services);
void RegisterSessionMethods(Dispatcher& dispatcher, services::GatewayServices& services);
void RegisterNetworkMethods(Dispatcher& dispatcher, services::GatewayServices& services);
void RegisterQueueMethods(Dispatcher& dispatcher, services::GatewayServices& services);
void RegisterSystemMethods(Dispatcher& dispatcher, services::GatewayServices& services);

} // namespace hwbridge::rpc
