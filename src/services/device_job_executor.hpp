#pragma once

#include "core/logging/logger.hpp"
#include "printer/printer_service.hpp"
#include "queue/job_executor.hpp"
#include "sessions/session_manager.hpp"

namespace hwbridge::services {

// Queue operations understood by the executor.
inline constexpr const char* kOperationPrint = "print";
inline constexpr const char* kOperationSerialSend = "serial.send";
inline constexpr const char* kOperationUsbSendReport = "usb.sendReport";
inline constexpr const char* kOperationNetworkSend = "network.send";

// Routes claimed jobs to the printer service or the open device session.
//
// Job parameters carry the payload exactly as the client sent it
// (`data` + `encoding`) so a row in the store can be inspected and replayed
// without knowing the wire bytes. Unknown operations and undecodable
// parameters fail permanently; device I/O failures are retryable.
class DeviceJobExecutor final : public queue::IJobExecutor {
public:
  DeviceJobExecutor(printer::PrinterService& printers, sessions::SessionManager& sessions,
                    core::logging::Logger logger);

  queue::JobExecutionResult Execute(const queue::QueueJob& job) override;

private:
  queue::JobExecutionResult RunPrint(const queue::QueueJob& job);
  queue::JobExecutionResult RunSend(const queue::QueueJob& job, devices::DeviceType type);
  queue::JobExecutionResult RunSendReport(const queue::QueueJob& job);

  printer::PrinterService& printers_;
  sessions::SessionManager& sessions_;
  core::logging::Logger logger_;
};

} // namespace hwbridge::services
