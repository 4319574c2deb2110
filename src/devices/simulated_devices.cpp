#include "devices/simulated_devices.hpp"

#include <chrono>

namespace hwbridge::devices {

std::vector<DeviceInfo> BuildSimulatedDevices() {
  const auto now = std::chrono::system_clock::now();
  std::vector<DeviceInfo> devices;

  {
    DeviceInfo printer;
    printer.id = "printer_test1";
    printer.name = "Test Printer 1";
    printer.type = DeviceType::kPrinter;
    printer.manufacturer = "Test Manufacturer";
    printer.model = "Model X1";
    printer.serial_number = "SN123456";
    printer.details.emplace_back(PrinterDetail{});
    devices.push_back(std::move(printer));
  }

  {
    DeviceInfo serial;
    serial.id = "serial_com1";
    serial.name = "COM1";
    serial.type = DeviceType::kSerial;
    serial.manufacturer = "Generic";
    serial.model = "Virtual UART";
    SerialDetail detail;
    detail.port_name = "COM1";
    serial.details.emplace_back(std::move(detail));
    devices.push_back(std::move(serial));
  }

  {
    DeviceInfo hid;
    hid.id = "usbhid_1234_5678";
    hid.name = "Simulated HID Device";
    hid.type = DeviceType::kUsbHid;
    hid.manufacturer = "Generic";
    hid.model = "HID 1234:5678";
    UsbHidDetail detail;
    detail.vendor_id = 0x1234;
    detail.product_id = 0x5678;
    detail.device_path = "/dev/hidraw0";
    hid.details.emplace_back(std::move(detail));
    devices.push_back(std::move(hid));
  }

  {
    DeviceInfo network_printer;
    network_printer.id = "network_printer_1";
    network_printer.name = "Network Printer 1";
    network_printer.type = DeviceType::kNetwork;
    network_printer.manufacturer = "Test Manufacturer";
    network_printer.model = "NetPrint 9100";
    network_printer.details.emplace_back(PrinterDetail{});
    network_printer.details.emplace_back(
        NetworkDetail{.host = "127.0.0.1", .port = 9100, .protocol = "tcp"});
    devices.push_back(std::move(network_printer));
  }

  {
    DeviceInfo reader;
    reader.id = "biometric_1";
    reader.name = "Fingerprint Reader 1";
    reader.type = DeviceType::kBiometric;
    reader.manufacturer = "ZKTeco";
    reader.model = "Simulated";
    reader.details.emplace_back(BiometricDetail{});
    devices.push_back(std::move(reader));
  }

  for (auto& device : devices) {
    device.simulated = true;
    device.last_seen = now;
  }
  return devices;
}

} // namespace hwbridge::devices
