#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include "frame_decoder.hpp"
#include "log.hpp"
#include "pixy_cam.hpp"
#include "serial_bus_device.hpp"

namespace pixy {

enum class TransportKind : uint8_t {
  I2C,
  UART,
};

const char* transport_kind_name(TransportKind kind);

struct PixyConfig {
  std::string name = "pixy";
  TransportKind transport = TransportKind::I2C;
  std::string i2c_device = "/dev/i2c-1";
  uint8_t i2c_addr = PIXY_DEFAULT_I2C_ADDR;
  std::string uart_device = "/dev/ttyAMA0";
  uint32_t baud = PIXY_DEFAULT_BAUD;
  int read_timeout_ms = 100;
  Framing framing = Framing::WORD;
  WriteMode write_mode = WriteMode::BUFFER;
  LogLevel log_level = LogLevel::INFO;
};

// Reads PIXY_* environment variables over the defaults. Unrecognized values
// keep the default and log a warning.
PixyConfig load_config();

// Device node of the selected transport.
const std::string& device_path(const PixyConfig& cfg);
void set_device_path(PixyConfig& cfg, const std::string& path);

// Opens the configured transport. Returns nullptr and fills `err` on failure.
std::unique_ptr<SerialBusDevice> open_transport(const PixyConfig& cfg, std::string& err);

} // namespace pixy
