#include "config.hpp"
#include "i2c_transport.hpp"
#include "uart_transport.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>

namespace pixy {

static const char* kComponent = "config";

const char* transport_kind_name(TransportKind kind) {
  switch (kind) {
    case TransportKind::I2C: return "i2c";
    case TransportKind::UART: return "uart";
  }
  return "(unknown)";
}

static const char* env_value(const char* name) {
  const char* v = std::getenv(name);
  if (v && v[0]) return v;
  return nullptr;
}

static bool env_is_true(const char* v) {
  return v && v[0] && v[0] == '1';
}

static bool read_env_u32(const char* name, uint32_t max, uint32_t& out) {
  const char* v = env_value(name);
  if (!v) return false;

  char* end = nullptr;
  errno = 0;
  const unsigned long value = std::strtoul(v, &end, 0);
  if (errno != 0 || end == v || *end != '\0' || value > max) {
    logf(LogLevel::WARN, kComponent, "ignoring %s=%s", name, v);
    return false;
  }
  out = (uint32_t)value;
  return true;
}

PixyConfig load_config() {
  PixyConfig cfg;

  if (const char* v = env_value("PIXY_NAME")) cfg.name = v;

  if (const char* v = env_value("PIXY_TRANSPORT")) {
    if (std::strcmp(v, "i2c") == 0) cfg.transport = TransportKind::I2C;
    else if (std::strcmp(v, "uart") == 0) cfg.transport = TransportKind::UART;
    else logf(LogLevel::WARN, kComponent, "unknown PIXY_TRANSPORT=%s, using %s", v,
              transport_kind_name(cfg.transport));
  }

  if (const char* v = env_value("PIXY_I2C_DEVICE")) cfg.i2c_device = v;
  if (const char* v = env_value("PIXY_UART_DEVICE")) cfg.uart_device = v;

  uint32_t u = 0;
  if (read_env_u32("PIXY_I2C_ADDR", 0x7F, u)) cfg.i2c_addr = (uint8_t)u;
  if (read_env_u32("PIXY_BAUD", 4000000u, u)) cfg.baud = u;
  if (read_env_u32("PIXY_READ_TIMEOUT_MS", 60000u, u)) cfg.read_timeout_ms = (int)u;

  if (const char* v = env_value("PIXY_FRAMING")) {
    if (!parse_framing(v, cfg.framing)) {
      logf(LogLevel::WARN, kComponent, "unknown PIXY_FRAMING=%s, using %s", v, framing_name(cfg.framing));
    }
  }

  cfg.write_mode = env_is_true(env_value("PIXY_BYTE_WRITES")) ? WriteMode::BYTES : WriteMode::BUFFER;

  if (const char* v = env_value("PIXY_LOG_LEVEL")) {
    if (!parse_log_level(v, cfg.log_level)) {
      logf(LogLevel::WARN, kComponent, "unknown PIXY_LOG_LEVEL=%s, using %s", v, log_level_name(cfg.log_level));
    }
  }

  return cfg;
}

const std::string& device_path(const PixyConfig& cfg) {
  return cfg.transport == TransportKind::UART ? cfg.uart_device : cfg.i2c_device;
}

void set_device_path(PixyConfig& cfg, const std::string& path) {
  if (cfg.transport == TransportKind::UART) cfg.uart_device = path;
  else cfg.i2c_device = path;
}

std::unique_ptr<SerialBusDevice> open_transport(const PixyConfig& cfg, std::string& err) {
  if (cfg.transport == TransportKind::UART) {
    std::unique_ptr<UartTransport> uart(new UartTransport(cfg.name + ".uart"));
    if (!uart->open(cfg.uart_device, cfg.baud, cfg.read_timeout_ms)) {
      err = uart->last_error();
      return nullptr;
    }
    return std::unique_ptr<SerialBusDevice>(uart.release());
  }

  std::unique_ptr<I2cTransport> i2c(new I2cTransport(cfg.name + ".i2c"));
  if (!i2c->open(cfg.i2c_device, cfg.i2c_addr)) {
    err = i2c->last_error();
    return nullptr;
  }
  return std::unique_ptr<SerialBusDevice>(i2c.release());
}

} // namespace pixy
