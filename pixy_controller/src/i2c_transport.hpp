#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include "serial_bus_device.hpp"

namespace pixy {

// Linux i2c-dev bus device (/dev/i2c-N) bound to one slave address.
class I2cTransport : public SerialBusDevice {
public:
  explicit I2cTransport(const std::string& name) : SerialBusDevice(name) {}
  ~I2cTransport() override;

  bool open(const std::string& device, uint8_t address);
  void close();

protected:
  int read_bytes(uint8_t* out, size_t len) override;
  int write_bytes(const uint8_t* data, size_t len) override;

private:
  std::atomic<int> m_fd{-1};
};

} // namespace pixy
