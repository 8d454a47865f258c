#pragma once
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>

#include "serial_bus_device.hpp"

namespace pixy {

class UartTransport : public SerialBusDevice {
public:
  explicit UartTransport(const std::string& name) : SerialBusDevice(name) {}
  ~UartTransport() override;

  // Raw 8N1. A read waits at most read_timeout_ms for all requested bytes.
  bool open(const std::string& device, uint32_t baud, int read_timeout_ms);
  void close();

protected:
  int read_bytes(uint8_t* out, size_t len) override;
  int write_bytes(const uint8_t* data, size_t len) override;

private:
  std::atomic<int> m_fd{-1};
  int m_timeout_ms = 100;
};

} // namespace pixy
