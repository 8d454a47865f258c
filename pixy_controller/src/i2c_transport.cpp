#include "i2c_transport.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <linux/i2c-dev.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace pixy {

I2cTransport::~I2cTransport() {
  shutdown();
  close();
}

bool I2cTransport::open(const std::string& device, uint8_t address) {
  close();
  const int fd = ::open(device.c_str(), O_RDWR);
  if (fd < 0) {
    set_last_error("open " + device + ": " + std::strerror(errno));
    return false;
  }

  if (::ioctl(fd, I2C_SLAVE, (long)address) < 0) {
    char addr[8];
    std::snprintf(addr, sizeof(addr), "0x%02X", (unsigned)address);
    set_last_error("I2C_SLAVE " + std::string(addr) + " on " + device + ": " + std::strerror(errno));
    ::close(fd);
    return false;
  }

  m_fd.store(fd);
  return true;
}

void I2cTransport::close() {
  const int fd = m_fd.exchange(-1);
  if (fd >= 0) ::close(fd);
}

int I2cTransport::read_bytes(uint8_t* out, size_t len) {
  const int fd = m_fd.load();
  if (fd < 0) return -1;
  const ssize_t n = ::read(fd, out, len);
  return (int)n;
}

int I2cTransport::write_bytes(const uint8_t* data, size_t len) {
  const int fd = m_fd.load();
  if (fd < 0) return -1;
  const ssize_t n = ::write(fd, data, len);
  return (int)n;
}

} // namespace pixy
