#include "uart_transport.hpp"
#include <unistd.h>
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace pixy {

static speed_t baud_to_speed(uint32_t baud) {
  switch (baud) {
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
    case 460800: return B460800;
    case 921600: return B921600;
    default: return B19200;
  }
}

UartTransport::~UartTransport() {
  shutdown();
  close();
}

bool UartTransport::open(const std::string& device, uint32_t baud, int read_timeout_ms) {
  close();
  const int fd = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    set_last_error("open " + device + ": " + std::strerror(errno));
    return false;
  }

  termios tio{};
  if (::tcgetattr(fd, &tio) != 0) {
    set_last_error("tcgetattr " + device + ": " + std::strerror(errno));
    ::close(fd);
    return false;
  }

  ::cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~CRTSCTS; // no HW flow control
  tio.c_cflag &= ~PARENB;
  tio.c_cflag &= ~CSTOPB;
  tio.c_cflag &= ~CSIZE;
  tio.c_cflag |= CS8;

  const speed_t spd = baud_to_speed(baud);
  ::cfsetispeed(&tio, spd);
  ::cfsetospeed(&tio, spd);

  if (::tcsetattr(fd, TCSANOW, &tio) != 0) {
    set_last_error("tcsetattr " + device + ": " + std::strerror(errno));
    ::close(fd);
    return false;
  }

  ::tcflush(fd, TCIOFLUSH);
  m_timeout_ms = read_timeout_ms > 0 ? read_timeout_ms : 1;
  m_fd.store(fd);
  return true;
}

void UartTransport::close() {
  const int fd = m_fd.exchange(-1);
  if (fd >= 0) ::close(fd);
}

int UartTransport::read_bytes(uint8_t* out, size_t len) {
  const int fd = m_fd.load();
  if (fd < 0) return -1;

  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::milliseconds(m_timeout_ms);

  size_t got = 0;
  while (got < len) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now()).count();
    if (left <= 0) break;

    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLIN;
    const int pr = ::poll(&pfd, 1, (int)left);
    if (pr < 0) {
      if (errno == EINTR) continue;
      return -1;
    }
    if (pr == 0) break;
    if (pfd.revents & (POLLERR | POLLNVAL)) return -1;

    const ssize_t n = ::read(fd, out + got, len - got);
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      return -1;
    }
    got += (size_t)n;
  }
  return (int)got;
}

int UartTransport::write_bytes(const uint8_t* data, size_t len) {
  const int fd = m_fd.load();
  if (fd < 0) return -1;
  const ssize_t n = ::write(fd, data, len);
  return (int)n;
}

} // namespace pixy
