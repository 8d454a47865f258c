#include "pixy_cam.hpp"
#include "log.hpp"
#include <utility>

namespace pixy {

PixyCam::PixyCam(std::string name, Transport& transport, Framing framing, WriteMode write_mode)
  : m_name(std::move(name)),
    m_transport(transport),
    m_write_mode(write_mode),
    m_trace("PixyCam." + m_name),
    m_decoder(make_frame_decoder(framing, transport, m_publisher, m_trace)) {
}

void PixyCam::start() {
  if (m_decoder->started()) return;
  logf(LogLevel::INFO, ("PixyCam." + m_name).c_str(), "starting (%s framing)",
       framing_name(m_decoder->framing()));
  m_decoder->start();
}

bool PixyCam::poll_batch(std::vector<ObjectBlock>& out) {
  return m_publisher.poll(out);
}

void PixyCam::set_led(uint8_t red, uint8_t green, uint8_t blue) {
  uint8_t buf[CMD_MAX_LEN];
  const size_t n = build_set_led(buf, sizeof(buf), red, green, blue);
  write_command(buf, n);
}

void PixyCam::set_brightness(uint8_t brightness) {
  uint8_t buf[CMD_MAX_LEN];
  const size_t n = build_set_brightness(buf, sizeof(buf), brightness);
  write_command(buf, n);
}

void PixyCam::set_pan_tilt(int pan, int tilt) {
  uint8_t buf[CMD_MAX_LEN];
  const size_t n = build_set_pan_tilt(buf, sizeof(buf), pan, tilt);
  write_command(buf, n);
}

void PixyCam::set_enabled(bool enabled) {
  const bool was_enabled = m_transport.is_enabled();
  m_transport.set_enabled(enabled);
  if (!was_enabled && enabled) start();
}

void PixyCam::write_command(const uint8_t* buf, size_t len) {
  if (m_write_mode == WriteMode::BUFFER) {
    m_transport.async_write(RequestTag::NONE, buf, len);
    return;
  }
  for (size_t i = 0; i < len; ++i) {
    m_transport.async_write(RequestTag::NONE, buf + i, 1);
  }
}

} // namespace pixy
