#pragma once
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "batch_publisher.hpp"
#include "decoder_trace.hpp"
#include "frame_decoder.hpp"
#include "protocol.hpp"
#include "transport.hpp"

namespace pixy {

enum class WriteMode : uint8_t {
  BUFFER,   // one write per command
  BYTES,    // one single-byte write per command byte
};

// One camera on one transport. Detected objects arrive asynchronously on the
// transport's thread; poll_batch() may be called from any thread. The
// transport must outlive the camera and be shut down before it is destroyed.
class PixyCam {
public:
  PixyCam(std::string name, Transport& transport,
          Framing framing = Framing::WORD, WriteMode write_mode = WriteMode::BUFFER);

  PixyCam(const PixyCam&) = delete;
  PixyCam& operator=(const PixyCam&) = delete;

  const std::string& name() const { return m_name; }
  Framing framing() const { return m_decoder->framing(); }
  WriteMode write_mode() const { return m_write_mode; }

  // Queues the initial read. Idempotent.
  void start();
  bool started() const { return m_decoder->started(); }

  // Latest complete frame since the previous successful poll. Returns false
  // if there is none.
  bool poll_batch(std::vector<ObjectBlock>& out);

  void set_led(uint8_t red, uint8_t green, uint8_t blue);
  void set_brightness(uint8_t brightness);
  // Throws std::invalid_argument before any I/O if pan or tilt is outside
  // [0, 1000].
  void set_pan_tilt(int pan, int tilt);

  bool is_enabled() const { return m_transport.is_enabled(); }
  // Enabling a disabled camera also starts it.
  void set_enabled(bool enabled);

  bool faulted() const { return m_transport.faulted(); }
  std::string last_error() const { return m_transport.last_error(); }

private:
  void write_command(const uint8_t* buf, size_t len);

  std::string m_name;
  Transport& m_transport;
  WriteMode m_write_mode;
  BatchPublisher m_publisher;
  LogTrace m_trace;
  std::unique_ptr<FrameDecoder> m_decoder;
};

} // namespace pixy
