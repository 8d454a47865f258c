#pragma once
#include <cstdint>
#include <cstddef>
#include <vector>

#include "protocol.hpp"

namespace pixy {

enum class BlockField : uint8_t {
  SIGNATURE,
  CENTER_X,
  CENTER_Y,
  WIDTH,
  HEIGHT,
  ANGLE,
};

// Holds the one block being decoded plus its running checksum, and the
// blocks of the current frame that passed their checksum. Both decoders
// feed fields through accumulate() so the arithmetic lives in one place.
class BlockAssembler {
public:
  // Starts a new candidate block. Any unfinished block is dropped.
  void begin(uint16_t sync);
  void set_checksum(uint16_t checksum);

  // Stores one body field and adds it to the running checksum (16-bit
  // wrap-around, matching the camera firmware).
  void accumulate(BlockField field, uint16_t value);

  // Decodes a little-endian body of body_length(sync) bytes.
  void accumulate_body(const uint8_t* body, size_t len);

  // Appends the block to the frame if the running checksum matches the
  // declared one. Either way the block is no longer in progress.
  bool finalize();
  void discard();

  bool in_progress() const { return m_active; }
  const ObjectBlock& pending() const { return m_block; }
  uint16_t running_checksum() const { return m_running; }

  size_t frame_size() const { return m_frame.size(); }
  const std::vector<ObjectBlock>& frame() const { return m_frame; }

  // Moves out the accepted blocks and starts an empty frame.
  std::vector<ObjectBlock> take_frame();

private:
  ObjectBlock m_block{};
  uint16_t m_running = 0;
  bool m_active = false;
  std::vector<ObjectBlock> m_frame;
};

} // namespace pixy
