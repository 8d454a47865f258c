#include "block_assembler.hpp"

namespace pixy {

void BlockAssembler::begin(uint16_t sync) {
  m_block = ObjectBlock{};
  m_block.sync = sync;
  m_running = 0;
  m_active = true;
}

void BlockAssembler::set_checksum(uint16_t checksum) {
  m_block.checksum = checksum;
  m_running = 0;
}

void BlockAssembler::accumulate(BlockField field, uint16_t value) {
  switch (field) {
    case BlockField::SIGNATURE: m_block.signature = value; break;
    case BlockField::CENTER_X: m_block.center_x = value; break;
    case BlockField::CENTER_Y: m_block.center_y = value; break;
    case BlockField::WIDTH: m_block.width = value; break;
    case BlockField::HEIGHT: m_block.height = value; break;
    case BlockField::ANGLE: m_block.angle = (int16_t)value; break;
  }
  m_running = (uint16_t)(m_running + value);
}

void BlockAssembler::accumulate_body(const uint8_t* body, size_t len) {
  static const BlockField kOrder[] = {
    BlockField::SIGNATURE, BlockField::CENTER_X, BlockField::CENTER_Y,
    BlockField::WIDTH, BlockField::HEIGHT, BlockField::ANGLE,
  };

  const size_t fields = len / 2;
  for (size_t i = 0; i < fields && i < sizeof(kOrder) / sizeof(kOrder[0]); ++i) {
    accumulate(kOrder[i], rd16_le(body + i * 2));
  }
}

bool BlockAssembler::finalize() {
  if (!m_active) return false;
  m_active = false;
  if (m_running != m_block.checksum) return false;
  m_frame.push_back(m_block);
  return true;
}

void BlockAssembler::discard() {
  m_active = false;
  m_running = 0;
}

std::vector<ObjectBlock> BlockAssembler::take_frame() {
  std::vector<ObjectBlock> out;
  out.swap(m_frame);
  return out;
}

} // namespace pixy
