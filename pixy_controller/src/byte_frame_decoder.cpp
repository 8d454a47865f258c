#include "frame_decoder.hpp"

namespace pixy {

void ByteFrameDecoder::issue_initial_read() {
  read(RequestTag::SYNC_LOW, 1);
}

void ByteFrameDecoder::read_completion(RequestTag tag, const uint8_t* data, size_t len, bool error) {
  if (!is_byte_tag(tag)) violation(tag, len, "unexpected request tag");

  if (error && len == 0 && tag == RequestTag::SYNC_LOW) {
    read(RequestTag::SYNC_LOW, 1);   // idle line
    return;
  }

  if (error || len != 1) {
    m_trace.noise(tag, "unexpected data length", (unsigned)len);
    m_assembler.discard();
    read(RequestTag::SYNC_LOW, 1);
    return;
  }

  // Everything past the checksum belongs to a block opened by a sync.
  if (tag >= RequestTag::SIGNATURE_LOW && !m_assembler.in_progress()) {
    violation(tag, len, "block field read without a sync word");
  }

  const uint8_t b = data[0];
  switch (tag) {
    case RequestTag::SYNC_LOW:
      if (b == SYNC_LOW || b == SYNC_LOW_CC) {
        m_low = b;
        read(RequestTag::SYNC_HIGH, 1);
      } else {
        if (b != 0) m_trace.noise(tag, "unexpected byte", b);
        read(RequestTag::SYNC_LOW, 1);
      }
      break;

    case RequestTag::SYNC_HIGH:
      if (b == SYNC_HIGH) {
        const uint16_t sync = make_word(m_low, b);
        m_assembler.begin(sync);
        m_trace.sync_found(sync);
        read(RequestTag::CHECKSUM_LOW, 1);
      } else if (b == SYNC_LOW || b == SYNC_LOW_CC) {
        // A repeated low byte may itself start the sync.
        m_trace.noise(tag, "unexpected byte", m_low);
        m_low = b;
        read(RequestTag::SYNC_HIGH, 1);
      } else {
        m_trace.noise(tag, "unexpected byte", b);
        read(RequestTag::SYNC_LOW, 1);
      }
      break;

    case RequestTag::CHECKSUM_LOW:
      m_low = b;
      read(RequestTag::CHECKSUM_HIGH, 1);
      break;

    case RequestTag::CHECKSUM_HIGH: {
      if (!m_assembler.in_progress()) violation(tag, len, "checksum read without a sync word");
      const uint16_t word = make_word(m_low, b);
      if (is_sync_word(word)) {
        end_of_frame(word);
        read(RequestTag::CHECKSUM_LOW, 1);
      } else {
        m_assembler.set_checksum(word);
        read(RequestTag::SIGNATURE_LOW, 1);
      }
      break;
    }

    case RequestTag::SIGNATURE_LOW:
      m_low = b;
      read(RequestTag::SIGNATURE_HIGH, 1);
      break;

    case RequestTag::SIGNATURE_HIGH: {
      const uint16_t signature = make_word(m_low, b);
      m_assembler.accumulate(BlockField::SIGNATURE, signature);
      if (signature < SIGNATURE_MIN || signature > SIGNATURE_MAX) {
        m_trace.noise(tag, "unexpected signature", signature);
        m_assembler.discard();
        read(RequestTag::SYNC_LOW, 1);
      } else {
        read(RequestTag::CENTERX_LOW, 1);
      }
      break;
    }

    case RequestTag::CENTERX_LOW:
      m_low = b;
      read(RequestTag::CENTERX_HIGH, 1);
      break;
    case RequestTag::CENTERX_HIGH:
      on_field_high(BlockField::CENTER_X, b, RequestTag::CENTERY_LOW);
      break;

    case RequestTag::CENTERY_LOW:
      m_low = b;
      read(RequestTag::CENTERY_HIGH, 1);
      break;
    case RequestTag::CENTERY_HIGH:
      on_field_high(BlockField::CENTER_Y, b, RequestTag::WIDTH_LOW);
      break;

    case RequestTag::WIDTH_LOW:
      m_low = b;
      read(RequestTag::WIDTH_HIGH, 1);
      break;
    case RequestTag::WIDTH_HIGH:
      on_field_high(BlockField::WIDTH, b, RequestTag::HEIGHT_LOW);
      break;

    case RequestTag::HEIGHT_LOW:
      m_low = b;
      read(RequestTag::HEIGHT_HIGH, 1);
      break;
    case RequestTag::HEIGHT_HIGH:
      m_assembler.accumulate(BlockField::HEIGHT, make_word(m_low, b));
      if (m_assembler.pending().color_coded()) {
        read(RequestTag::ANGLE_LOW, 1);
      } else {
        finalize_block();
        read(RequestTag::SYNC_LOW, 1);
      }
      break;

    case RequestTag::ANGLE_LOW:
      if (!m_assembler.pending().color_coded()) violation(tag, len, "angle read for a plain block");
      m_low = b;
      read(RequestTag::ANGLE_HIGH, 1);
      break;
    case RequestTag::ANGLE_HIGH:
      if (!m_assembler.pending().color_coded()) violation(tag, len, "angle read for a plain block");
      m_assembler.accumulate(BlockField::ANGLE, make_word(m_low, b));
      finalize_block();
      read(RequestTag::SYNC_LOW, 1);
      break;

    default:
      violation(tag, len, "unexpected request tag");
  }
}

void ByteFrameDecoder::on_field_high(BlockField field, uint8_t high, RequestTag next) {
  m_assembler.accumulate(field, make_word(m_low, high));
  read(next, 1);
}

} // namespace pixy
