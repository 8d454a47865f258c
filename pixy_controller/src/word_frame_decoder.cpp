#include "frame_decoder.hpp"

namespace pixy {

void WordFrameDecoder::issue_initial_read() {
  read(RequestTag::SYNC, 2);
}

void WordFrameDecoder::read_completion(RequestTag tag, const uint8_t* data, size_t len, bool error) {
  if (!is_word_tag(tag)) violation(tag, len, "unexpected request tag");

  if (error) {
    // Nothing arrived while hunting for sync: the line is idle.
    if (tag == RequestTag::SYNC && len == 0) {
      read(RequestTag::SYNC, 2);
      return;
    }
    m_trace.noise(tag, "read failed, length", (unsigned)len);
    m_assembler.discard();
    read(RequestTag::SYNC, 2);
    return;
  }

  switch (tag) {
    case RequestTag::SYNC:
      on_sync(data, len);
      break;
    case RequestTag::ALIGN:
      on_align(data, len);
      break;
    case RequestTag::CHECKSUM:
      on_checksum(data, len);
      break;
    case RequestTag::NORMAL_BLOCK:
    case RequestTag::COLOR_CODE_BLOCK:
      on_body(tag, data, len);
      break;
    default:
      violation(tag, len, "unexpected request tag");
  }
}

void WordFrameDecoder::on_sync(const uint8_t* data, size_t len) {
  if (len != 2) {
    // Short read from the device; hunt for sync again.
    m_trace.noise(RequestTag::SYNC, "unexpected data length", (unsigned)len);
    read(RequestTag::SYNC, 2);
    return;
  }

  const uint16_t word = rd16_le(data);
  if (is_sync_word(word)) {
    m_assembler.begin(word);
    m_trace.sync_found(word);
    read(RequestTag::CHECKSUM, 2);
  } else if (word == SYNC_WORDX) {
    // One byte out of phase: we hold the high byte of a previous word and
    // the low byte of a plain sync. The next byte should complete it.
    m_assembler.begin(SYNC_WORD);
    m_trace.realigning();
    read(RequestTag::ALIGN, 1);
  } else {
    if (word != 0) m_trace.noise(RequestTag::SYNC, "unexpected word", word);
    read(RequestTag::SYNC, 2);
  }
}

void WordFrameDecoder::on_align(const uint8_t* data, size_t len) {
  if (len != 1) violation(RequestTag::ALIGN, len, "unexpected data length");

  if (data[0] == SYNC_HIGH) {
    m_trace.sync_found(m_assembler.pending().sync);
    read(RequestTag::CHECKSUM, 2);
  } else {
    // Assume we are word aligned again.
    m_trace.noise(RequestTag::ALIGN, "unexpected byte", data[0]);
    m_assembler.discard();
    read(RequestTag::SYNC, 2);
  }
}

void WordFrameDecoder::on_checksum(const uint8_t* data, size_t len) {
  if (len != 2) violation(RequestTag::CHECKSUM, len, "unexpected data length");
  if (!m_assembler.in_progress()) violation(RequestTag::CHECKSUM, len, "checksum read without a sync word");

  const uint16_t word = rd16_le(data);
  if (is_sync_word(word)) {
    end_of_frame(word);
    read(RequestTag::CHECKSUM, 2);
    return;
  }

  m_assembler.set_checksum(word);
  const uint16_t sync = m_assembler.pending().sync;
  if (sync == SYNC_WORD) {
    read(RequestTag::NORMAL_BLOCK, NORMAL_BODY_LEN);
  } else if (sync == SYNC_WORD_CC) {
    read(RequestTag::COLOR_CODE_BLOCK, CC_BODY_LEN);
  } else {
    violation(RequestTag::CHECKSUM, len, "unexpected sync word");
  }
}

void WordFrameDecoder::on_body(RequestTag tag, const uint8_t* data, size_t len) {
  const uint16_t sync = m_assembler.pending().sync;
  const RequestTag expected = (sync == SYNC_WORD_CC) ? RequestTag::COLOR_CODE_BLOCK
                                                     : RequestTag::NORMAL_BLOCK;
  if (!m_assembler.in_progress() || tag != expected || len != body_length(sync)) {
    violation(tag, len, "unexpected data length");
  }

  m_assembler.accumulate_body(data, len);
  finalize_block();
  read(RequestTag::SYNC, 2);
}

} // namespace pixy
