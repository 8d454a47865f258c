#include "frame_decoder.hpp"
#include <cstdio>
#include <cstring>
#include <utility>
#include <vector>

namespace pixy {

const char* framing_name(Framing framing) {
  switch (framing) {
    case Framing::WORD: return "word";
    case Framing::BYTE: return "byte";
  }
  return "(unknown)";
}

bool parse_framing(const char* text, Framing& out) {
  if (!text || !text[0]) return false;
  if (std::strcmp(text, "word") == 0) { out = Framing::WORD; return true; }
  if (std::strcmp(text, "byte") == 0) { out = Framing::BYTE; return true; }
  return false;
}

FrameDecoder::FrameDecoder(Transport& transport, BatchPublisher& publisher, DecoderTrace& trace)
  : m_transport(transport), m_publisher(publisher), m_trace(trace) {
}

void FrameDecoder::start() {
  if (m_started.exchange(true)) return;
  issue_initial_read();
}

void FrameDecoder::read(RequestTag tag, size_t len) {
  m_transport.async_read(tag, len, this);
}

void FrameDecoder::end_of_frame(uint16_t next_sync) {
  m_assembler.begin(next_sync);
  m_trace.sync_found(next_sync);

  std::vector<ObjectBlock> batch = m_assembler.take_frame();
  if (batch.empty()) return;

  m_trace.batch_published(batch);
  m_publisher.publish(std::move(batch));
}

void FrameDecoder::finalize_block() {
  const ObjectBlock block = m_assembler.pending();
  const uint16_t computed = m_assembler.running_checksum();
  if (m_assembler.finalize()) {
    m_trace.block_accepted(block);
  } else {
    m_trace.checksum_mismatch(block, computed);
  }
}

void FrameDecoder::violation(RequestTag tag, size_t len, const char* what) const {
  char msg[160];
  std::snprintf(msg, sizeof(msg), "%s (tag=%s, len=%zu, framing=%s)",
                what, tag_name(tag), len, framing_name(framing()));
  throw ProtocolViolation(msg);
}

std::unique_ptr<FrameDecoder> make_frame_decoder(Framing framing, Transport& transport,
                                                 BatchPublisher& publisher, DecoderTrace& trace) {
  if (framing == Framing::BYTE) {
    return std::unique_ptr<FrameDecoder>(new ByteFrameDecoder(transport, publisher, trace));
  }
  return std::unique_ptr<FrameDecoder>(new WordFrameDecoder(transport, publisher, trace));
}

} // namespace pixy
