#pragma once
#include <atomic>
#include <cstdint>
#include <cstddef>
#include <memory>

#include "batch_publisher.hpp"
#include "block_assembler.hpp"
#include "decoder_trace.hpp"
#include "protocol.hpp"
#include "transport.hpp"

namespace pixy {

enum class Framing : uint8_t {
  WORD,   // 2-byte sync/checksum reads, whole block bodies
  BYTE,   // one byte per read
};

const char* framing_name(Framing framing);
bool parse_framing(const char* text, Framing& out);

// Reactive decoder for the object block stream. Every completion issues
// exactly one follow-up read before returning, except when it throws
// ProtocolViolation. Completions must be delivered serially.
class FrameDecoder : public CompletionHandler {
public:
  FrameDecoder(Transport& transport, BatchPublisher& publisher, DecoderTrace& trace);
  ~FrameDecoder() override = default;

  FrameDecoder(const FrameDecoder&) = delete;
  FrameDecoder& operator=(const FrameDecoder&) = delete;

  // Queues the first sync read. Later calls do nothing.
  void start();
  bool started() const { return m_started.load(); }

  virtual Framing framing() const = 0;

  const BlockAssembler& assembler() const { return m_assembler; }

protected:
  virtual void issue_initial_read() = 0;

  void read(RequestTag tag, size_t len);

  // A sync word showed up where a checksum belongs: publish what the frame
  // collected and open the next frame with that sync.
  void end_of_frame(uint16_t next_sync);

  void finalize_block();

  [[noreturn]] void violation(RequestTag tag, size_t len, const char* what) const;

  Transport& m_transport;
  BatchPublisher& m_publisher;
  DecoderTrace& m_trace;
  BlockAssembler m_assembler;

private:
  std::atomic<bool> m_started{false};
};

class WordFrameDecoder final : public FrameDecoder {
public:
  using FrameDecoder::FrameDecoder;

  Framing framing() const override { return Framing::WORD; }
  void read_completion(RequestTag tag, const uint8_t* data, size_t len, bool error) override;

protected:
  void issue_initial_read() override;

private:
  void on_sync(const uint8_t* data, size_t len);
  void on_align(const uint8_t* data, size_t len);
  void on_checksum(const uint8_t* data, size_t len);
  void on_body(RequestTag tag, const uint8_t* data, size_t len);
};

// Byte-at-a-time walk of the same protocol. Unlike the word decoder it
// rejects signatures outside [SIGNATURE_MIN, SIGNATURE_MAX] before reading
// the rest of the block.
class ByteFrameDecoder final : public FrameDecoder {
public:
  using FrameDecoder::FrameDecoder;

  Framing framing() const override { return Framing::BYTE; }
  void read_completion(RequestTag tag, const uint8_t* data, size_t len, bool error) override;

protected:
  void issue_initial_read() override;

private:
  void on_field_high(BlockField field, uint8_t high, RequestTag next);

  uint8_t m_low = 0;   // low byte of the word being assembled
};

std::unique_ptr<FrameDecoder> make_frame_decoder(Framing framing, Transport& transport,
                                                 BatchPublisher& publisher, DecoderTrace& trace);

} // namespace pixy
