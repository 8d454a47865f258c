#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "protocol.hpp"

namespace pixy {

// Observation points of the frame decoders. Implementations only record or
// print; they must not call back into the decoder.
class DecoderTrace {
public:
  virtual ~DecoderTrace() = default;

  virtual void sync_found(uint16_t sync) = 0;
  virtual void realigning() = 0;
  // Discarded input while reading `tag`: a stray word/byte, a bad
  // signature, or a failed read.
  virtual void noise(RequestTag tag, const char* what, unsigned value) = 0;
  virtual void checksum_mismatch(const ObjectBlock& block, uint16_t computed) = 0;
  virtual void block_accepted(const ObjectBlock& block) = 0;
  virtual void batch_published(const std::vector<ObjectBlock>& batch) = 0;
};

class LogTrace : public DecoderTrace {
public:
  explicit LogTrace(std::string component) : m_component(std::move(component)) {}

  void sync_found(uint16_t sync) override;
  void realigning() override;
  void noise(RequestTag tag, const char* what, unsigned value) override;
  void checksum_mismatch(const ObjectBlock& block, uint16_t computed) override;
  void block_accepted(const ObjectBlock& block) override;
  void batch_published(const std::vector<ObjectBlock>& batch) override;

private:
  std::string m_component;
};

} // namespace pixy
