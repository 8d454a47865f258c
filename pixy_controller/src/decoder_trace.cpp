#include "decoder_trace.hpp"
#include "log.hpp"

namespace pixy {

void LogTrace::sync_found(uint16_t sync) {
  logf(LogLevel::DEBUG, m_component.c_str(), "sync 0x%04x", (unsigned)sync);
}

void LogTrace::realigning() {
  logf(LogLevel::DEBUG, m_component.c_str(), "word misaligned, realigning...");
}

void LogTrace::noise(RequestTag tag, const char* what, unsigned value) {
  logf(LogLevel::WARN, m_component.c_str(), "%s 0x%04x in %s", what, value, tag_name(tag));
}

void LogTrace::checksum_mismatch(const ObjectBlock& block, uint16_t computed) {
  logf(LogLevel::WARN, m_component.c_str(), "incorrect checksum 0x%04x (expecting 0x%04x)",
       (unsigned)computed, (unsigned)block.checksum);
}

void LogTrace::block_accepted(const ObjectBlock& block) {
  logf(LogLevel::DEBUG, m_component.c_str(), "block %s", block.to_string().c_str());
}

void LogTrace::batch_published(const std::vector<ObjectBlock>& batch) {
  logf(LogLevel::INFO, m_component.c_str(), "frame published: %zu block(s)", batch.size());
  for (size_t i = 0; i < batch.size(); ++i) {
    logf(LogLevel::DEBUG, m_component.c_str(), "[%02zu] %s", i, batch[i].to_string().c_str());
  }
}

} // namespace pixy
