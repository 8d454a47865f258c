#include "batch_publisher.hpp"

namespace pixy {

void BatchPublisher::publish(std::vector<ObjectBlock> batch) {
  if (batch.empty()) return;
  std::lock_guard<std::mutex> lock(m_mutex);
  m_slot.swap(batch);
  m_full = true;
}

bool BatchPublisher::poll(std::vector<ObjectBlock>& out) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (!m_full) return false;
  out.clear();
  out.swap(m_slot);
  m_full = false;
  return true;
}

bool BatchPublisher::has_batch() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_full;
}

} // namespace pixy
