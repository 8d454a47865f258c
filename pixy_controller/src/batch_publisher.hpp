#pragma once
#include <mutex>
#include <vector>

#include "protocol.hpp"

namespace pixy {

// Single-slot hand-off between the decoder (transport thread) and a polling
// consumer (any thread). A new batch replaces an unconsumed one.
class BatchPublisher {
public:
  // Empty batches are ignored.
  void publish(std::vector<ObjectBlock> batch);

  // Non-blocking. Returns false if nothing was published since the last
  // successful poll; otherwise moves the batch into `out` and clears the slot.
  bool poll(std::vector<ObjectBlock>& out);

  bool has_batch() const;

private:
  mutable std::mutex m_mutex;
  std::vector<ObjectBlock> m_slot;
  bool m_full = false;
};

} // namespace pixy
