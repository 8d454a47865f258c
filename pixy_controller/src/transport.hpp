#pragma once
#include <cstdint>
#include <cstddef>
#include <string>

#include "protocol.hpp"

namespace pixy {

class CompletionHandler {
public:
  virtual ~CompletionHandler() = default;

  // Called once per read request, on the transport's delivery thread, one
  // completion at a time. When `error` is true, `data` holds only the bytes
  // that arrived before the failure (possibly none).
  virtual void read_completion(RequestTag tag, const uint8_t* data, size_t len, bool error) = 0;
};

// Asynchronous byte source/sink. I2C and serial devices implement this; the
// decoder never knows which one it is talking to.
class Transport {
public:
  virtual ~Transport() = default;

  // Queues a read of `len` bytes; `handler` receives the completion.
  virtual void async_read(RequestTag tag, size_t len, CompletionHandler* handler) = 0;

  // Fire-and-forget; no completion is delivered.
  virtual void async_write(RequestTag tag, const uint8_t* data, size_t len) = 0;

  virtual bool is_enabled() const = 0;
  virtual void set_enabled(bool enabled) = 0;

  virtual bool faulted() const { return false; }
  virtual std::string last_error() const { return std::string(); }
};

} // namespace pixy
