#pragma once
#include <condition_variable>
#include <cstdint>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "transport.hpp"

namespace pixy {

// Request queue plus one worker thread. async_read/async_write only enqueue;
// the worker performs each request with blocking I/O, in order, and delivers
// read completions on its own thread one at a time. Subclasses supply the
// blocking I/O.
//
// A ProtocolViolation thrown by a completion handler halts the device: the
// queue is dropped, faulted() turns true and last_error() holds the message.
class SerialBusDevice : public Transport {
public:
  explicit SerialBusDevice(std::string name);
  ~SerialBusDevice() override;

  SerialBusDevice(const SerialBusDevice&) = delete;
  SerialBusDevice& operator=(const SerialBusDevice&) = delete;

  void async_read(RequestTag tag, size_t len, CompletionHandler* handler) override;
  void async_write(RequestTag tag, const uint8_t* data, size_t len) override;

  bool is_enabled() const override;
  void set_enabled(bool enabled) override;

  bool faulted() const override;
  std::string last_error() const override;

  const std::string& name() const { return m_name; }
  size_t pending() const;

  // Writes that transferred fewer bytes than requested. Each one also
  // replaces last_error(); the device keeps running.
  size_t write_failures() const;

  // Blocks until the queue is empty and no request is in flight, the device
  // faults, or timeout_ms elapses. Returns true if the queue drained.
  bool wait_idle(int timeout_ms);

  // Joins the worker; no completion is delivered afterwards. Call before the
  // completion handlers go away. Subclasses also call it from their
  // destructor, before releasing what read_bytes/write_bytes use.
  void shutdown();

protected:
  // Performed on the worker thread. Return the number of bytes transferred
  // (fewer than len on timeout) or -1 on error.
  virtual int read_bytes(uint8_t* out, size_t len) = 0;
  virtual int write_bytes(const uint8_t* data, size_t len) = 0;

  void set_last_error(const std::string& msg);

private:
  struct Request {
    RequestTag tag = RequestTag::NONE;
    bool is_read = false;
    size_t len = 0;
    std::vector<uint8_t> data;
    CompletionHandler* handler = nullptr;
  };

  void enqueue(Request req);
  void ensure_worker_locked();
  void run();
  void process(Request& req);

  std::string m_name;

  mutable std::mutex m_mutex;
  std::condition_variable m_cv;
  std::condition_variable m_idle_cv;
  std::deque<Request> m_queue;
  bool m_enabled = false;
  bool m_busy = false;
  bool m_stop = false;
  bool m_faulted = false;
  size_t m_write_failures = 0;
  std::string m_last_error;
  std::thread m_worker;
};

} // namespace pixy
