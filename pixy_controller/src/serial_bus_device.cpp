#include "serial_bus_device.hpp"
#include "log.hpp"
#include <chrono>
#include <cstdio>
#include <utility>

namespace pixy {

SerialBusDevice::SerialBusDevice(std::string name) : m_name(std::move(name)) {
}

SerialBusDevice::~SerialBusDevice() {
  shutdown();
}

void SerialBusDevice::async_read(RequestTag tag, size_t len, CompletionHandler* handler) {
  Request req;
  req.tag = tag;
  req.is_read = true;
  req.len = len;
  req.handler = handler;
  enqueue(std::move(req));
}

void SerialBusDevice::async_write(RequestTag tag, const uint8_t* data, size_t len) {
  Request req;
  req.tag = tag;
  req.is_read = false;
  req.len = len;
  req.data.assign(data, data + len);
  enqueue(std::move(req));
}

void SerialBusDevice::enqueue(Request req) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_faulted || m_stop) return;
  m_queue.push_back(std::move(req));
  ensure_worker_locked();
  m_cv.notify_one();
}

void SerialBusDevice::ensure_worker_locked() {
  if (m_worker.joinable() || m_stop) return;
  m_worker = std::thread(&SerialBusDevice::run, this);
}

bool SerialBusDevice::is_enabled() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_enabled;
}

void SerialBusDevice::set_enabled(bool enabled) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_enabled = enabled;
  if (enabled) ensure_worker_locked();
  m_cv.notify_all();
}

bool SerialBusDevice::faulted() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_faulted;
}

std::string SerialBusDevice::last_error() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_last_error;
}

void SerialBusDevice::set_last_error(const std::string& msg) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_last_error = msg;
}

size_t SerialBusDevice::write_failures() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_write_failures;
}

size_t SerialBusDevice::pending() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_queue.size();
}

bool SerialBusDevice::wait_idle(int timeout_ms) {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_idle_cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] {
    return m_faulted || (m_queue.empty() && !m_busy);
  });
  return !m_faulted && m_queue.empty() && !m_busy;
}

void SerialBusDevice::shutdown() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stop = true;
  }
  m_cv.notify_all();
  if (m_worker.joinable()) m_worker.join();
}

void SerialBusDevice::run() {
  std::unique_lock<std::mutex> lock(m_mutex);
  while (true) {
    m_cv.wait(lock, [this] {
      return m_stop || (m_enabled && !m_faulted && !m_queue.empty());
    });
    if (m_stop) break;

    Request req = std::move(m_queue.front());
    m_queue.pop_front();
    m_busy = true;
    lock.unlock();

    process(req);

    lock.lock();
    m_busy = false;
    if (m_queue.empty() || m_faulted) m_idle_cv.notify_all();
  }
  m_busy = false;
  m_idle_cv.notify_all();
}

void SerialBusDevice::process(Request& req) {
  if (!req.is_read) {
    const int n = write_bytes(req.data.data(), req.data.size());
    if (n != (int)req.data.size()) {
      char msg[96];
      std::snprintf(msg, sizeof(msg), "write of %zu byte(s) failed (%d)", req.data.size(), n);
      logf(LogLevel::WARN, m_name.c_str(), "%s", msg);
      std::lock_guard<std::mutex> lock(m_mutex);
      ++m_write_failures;
      m_last_error = msg;
    }
    return;
  }

  std::vector<uint8_t> buf(req.len);
  const int n = read_bytes(buf.data(), req.len);
  const size_t got = (n > 0) ? (size_t)n : 0;
  const bool error = (n < 0) || (got != req.len);
  if (!req.handler) return;

  try {
    req.handler->read_completion(req.tag, buf.data(), got, error);
  } catch (const ProtocolViolation& e) {
    logf(LogLevel::ERROR, m_name.c_str(), "protocol violation, halting: %s", e.what());
    std::lock_guard<std::mutex> lock(m_mutex);
    m_faulted = true;
    m_last_error = e.what();
    m_queue.clear();
  }
}

} // namespace pixy
