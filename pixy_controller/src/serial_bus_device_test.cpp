#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "pixy_cam.hpp"
#include "serial_bus_device.hpp"
#include "test_support.hpp"

using namespace pixy;
using namespace pixy::test;

namespace {

// Bus device backed by in-memory buffers. A read takes what is available
// and comes back short when the input runs dry.
class MemoryBusDevice : public SerialBusDevice {
public:
  MemoryBusDevice() : SerialBusDevice("mem") {}
  ~MemoryBusDevice() override { shutdown(); }

  void push_input(const std::vector<uint8_t>& bytes) {
    std::lock_guard<std::mutex> lock(m_io_mutex);
    m_input.insert(m_input.end(), bytes.begin(), bytes.end());
  }

  std::vector<uint8_t> output() const {
    std::lock_guard<std::mutex> lock(m_io_mutex);
    return m_output;
  }

  void fail_reads(bool fail) {
    std::lock_guard<std::mutex> lock(m_io_mutex);
    m_fail_reads = fail;
  }

  void fail_writes(bool fail) {
    std::lock_guard<std::mutex> lock(m_io_mutex);
    m_fail_writes = fail;
  }

protected:
  int read_bytes(uint8_t* out, size_t len) override {
    {
      std::lock_guard<std::mutex> lock(m_io_mutex);
      if (m_fail_reads) return -1;
      if (!m_input.empty()) {
        const size_t n = std::min(len, m_input.size());
        std::copy(m_input.begin(), m_input.begin() + n, out);
        m_input.erase(m_input.begin(), m_input.begin() + n);
        return (int)n;
      }
    }
    // Nothing buffered: behave like a read timeout.
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
    return 0;
  }

  int write_bytes(const uint8_t* data, size_t len) override {
    std::lock_guard<std::mutex> lock(m_io_mutex);
    if (m_fail_writes) return -1;
    m_output.insert(m_output.end(), data, data + len);
    return (int)len;
  }

private:
  mutable std::mutex m_io_mutex;
  std::vector<uint8_t> m_input;
  std::vector<uint8_t> m_output;
  bool m_fail_reads = false;
  bool m_fail_writes = false;
};

struct Completion {
  RequestTag tag;
  std::vector<uint8_t> data;
  bool error;
  std::thread::id thread;
};

class RecordingHandler : public CompletionHandler {
public:
  explicit RecordingHandler(bool throw_on_first = false) : m_throw_on_first(throw_on_first) {}

  void read_completion(RequestTag tag, const uint8_t* data, size_t len, bool error) override {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_completions.push_back(Completion{tag, std::vector<uint8_t>(data, data + len), error,
                                       std::this_thread::get_id()});
    if (m_throw_on_first && m_completions.size() == 1) {
      throw ProtocolViolation("checksum read without a sync word");
    }
  }

  std::vector<Completion> completions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_completions;
  }

private:
  bool m_throw_on_first;
  mutable std::mutex m_mutex;
  std::vector<Completion> m_completions;
};

class SerialBusDeviceTest : public ::testing::Test {
protected:
  void SetUp() override {
    m_saved_level = log_level();
    set_log_level(LogLevel::ERROR);
  }
  void TearDown() override { set_log_level(m_saved_level); }

private:
  LogLevel m_saved_level = LogLevel::INFO;
};

TEST_F(SerialBusDeviceTest, DisabledDeviceHoldsRequests) {
  MemoryBusDevice bus;
  RecordingHandler handler;
  bus.push_input({0x55, 0xAA});
  bus.async_read(RequestTag::SYNC, 2, &handler);

  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_TRUE(handler.completions().empty());
  EXPECT_EQ(1u, bus.pending());
  EXPECT_FALSE(bus.is_enabled());

  bus.set_enabled(true);
  ASSERT_TRUE(bus.wait_idle(1000));
  const std::vector<Completion> done = handler.completions();
  ASSERT_EQ(1u, done.size());
  EXPECT_EQ((std::vector<uint8_t>{0x55, 0xAA}), done[0].data);
  EXPECT_FALSE(done[0].error);
}

TEST_F(SerialBusDeviceTest, CompletesReadsInOrderOnWorkerThread) {
  MemoryBusDevice bus;
  RecordingHandler handler;
  bus.push_input({1, 2, 3, 4, 5});
  bus.async_read(RequestTag::SYNC, 2, &handler);
  bus.async_read(RequestTag::ALIGN, 1, &handler);
  bus.async_read(RequestTag::CHECKSUM, 2, &handler);
  bus.set_enabled(true);
  ASSERT_TRUE(bus.wait_idle(1000));

  const std::vector<Completion> done = handler.completions();
  ASSERT_EQ(3u, done.size());
  EXPECT_EQ(RequestTag::SYNC, done[0].tag);
  EXPECT_EQ((std::vector<uint8_t>{1, 2}), done[0].data);
  EXPECT_EQ(RequestTag::ALIGN, done[1].tag);
  EXPECT_EQ((std::vector<uint8_t>{3}), done[1].data);
  EXPECT_EQ(RequestTag::CHECKSUM, done[2].tag);
  EXPECT_EQ((std::vector<uint8_t>{4, 5}), done[2].data);
  for (const Completion& c : done) {
    EXPECT_FALSE(c.error);
    EXPECT_NE(std::this_thread::get_id(), c.thread);
  }
}

TEST_F(SerialBusDeviceTest, ShortReadIsReportedAsError) {
  MemoryBusDevice bus;
  RecordingHandler handler;
  bus.push_input({0x41});
  bus.async_read(RequestTag::CHECKSUM, 2, &handler);
  bus.set_enabled(true);
  ASSERT_TRUE(bus.wait_idle(1000));

  const std::vector<Completion> done = handler.completions();
  ASSERT_EQ(1u, done.size());
  EXPECT_TRUE(done[0].error);
  EXPECT_EQ(std::vector<uint8_t>{0x41}, done[0].data);
}

TEST_F(SerialBusDeviceTest, FailedReadDeliversNoData) {
  MemoryBusDevice bus;
  RecordingHandler handler;
  bus.push_input({0x55, 0xAA});
  bus.fail_reads(true);
  bus.async_read(RequestTag::SYNC, 2, &handler);
  bus.set_enabled(true);
  ASSERT_TRUE(bus.wait_idle(1000));

  const std::vector<Completion> done = handler.completions();
  ASSERT_EQ(1u, done.size());
  EXPECT_TRUE(done[0].error);
  EXPECT_TRUE(done[0].data.empty());
}

TEST_F(SerialBusDeviceTest, WritesGoOutInOrder) {
  MemoryBusDevice bus;
  const uint8_t first[3] = {0x00, 0xFE, 0x10};
  const uint8_t second[1] = {0x42};
  bus.async_write(RequestTag::NONE, first, sizeof(first));
  bus.async_write(RequestTag::NONE, second, sizeof(second));
  EXPECT_TRUE(bus.output().empty());

  bus.set_enabled(true);
  ASSERT_TRUE(bus.wait_idle(1000));
  EXPECT_EQ((std::vector<uint8_t>{0x00, 0xFE, 0x10, 0x42}), bus.output());
}

TEST_F(SerialBusDeviceTest, FailedWriteIsRecorded) {
  MemoryBusDevice bus;
  bus.fail_writes(true);
  {
    PixyCam cam("mem", bus);
    cam.set_led(1, 2, 3);
  }
  EXPECT_EQ(0u, bus.write_failures());

  bus.set_enabled(true);
  ASSERT_TRUE(bus.wait_idle(1000));
  EXPECT_EQ(1u, bus.write_failures());
  EXPECT_NE(std::string::npos, bus.last_error().find("write of 5 byte(s) failed"));
  EXPECT_FALSE(bus.faulted());
  EXPECT_TRUE(bus.output().empty());

  // The device keeps serving later requests.
  bus.fail_writes(false);
  const uint8_t cmd[3] = {0x00, 0xFE, 0x20};
  bus.async_write(RequestTag::NONE, cmd, sizeof(cmd));
  ASSERT_TRUE(bus.wait_idle(1000));
  EXPECT_EQ(1u, bus.write_failures());
  EXPECT_EQ((std::vector<uint8_t>{0x00, 0xFE, 0x20}), bus.output());
}

TEST_F(SerialBusDeviceTest, ProtocolViolationHaltsDevice) {
  MemoryBusDevice bus;
  RecordingHandler handler(true);
  bus.push_input({1, 2, 3, 4});
  bus.async_read(RequestTag::CHECKSUM, 2, &handler);
  bus.async_read(RequestTag::CHECKSUM, 2, &handler);
  bus.set_enabled(true);

  EXPECT_FALSE(bus.wait_idle(1000));
  EXPECT_TRUE(bus.faulted());
  EXPECT_NE(std::string::npos, bus.last_error().find("checksum read without a sync word"));
  EXPECT_EQ(0u, bus.pending());

  bus.async_read(RequestTag::SYNC, 2, &handler);
  EXPECT_EQ(0u, bus.pending());
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(1u, handler.completions().size());
}

TEST_F(SerialBusDeviceTest, NothingIsQueuedAfterShutdown) {
  MemoryBusDevice bus;
  RecordingHandler handler;
  bus.set_enabled(true);
  bus.shutdown();
  bus.async_read(RequestTag::SYNC, 2, &handler);
  EXPECT_EQ(0u, bus.pending());
  EXPECT_TRUE(handler.completions().empty());
}

TEST_F(SerialBusDeviceTest, CameraDecodesFramesFromDevice) {
  MemoryBusDevice bus;
  const ObjectBlock a = plain_block(1, 100, 50, 10, 20);
  const ObjectBlock b = cc_block(2, 200, 150, 30, 40, -30);
  std::vector<uint8_t> stream = {0x00, 0x00, 0x37};
  append(stream, encode_frame({a, b}));
  append(stream, frame_terminator());
  bus.push_input(stream);

  std::vector<ObjectBlock> batch;
  bool got = false;
  {
    PixyCam cam("mem", bus, Framing::WORD);
    cam.set_pan_tilt(1000, 0);
    cam.set_enabled(true);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!got && std::chrono::steady_clock::now() < deadline) {
      got = cam.poll_batch(batch);
      if (!got) std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    EXPECT_FALSE(cam.faulted());
    bus.shutdown();
  }

  ASSERT_TRUE(got);
  ASSERT_EQ(2u, batch.size());
  EXPECT_EQ(a, batch[0]);
  EXPECT_EQ(b, batch[1]);
  EXPECT_EQ((std::vector<uint8_t>{0x00, 0xFF, 0xE8, 0x03, 0x00, 0x00}), bus.output());
}

} // namespace
