#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "fake_capture_device.h"
#include "frame_pump.h"
#include "frame_store.h"

namespace {

using std::chrono::milliseconds;

std::string make_frame(size_t len, char seed) {
  std::string s(len, '\0');
  for (size_t i = 0; i < len; i++) s[i] = (char)(seed + (char)(i % 97));
  return s;
}

// Maps the fake device into a store and arms the slot, the way
// snapshot_source does at startup.
struct pump_fixture : public ::testing::Test {
  fake_capture_device dev{4096};
  frame_store store;
  std::unique_ptr<frame_pump> pump;

  std::mutex fatal_mtx;
  std::condition_variable fatal_cv;
  bool fatal_seen = false;
  dev_status fatal_status = dev_status::ok;

  void SetUp() override {
    capture_format want;
    want.width = 640;
    want.height = 480;
    want.pixfmt = V4L2_PIX_FMT_MJPEG;
    capture_format got;
    buffer_desc slot;
    buffer_view view;
    ASSERT_EQ(dev.configure(want, &got), dev_status::ok);
    ASSERT_EQ(dev.allocate(1, &slot), dev_status::ok);
    ASSERT_EQ(dev.map(slot, &view), dev_status::ok);
    store.attach(view);
    ASSERT_EQ(dev.enqueue(slot.index), dev_status::ok);
    ASSERT_EQ(dev.start(), dev_status::ok);

    pump.reset(new frame_pump(dev, store, slot.index));
    pump->set_fatal_handler([this](dev_status st) {
      std::lock_guard<std::mutex> lk(fatal_mtx);
      fatal_seen = true;
      fatal_status = st;
      fatal_cv.notify_all();
    });
    ASSERT_TRUE(pump->start());
  }

  void TearDown() override {
    pump->request_stop();
    pump->join();
    (void)dev.stop();
    store.detach();
    dev.unmap();
  }

  bool wait_fatal(milliseconds timeout = milliseconds(2000)) {
    std::unique_lock<std::mutex> lk(fatal_mtx);
    return fatal_cv.wait_for(lk, timeout, [&] { return fatal_seen; });
  }

  std::string latest() {
    std::string out;
    EXPECT_EQ(store.copy_latest(&out, nullptr), read_status::ok);
    return out;
  }
};

TEST_F(pump_fixture, NoFrameYetUntilFirstDequeue) {
  std::this_thread::sleep_for(milliseconds(20));
  EXPECT_EQ(store.read_latest().status(), read_status::no_frame_yet);
  EXPECT_TRUE(pump->running());
}

TEST_F(pump_fixture, SuccessiveFramesAreServedWhole) {
  const size_t lens[] = {1000, 950, 1020};
  const char seeds[] = {'A', 'k', '0'};
  for (int i = 0; i < 3; i++) {
    std::string f = make_frame(lens[i], seeds[i]);
    dev.push_frame(f);
    ASSERT_TRUE(dev.wait_enqueues((uint64_t)i + 2));
    std::string got = latest();
    EXPECT_EQ(got.size(), lens[i]);
    EXPECT_EQ(got, f);
  }
  EXPECT_EQ(pump->frames_captured(), 3u);

  frame_meta meta;
  ASSERT_EQ(store.latest_meta(&meta), read_status::ok);
  EXPECT_EQ(meta.sequence, 3u);
  EXPECT_EQ(meta.device_sequence, 3u);
}

TEST_F(pump_fixture, SlotIsRearmedAfterEveryDequeue) {
  for (int i = 0; i < 10; i++) {
    dev.push_frame(make_frame(100 + i, 'a'));
    ASSERT_TRUE(dev.wait_enqueues((uint64_t)i + 2));
  }
  EXPECT_TRUE(dev.is_armed());
  EXPECT_EQ(dev.enqueue_count(), 11u);
}

TEST_F(pump_fixture, ConcurrentReadersSeeBeforeOrAfterNeverMixed) {
  const std::string before = make_frame(1000, 'B');
  const std::string after = make_frame(1020, 'Q');
  dev.push_frame(before);
  ASSERT_TRUE(dev.wait_enqueues(2));

  dev.set_write_delay(std::chrono::microseconds(20000));

  const int kReaders = 100;
  std::vector<std::string> results(kReaders);
  std::atomic<int> ready{0};
  std::atomic<bool> go{false};
  std::vector<std::thread> readers;
  for (int i = 0; i < kReaders; i++) {
    readers.emplace_back([&, i]() {
      ready.fetch_add(1);
      while (!go.load()) std::this_thread::yield();
      // Spread the reads across the update.
      std::this_thread::sleep_for(std::chrono::microseconds(400 * (i % 50)));
      std::string out;
      if (store.copy_latest(&out, nullptr) == read_status::ok) results[i] = out;
    });
  }
  while (ready.load() < kReaders) std::this_thread::yield();
  go.store(true);
  dev.push_frame(after);

  for (auto &th : readers) th.join();
  ASSERT_TRUE(dev.wait_enqueues(3));

  int n_before = 0, n_after = 0;
  for (const auto &r : results) {
    if (r == before) n_before++;
    else if (r == after) n_after++;
    else ADD_FAILURE() << "hybrid frame of " << r.size() << " bytes";
  }
  EXPECT_EQ(n_before + n_after, kReaders);
  EXPECT_EQ(latest(), after);
}

TEST_F(pump_fixture, ReaderWaitIsBoundedByCriticalSection) {
  dev.push_frame(make_frame(500, 'x'));
  ASSERT_TRUE(dev.wait_enqueues(2));

  const auto critical = milliseconds(50);
  dev.set_write_delay(std::chrono::duration_cast<std::chrono::microseconds>(critical));
  dev.push_frame(make_frame(600, 'y'));
  std::this_thread::sleep_for(milliseconds(10));

  auto t0 = std::chrono::steady_clock::now();
  std::string out;
  ASSERT_EQ(store.copy_latest(&out, nullptr), read_status::ok);
  auto waited = std::chrono::steady_clock::now() - t0;
  EXPECT_LT(waited, critical + milliseconds(200));

  ASSERT_TRUE(dev.wait_enqueues(3));
  EXPECT_EQ(latest(), make_frame(600, 'y'));
}

TEST_F(pump_fixture, DequeueFailureStopsPumpButKeepsLastFrame) {
  const std::string good = make_frame(800, 'g');
  dev.push_frame(good);
  ASSERT_TRUE(dev.wait_enqueues(2));

  dev.set_fail_dequeue(true);
  ASSERT_TRUE(wait_fatal());
  EXPECT_EQ(fatal_status, dev_status::dequeue_failed);
  pump->join();
  EXPECT_TRUE(pump->failed());
  EXPECT_FALSE(pump->running());
  EXPECT_EQ(pump->last_error(), dev_status::dequeue_failed);

  for (int i = 0; i < 5; i++) EXPECT_EQ(latest(), good);
}

TEST_F(pump_fixture, EnqueueFailureAfterDequeueIsFatal) {
  dev.set_fail_enqueue(true);
  const std::string f = make_frame(700, 'e');
  dev.push_frame(f);
  ASSERT_TRUE(wait_fatal());
  EXPECT_EQ(fatal_status, dev_status::enqueue_failed);
  pump->join();
  EXPECT_TRUE(pump->failed());
  // The frame was published before the re-arm was attempted.
  EXPECT_EQ(latest(), f);
}

TEST_F(pump_fixture, ErrorFlaggedFrameIsDroppedAndSlotRearmed) {
  const std::string good = make_frame(300, 'o');
  dev.push_frame(good);
  ASSERT_TRUE(dev.wait_enqueues(2));
  dev.push_frame(make_frame(310, 'z'), true);
  ASSERT_TRUE(dev.wait_enqueues(3));

  EXPECT_EQ(pump->frames_dropped(), 1u);
  EXPECT_EQ(pump->frames_captured(), 1u);
  frame_meta meta;
  ASSERT_EQ(store.latest_meta(&meta), read_status::ok);
  EXPECT_EQ(meta.sequence, 1u);
  EXPECT_EQ(meta.bytes_used, 300u);
}

TEST_F(pump_fixture, UnexpectedBufferIndexIsFatal) {
  dev.set_dequeue_index(1);
  dev.push_frame(make_frame(100, 'i'));
  ASSERT_TRUE(wait_fatal());
  EXPECT_EQ(fatal_status, dev_status::dequeue_failed);
  EXPECT_EQ(store.read_latest().status(), read_status::no_frame_yet);
}

TEST_F(pump_fixture, StopWhileBlockedExitsPromptly) {
  std::this_thread::sleep_for(milliseconds(20));
  ASSERT_TRUE(pump->running());

  auto t0 = std::chrono::steady_clock::now();
  pump->request_stop();
  pump->join();
  EXPECT_LT(std::chrono::steady_clock::now() - t0, milliseconds(1000));
  EXPECT_FALSE(pump->running());
  EXPECT_FALSE(pump->failed());
  EXPECT_FALSE(fatal_seen);
}

// Re-arms the slot, then holds the pump thread before returning.
class slow_rearm_device : public fake_capture_device {
public:
  dev_status enqueue(uint32_t index) override {
    dev_status st = fake_capture_device::enqueue(index);
    std::this_thread::sleep_for(milliseconds(5));
    return st;
  }
};

TEST(FramePump, CountersAreCurrentOnceSlotIsRearmed) {
  slow_rearm_device dev;
  frame_store store;
  capture_format want;
  want.pixfmt = V4L2_PIX_FMT_JPEG;
  buffer_desc slot;
  buffer_view view;
  ASSERT_EQ(dev.configure(want, nullptr), dev_status::ok);
  ASSERT_EQ(dev.allocate(1, &slot), dev_status::ok);
  ASSERT_EQ(dev.map(slot, &view), dev_status::ok);
  store.attach(view);
  ASSERT_EQ(dev.enqueue(slot.index), dev_status::ok);
  ASSERT_EQ(dev.start(), dev_status::ok);

  frame_pump pump(dev, store, slot.index);
  ASSERT_TRUE(pump.start());

  dev.push_frame(make_frame(200, 'c'));
  ASSERT_TRUE(dev.wait_enqueues(2));
  EXPECT_EQ(pump.frames_captured(), 1u);

  dev.push_frame(make_frame(210, 'd'), true);
  ASSERT_TRUE(dev.wait_enqueues(3));
  EXPECT_EQ(pump.frames_dropped(), 1u);
  EXPECT_EQ(pump.frames_captured(), 1u);

  pump.request_stop();
  pump.join();
  (void)dev.stop();
  store.detach();
  dev.unmap();
}

}  // namespace
