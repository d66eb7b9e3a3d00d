#pragma once
#include <atomic>
#include <functional>
#include <thread>
#include "capture_device.h"
#include "frame_store.h"

// Capture loop: wait for the device, swap the new frame into the store under
// exclusive access, then re-arm the slot right away.
//
// Any device error ends the loop for good; on_fatal fires once from the pump
// thread. A stop request is not an error.
class frame_pump {
public:
  frame_pump(capture_device &dev, frame_store &store, uint32_t slot_index);
  ~frame_pump();

  frame_pump(const frame_pump&) = delete;
  frame_pump& operator=(const frame_pump&) = delete;

  void set_fatal_handler(std::function<void(dev_status)> fn) { on_fatal = fn; }

  bool start();
  void request_stop();
  void join();

  bool running() const { return is_running.load(); }
  bool failed() const { return has_failed.load(); }
  dev_status last_error() const { return (dev_status)last_err.load(); }
  uint64_t frames_captured() const { return n_captured.load(); }
  uint64_t frames_dropped() const { return n_dropped.load(); }

  // Runs the loop on the calling thread until stop or error.
  dev_status run();

private:
  dev_status step();
  void fail(dev_status st, const char *where);

  capture_device &dev;
  frame_store &store;
  uint32_t slot;
  std::function<void(dev_status)> on_fatal;

  std::thread th;
  std::atomic<bool> stop_requested{false};
  std::atomic<bool> is_running{false};
  std::atomic<bool> has_failed{false};
  std::atomic<int> last_err{(int)dev_status::ok};
  std::atomic<uint64_t> n_captured{0};
  std::atomic<uint64_t> n_dropped{0};
};
