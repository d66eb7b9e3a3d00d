#include "frame_pump.h"
#include <stdio.h>

frame_pump::frame_pump(capture_device &d, frame_store &s, uint32_t slot_index)
  : dev(d), store(s), slot(slot_index) {}

frame_pump::~frame_pump() {
  request_stop();
  join();
}

bool frame_pump::start() {
  if (th.joinable()) return false;
  stop_requested.store(false);
  has_failed.store(false);
  last_err.store((int)dev_status::ok);
  is_running.store(true);
  th = std::thread([this]() { (void)run(); });
  return true;
}

void frame_pump::request_stop() {
  stop_requested.store(true);
  dev.interrupt();
}

void frame_pump::join() {
  if (th.joinable()) th.join();
}

void frame_pump::fail(dev_status st, const char *where) {
  fprintf(stderr, "[pump] %s: %s; capture loop stopped after %llu frames\n",
          where, dev_status_str(st), (unsigned long long)n_captured.load());
  last_err.store((int)st);
  has_failed.store(true);
  if (on_fatal) on_fatal(st);
}

// One wait/dequeue/publish/re-arm cycle.
dev_status frame_pump::step() {
  dev_status st = dev.wait_for_frame();
  if (st != dev_status::ok) return st;
  if (stop_requested.load()) return dev_status::interrupted;

  dequeued_frame f;
  {
    frame_store::write_scope ws = store.begin_write();
    st = dev.dequeue(&f);
    if (st == dev_status::would_block) return dev_status::ok;
    if (st != dev_status::ok) return st;
    if (f.index != slot) {
      fprintf(stderr, "[pump] dequeued buffer %u, only slot %u is mapped\n", f.index, slot);
      return dev_status::dequeue_failed;
    }
    if (f.error) {
      n_dropped.fetch_add(1);
    } else {
      ws.commit(f.bytes_used, f.device_sequence, f.captured_ms);
      n_captured.fetch_add(1);
    }
  }

  return dev.enqueue(f.index);
}

dev_status frame_pump::run() {
  is_running.store(true);
  fprintf(stderr, "[pump] capture loop started on %s\n", dev.describe().c_str());
  dev_status st = dev_status::ok;
  while (!stop_requested.load()) {
    st = step();
    if (st == dev_status::ok) continue;
    if (st == dev_status::interrupted && stop_requested.load()) break;
    fail(st, st == dev_status::enqueue_failed ? "re-arm" : "wait/dequeue");
    break;
  }
  if (!has_failed.load()) {
    st = dev_status::interrupted;
    fprintf(stderr, "[pump] capture loop stopped (%llu frames, %llu dropped)\n",
            (unsigned long long)n_captured.load(), (unsigned long long)n_dropped.load());
  }
  is_running.store(false);
  return st;
}
