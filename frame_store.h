#pragma once
#include <stddef.h>
#include <stdint.h>
#include <mutex>
#include <shared_mutex>
#include <string>
#include "capture_device.h"

struct frame_meta {
  uint32_t bytes_used = 0;
  uint64_t sequence = 0;         // 1 for the first published frame
  uint32_t device_sequence = 0;  // driver's v4l2_buffer.sequence
  uint64_t captured_ms = 0;
};

enum class read_status { ok = 0, no_frame_yet = 1 };

class frame_store;

// Shared-access handle on the latest frame. While it is alive the pump
// cannot swap the frame; release it as soon as the bytes are copied out.
class frame_reader {
public:
  frame_reader() {}
  frame_reader(frame_reader&&) = default;
  frame_reader& operator=(frame_reader&&) = default;
  frame_reader(const frame_reader&) = delete;
  frame_reader& operator=(const frame_reader&) = delete;

  read_status status() const { return st; }
  bool ok() const { return st == read_status::ok; }
  const uint8_t *data() const { return ptr; }
  size_t size() const { return len; }
  const frame_meta &meta() const { return m; }

  void release();

private:
  friend class frame_store;
  std::shared_lock<std::shared_mutex> lk;
  read_status st = read_status::no_frame_yet;
  const uint8_t *ptr = nullptr;
  size_t len = 0;
  frame_meta m{};
};

// Holds {mapped buffer view, frame_meta} as one unit. One writer (the pump)
// mutates it under exclusive access; any number of readers take shared access.
class frame_store {
public:
  // Exclusive-access scope for the writer. Dropping it without commit()
  // leaves the published state untouched.
  class write_scope {
  public:
    write_scope(write_scope&&) = default;
    write_scope(const write_scope&) = delete;
    write_scope& operator=(const write_scope&) = delete;

    void commit(uint32_t bytes_used, uint32_t device_sequence, uint64_t captured_ms);

  private:
    friend class frame_store;
    write_scope(frame_store *s);
    frame_store *store;
    std::unique_lock<std::mutex> gate;
    std::unique_lock<std::shared_mutex> lk;
  };

  frame_store() {}
  frame_store(const frame_store&) = delete;
  frame_store& operator=(const frame_store&) = delete;

  void attach(const buffer_view &view);
  // Forgets the view and the published frame. Must run before the buffer is unmapped.
  void detach();

  write_scope begin_write();

  frame_reader read_latest() const;
  // Copies the latest frame out; shared access is dropped before returning.
  read_status copy_latest(std::string *out, frame_meta *meta) const;

  // Metadata only (no bytes), for status reporting.
  read_status latest_meta(frame_meta *meta) const;

private:
  void pass_gate() const;

  // A pending writer holds the gate, so readers that arrive after it wait
  // for the update instead of starving it.
  mutable std::mutex gate;
  mutable std::shared_mutex mtx;
  buffer_view view{};
  frame_meta meta_{};
  bool have_frame = false;
  uint64_t next_seq = 1;
};
