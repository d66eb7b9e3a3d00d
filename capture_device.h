#pragma once
#include <stddef.h>
#include <stdint.h>
#include <string>

// Error family for everything that talks to the capture device.
enum class dev_status {
  ok = 0,
  open_failed,
  unsupported_format,
  allocation_failed,
  map_failed,
  enqueue_failed,
  dequeue_failed,
  stream_failed,
  interrupted,
  would_block,
};

const char *dev_status_str(dev_status s);

struct capture_format {
  uint32_t width = 0;
  uint32_t height = 0;
  uint32_t pixfmt = 0;          // V4L2 fourcc
  uint32_t field = 0;           // V4L2_FIELD_*
  uint32_t bytes_per_line = 0;  // as reported by the driver
  uint32_t size_image = 0;      // as reported by the driver
};

struct buffer_desc {
  uint32_t index = 0;
  uint32_t offset = 0;
  uint32_t length = 0;
};

// Borrowed view of the mapped capture buffer. Never owns the memory.
struct buffer_view {
  const uint8_t *data = nullptr;
  size_t length = 0;
};

struct dequeued_frame {
  uint32_t index = 0;
  uint32_t bytes_used = 0;
  uint32_t device_sequence = 0;
  uint64_t captured_ms = 0;
  bool error = false;           // driver flagged the buffer contents as corrupt
};

// Device Buffer Manager. One implementation talks to a real V4L2 node
// (v4l2_capture_device); tests drive the pump with an in-memory one.
//
// Threading: wait_for_frame/dequeue/enqueue are only called from the pump
// thread; interrupt() may be called from any thread.
class capture_device {
public:
  virtual ~capture_device() {}

  virtual dev_status configure(const capture_format &want, capture_format *out) = 0;
  virtual dev_status allocate(uint32_t count, buffer_desc *out) = 0;
  virtual dev_status map(const buffer_desc &desc, buffer_view *out) = 0;
  virtual void unmap() = 0;

  virtual dev_status enqueue(uint32_t index) = 0;

  // Blocks until the device has a filled buffer or interrupt() is called.
  // Holds no locks and never spins.
  virtual dev_status wait_for_frame() = 0;
  // Non-blocking reclaim of a filled buffer. would_block if nothing is ready.
  virtual dev_status dequeue(dequeued_frame *out) = 0;

  virtual dev_status start() = 0;
  virtual dev_status stop() = 0;

  // Wakes a blocked wait_for_frame() with dev_status::interrupted.
  virtual void interrupt() = 0;

  virtual std::string describe() const = 0;
};
