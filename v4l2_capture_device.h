#pragma once
#include <atomic>
#include <string>
#include "capture_device.h"
#include "v4l2_caps.h"

// capture_device backed by a V4L2 node through libv4l2, using a single
// MMAP buffer. Owns the fd, the mapping and the wake eventfd; the destructor
// releases all three.
class v4l2_capture_device : public capture_device {
public:
  v4l2_capture_device();
  ~v4l2_capture_device() override;

  v4l2_capture_device(const v4l2_capture_device&) = delete;
  v4l2_capture_device& operator=(const v4l2_capture_device&) = delete;

  // Opens the node non-blocking and checks it can stream video capture.
  dev_status open(const std::string &path);
  void close();
  bool is_open() const { return vfd >= 0; }

  dev_status configure(const capture_format &want, capture_format *out) override;
  dev_status allocate(uint32_t count, buffer_desc *out) override;
  dev_status map(const buffer_desc &desc, buffer_view *out) override;
  void unmap() override;

  dev_status enqueue(uint32_t index) override;
  dev_status wait_for_frame() override;
  dev_status dequeue(dequeued_frame *out) override;

  dev_status start() override;
  dev_status stop() override;
  void interrupt() override;

  std::string describe() const override;

  const v4l2_device_caps &caps() const { return dev_caps; }

private:
  std::string dev;
  int vfd = -1;
  int wake_fd = -1;
  void *map_start = nullptr;
  size_t map_length = 0;
  uint32_t nbufs = 0;
  bool streaming = false;
  v4l2_device_caps dev_caps{};
};
