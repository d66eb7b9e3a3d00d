#include "v4l2_capture_device.h"
#include <errno.h>
#include <fcntl.h>
#include <libv4l2.h>
#include <poll.h>
#include <stdio.h>
#include <string.h>
#include <sys/eventfd.h>
#include <sys/mman.h>
#include <time.h>
#include <unistd.h>

static int xioctl(int fd, unsigned long req, void *arg) {
  int r;
  do { r = v4l2_ioctl(fd, req, arg); } while (r == -1 && errno == EINTR);
  return r;
}

static uint64_t monotonic_ms() {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return (uint64_t)ts.tv_sec * 1000ull + (uint64_t)ts.tv_nsec / 1000000ull;
}

v4l2_capture_device::v4l2_capture_device() {}

v4l2_capture_device::~v4l2_capture_device() {
  close();
}

dev_status v4l2_capture_device::open(const std::string &path) {
  close();
  dev = path;
  dev_caps = v4l2_device_caps{};
  dev_caps.dev = path;

  vfd = v4l2_open(path.c_str(), O_RDWR | O_NONBLOCK, 0);
  if (vfd < 0) {
    fprintf(stderr, "[v4l2] open %s failed: %s\n", path.c_str(), strerror(errno));
    return dev_status::open_failed;
  }

  if (!v4l2_query_caps_fd(vfd, dev_caps)) {
    fprintf(stderr, "[v4l2] %s: %s\n", path.c_str(), dev_caps.err.c_str());
    close();
    return dev_status::open_failed;
  }
  if (!(dev_caps.device_caps & V4L2_CAP_VIDEO_CAPTURE) || !(dev_caps.device_caps & V4L2_CAP_STREAMING)) {
    fprintf(stderr, "[v4l2] %s: not a streaming video capture device (caps=0x%08x)\n",
            path.c_str(), dev_caps.device_caps);
    close();
    return dev_status::open_failed;
  }

  wake_fd = eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
  if (wake_fd < 0) {
    fprintf(stderr, "[v4l2] eventfd failed: %s\n", strerror(errno));
    close();
    return dev_status::open_failed;
  }

  fprintf(stderr, "[v4l2] opened %s driver=%s card=%s formats=%zu\n",
          path.c_str(), dev_caps.driver.c_str(), dev_caps.card.c_str(), dev_caps.formats.size());
  return dev_status::ok;
}

void v4l2_capture_device::close() {
  if (streaming) (void)stop();
  unmap();
  if (vfd >= 0 && nbufs > 0) {
    // Release the driver-side buffers before closing.
    struct v4l2_requestbuffers req;
    memset(&req, 0, sizeof(req));
    req.count = 0;
    req.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    req.memory = V4L2_MEMORY_MMAP;
    if (xioctl(vfd, VIDIOC_REQBUFS, &req) < 0) {
      fprintf(stderr, "[v4l2] VIDIOC_REQBUFS(0) failed: %s\n", strerror(errno));
    }
  }
  nbufs = 0;
  if (vfd >= 0) {
    v4l2_close(vfd);
    vfd = -1;
  }
  if (wake_fd >= 0) {
    ::close(wake_fd);
    wake_fd = -1;
  }
}

dev_status v4l2_capture_device::configure(const capture_format &want, capture_format *out) {
  if (vfd < 0) return dev_status::unsupported_format;
  if (!pixfmt_is_passthrough(want.pixfmt)) {
    fprintf(stderr, "[v4l2] %s: pixfmt %s cannot be served as-is\n",
            dev.c_str(), fourcc_to_string(want.pixfmt).c_str());
    return dev_status::unsupported_format;
  }
  if (!dev_caps.formats.empty() && !v4l2_caps_has_format(dev_caps, want.pixfmt)) {
    fprintf(stderr, "[v4l2] %s: pixfmt %s not offered by driver\n",
            dev.c_str(), fourcc_to_string(want.pixfmt).c_str());
    return dev_status::unsupported_format;
  }

  struct v4l2_format fmt;
  memset(&fmt, 0, sizeof(fmt));
  fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  fmt.fmt.pix.width = want.width;
  fmt.fmt.pix.height = want.height;
  fmt.fmt.pix.pixelformat = want.pixfmt;
  fmt.fmt.pix.field = want.field ? want.field : V4L2_FIELD_NONE;
  if (xioctl(vfd, VIDIOC_S_FMT, &fmt) < 0) {
    fprintf(stderr, "[v4l2] VIDIOC_S_FMT failed: %s\n", strerror(errno));
    return dev_status::unsupported_format;
  }
  if (fmt.fmt.pix.pixelformat != want.pixfmt) {
    fprintf(stderr, "[v4l2] %s: driver substituted pixfmt %s for %s\n", dev.c_str(),
            fourcc_to_string(fmt.fmt.pix.pixelformat).c_str(), fourcc_to_string(want.pixfmt).c_str());
    return dev_status::unsupported_format;
  }
  if (fmt.fmt.pix.width != want.width || fmt.fmt.pix.height != want.height) {
    fprintf(stderr, "[v4l2] %s: driver adjusted %ux%u -> %ux%u\n", dev.c_str(),
            want.width, want.height, fmt.fmt.pix.width, fmt.fmt.pix.height);
  }

  capture_format got;
  got.width = fmt.fmt.pix.width;
  got.height = fmt.fmt.pix.height;
  got.pixfmt = fmt.fmt.pix.pixelformat;
  got.field = fmt.fmt.pix.field;
  got.bytes_per_line = fmt.fmt.pix.bytesperline;
  got.size_image = fmt.fmt.pix.sizeimage;
  fprintf(stderr, "[v4l2] %s: using %s %ux%u sizeimage=%u\n", dev.c_str(),
          fourcc_to_string(got.pixfmt).c_str(), got.width, got.height, got.size_image);
  if (out) *out = got;
  return dev_status::ok;
}

dev_status v4l2_capture_device::allocate(uint32_t count, buffer_desc *out) {
  if (vfd < 0 || count != 1) return dev_status::allocation_failed;

  struct v4l2_requestbuffers req;
  memset(&req, 0, sizeof(req));
  req.count = count;
  req.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  req.memory = V4L2_MEMORY_MMAP;
  if (xioctl(vfd, VIDIOC_REQBUFS, &req) < 0) {
    fprintf(stderr, "[v4l2] VIDIOC_REQBUFS failed: %s\n", strerror(errno));
    return dev_status::allocation_failed;
  }
  nbufs = req.count;
  if (req.count != count) {
    fprintf(stderr, "[v4l2] VIDIOC_REQBUFS granted %u buffers, need exactly %u\n", req.count, count);
    return dev_status::allocation_failed;
  }

  struct v4l2_buffer b;
  memset(&b, 0, sizeof(b));
  b.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  b.memory = V4L2_MEMORY_MMAP;
  b.index = 0;
  if (xioctl(vfd, VIDIOC_QUERYBUF, &b) < 0) {
    fprintf(stderr, "[v4l2] VIDIOC_QUERYBUF failed: %s\n", strerror(errno));
    return dev_status::allocation_failed;
  }
  if (out) {
    out->index = b.index;
    out->offset = b.m.offset;
    out->length = b.length;
  }
  return dev_status::ok;
}

dev_status v4l2_capture_device::map(const buffer_desc &desc, buffer_view *out) {
  if (vfd < 0 || map_start) return dev_status::map_failed;
  void *p = v4l2_mmap(NULL, desc.length, PROT_READ | PROT_WRITE, MAP_SHARED, vfd, desc.offset);
  if (p == MAP_FAILED) {
    fprintf(stderr, "[v4l2] mmap(offset=%u length=%u) failed: %s\n", desc.offset, desc.length, strerror(errno));
    return dev_status::map_failed;
  }
  map_start = p;
  map_length = desc.length;
  if (out) {
    out->data = (const uint8_t*)map_start;
    out->length = map_length;
  }
  return dev_status::ok;
}

void v4l2_capture_device::unmap() {
  if (map_start && map_length) {
    if (v4l2_munmap(map_start, map_length) < 0) {
      fprintf(stderr, "[v4l2] munmap failed: %s\n", strerror(errno));
    }
  }
  map_start = nullptr;
  map_length = 0;
}

dev_status v4l2_capture_device::enqueue(uint32_t index) {
  struct v4l2_buffer b;
  memset(&b, 0, sizeof(b));
  b.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  b.memory = V4L2_MEMORY_MMAP;
  b.index = index;
  if (xioctl(vfd, VIDIOC_QBUF, &b) < 0) {
    fprintf(stderr, "[v4l2] VIDIOC_QBUF(%u) failed: %s\n", index, strerror(errno));
    return dev_status::enqueue_failed;
  }
  return dev_status::ok;
}

dev_status v4l2_capture_device::wait_for_frame() {
  if (vfd < 0 || wake_fd < 0) return dev_status::dequeue_failed;
  struct pollfd pfd[2];
  memset(pfd, 0, sizeof(pfd));
  pfd[0].fd = vfd;
  pfd[0].events = POLLIN;
  pfd[1].fd = wake_fd;
  pfd[1].events = POLLIN;
  for (;;) {
    int r = poll(pfd, 2, -1);
    if (r < 0) {
      if (errno == EINTR) continue;
      fprintf(stderr, "[v4l2] poll failed: %s\n", strerror(errno));
      return dev_status::dequeue_failed;
    }
    if (pfd[1].revents & POLLIN) return dev_status::interrupted;
    if (pfd[0].revents & (POLLERR | POLLHUP | POLLNVAL)) {
      fprintf(stderr, "[v4l2] poll reported error on %s (revents=0x%x)\n", dev.c_str(), pfd[0].revents);
      return dev_status::dequeue_failed;
    }
    if (pfd[0].revents & POLLIN) return dev_status::ok;
  }
}

dev_status v4l2_capture_device::dequeue(dequeued_frame *out) {
  struct v4l2_buffer b;
  memset(&b, 0, sizeof(b));
  b.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  b.memory = V4L2_MEMORY_MMAP;
  if (xioctl(vfd, VIDIOC_DQBUF, &b) < 0) {
    if (errno == EAGAIN) return dev_status::would_block;
    fprintf(stderr, "[v4l2] VIDIOC_DQBUF failed: %s\n", strerror(errno));
    return dev_status::dequeue_failed;
  }
  if (out) {
    out->index = b.index;
    out->bytes_used = b.bytesused;
    out->device_sequence = b.sequence;
    out->error = (b.flags & V4L2_BUF_FLAG_ERROR) != 0;
    if (b.timestamp.tv_sec || b.timestamp.tv_usec) {
      out->captured_ms = (uint64_t)b.timestamp.tv_sec * 1000ull + (uint64_t)b.timestamp.tv_usec / 1000ull;
    } else {
      out->captured_ms = monotonic_ms();
    }
  }
  return dev_status::ok;
}

dev_status v4l2_capture_device::start() {
  enum v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  if (xioctl(vfd, VIDIOC_STREAMON, &type) < 0) {
    fprintf(stderr, "[v4l2] VIDIOC_STREAMON failed: %s\n", strerror(errno));
    return dev_status::stream_failed;
  }
  streaming = true;
  return dev_status::ok;
}

dev_status v4l2_capture_device::stop() {
  if (vfd < 0) return dev_status::ok;
  // STREAMOFF on a stopped queue is harmless; issue it regardless.
  enum v4l2_buf_type type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  streaming = false;
  if (xioctl(vfd, VIDIOC_STREAMOFF, &type) < 0) {
    fprintf(stderr, "[v4l2] VIDIOC_STREAMOFF failed: %s\n", strerror(errno));
    return dev_status::stream_failed;
  }
  return dev_status::ok;
}

void v4l2_capture_device::interrupt() {
  if (wake_fd < 0) return;
  uint64_t one = 1;
  ssize_t n = write(wake_fd, &one, sizeof(one));
  if (n != (ssize_t)sizeof(one) && errno != EAGAIN) {
    fprintf(stderr, "[v4l2] wake write failed: %s\n", strerror(errno));
  }
}

std::string v4l2_capture_device::describe() const {
  return dev;
}
