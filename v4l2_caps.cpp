#include "v4l2_caps.h"
#include <libv4l2.h>
#include <errno.h>
#include <string.h>
#include <sys/ioctl.h>

static int xioctl_local(int fd, unsigned long req, void *arg) {
  int r;
  do { r = v4l2_ioctl(fd, req, arg); } while (r == -1 && errno == EINTR);
  return r;
}

bool v4l2_query_caps_fd(int fd, v4l2_device_caps &caps) {
  struct v4l2_capability cap;
  memset(&cap, 0, sizeof(cap));
  if (xioctl_local(fd, VIDIOC_QUERYCAP, &cap) < 0) {
    caps.ok = false;
    caps.err = std::string("VIDIOC_QUERYCAP failed: ") + strerror(errno);
    return false;
  }
  caps.driver = (const char*)cap.driver;
  caps.card = (const char*)cap.card;
  // device_caps is only meaningful when the driver says so.
  caps.device_caps = (cap.capabilities & V4L2_CAP_DEVICE_CAPS) ? cap.device_caps : cap.capabilities;

  struct v4l2_fmtdesc f;
  memset(&f, 0, sizeof(f));
  f.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;

  caps.formats.clear();
  for (f.index = 0; ; f.index++) {
    if (xioctl_local(fd, VIDIOC_ENUM_FMT, &f) < 0) break;
    v4l2_format_caps fc;
    fc.pixfmt = f.pixelformat;
    fc.flags = f.flags;
    fc.desc = (const char*)f.description;
    caps.formats.push_back(std::move(fc));
  }

  caps.ok = true;
  caps.err.clear();
  return true;
}

bool v4l2_caps_has_format(const v4l2_device_caps &caps, uint32_t pixfmt) {
  for (const auto &f : caps.formats) {
    if (f.pixfmt == pixfmt) return true;
  }
  return false;
}
