#pragma once
#include <linux/videodev2.h>
#include <stdint.h>
#include <string>
#include <vector>

struct v4l2_format_caps {
  uint32_t pixfmt = 0;          // V4L2 fourcc
  uint32_t flags = 0;           // V4L2_FMT_FLAG_*
  std::string desc;             // human description
};

struct v4l2_device_caps {
  std::string dev;
  bool ok = false;
  std::string err;
  std::string driver;
  std::string card;
  uint32_t device_caps = 0;
  std::vector<v4l2_format_caps> formats;
};

static inline std::string fourcc_to_string(uint32_t f) {
  char s[5];
  s[0] = (char)(f & 0xFF);
  s[1] = (char)((f >> 8) & 0xFF);
  s[2] = (char)((f >> 16) & 0xFF);
  s[3] = (char)((f >> 24) & 0xFF);
  s[4] = 0;
  return std::string(s);
}

static inline uint32_t string_to_fourcc(const std::string &s) {
  if (s.size() != 4) return 0;
  return (uint32_t)(uint8_t)s[0] |
         ((uint32_t)(uint8_t)s[1] << 8) |
         ((uint32_t)(uint8_t)s[2] << 16) |
         ((uint32_t)(uint8_t)s[3] << 24);
}

// Formats the HTTP side can hand out byte-for-byte (already compressed images).
static inline bool pixfmt_is_passthrough(uint32_t pixfmt) {
  return pixfmt == V4L2_PIX_FMT_MJPEG || pixfmt == V4L2_PIX_FMT_JPEG;
}

// Content-Type for a pass-through pixfmt; empty for anything else.
static inline const char *pixfmt_content_type(uint32_t pixfmt) {
  if (pixfmt == V4L2_PIX_FMT_MJPEG || pixfmt == V4L2_PIX_FMT_JPEG) return "image/jpeg";
  return "";
}

// Implemented in v4l2_caps.cpp
// Queries VIDIOC_QUERYCAP and enumerates capture formats of an already opened fd.
bool v4l2_query_caps_fd(int fd, v4l2_device_caps &caps);
bool v4l2_caps_has_format(const v4l2_device_caps &caps, uint32_t pixfmt);
