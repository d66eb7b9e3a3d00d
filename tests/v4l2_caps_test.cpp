#include <gtest/gtest.h>
#include <string>
#include "capture_device.h"
#include "v4l2_capture_device.h"
#include "v4l2_caps.h"

namespace {

TEST(V4l2Caps, FourccConversions) {
  EXPECT_EQ(string_to_fourcc("MJPG"), (uint32_t)V4L2_PIX_FMT_MJPEG);
  EXPECT_EQ(string_to_fourcc("JPEG"), (uint32_t)V4L2_PIX_FMT_JPEG);
  EXPECT_EQ(fourcc_to_string(V4L2_PIX_FMT_YUYV), "YUYV");
  EXPECT_EQ(string_to_fourcc("MJP"), 0u);
  EXPECT_EQ(string_to_fourcc(""), 0u);
}

TEST(V4l2Caps, OnlyCompressedFormatsPassThrough) {
  EXPECT_TRUE(pixfmt_is_passthrough(V4L2_PIX_FMT_MJPEG));
  EXPECT_TRUE(pixfmt_is_passthrough(V4L2_PIX_FMT_JPEG));
  EXPECT_FALSE(pixfmt_is_passthrough(V4L2_PIX_FMT_YUYV));
  EXPECT_FALSE(pixfmt_is_passthrough(0));
  EXPECT_STREQ(pixfmt_content_type(V4L2_PIX_FMT_MJPEG), "image/jpeg");
  EXPECT_STREQ(pixfmt_content_type(V4L2_PIX_FMT_RGB24), "");
}

TEST(V4l2Caps, HasFormat) {
  v4l2_device_caps caps;
  v4l2_format_caps f;
  f.pixfmt = V4L2_PIX_FMT_MJPEG;
  caps.formats.push_back(f);
  EXPECT_TRUE(v4l2_caps_has_format(caps, V4L2_PIX_FMT_MJPEG));
  EXPECT_FALSE(v4l2_caps_has_format(caps, V4L2_PIX_FMT_JPEG));
}

TEST(V4l2CaptureDevice, OpenMissingDeviceFails) {
  v4l2_capture_device dev;
  EXPECT_EQ(dev.open("/dev/nonexistent-video-node"), dev_status::open_failed);
  EXPECT_FALSE(dev.is_open());
  EXPECT_EQ(dev.wait_for_frame(), dev_status::dequeue_failed);
  // Stopping a device that never streamed is harmless.
  EXPECT_EQ(dev.stop(), dev_status::ok);
  dev.interrupt();
}

TEST(V4l2CaptureDevice, OperationsOnClosedDeviceFailCleanly) {
  v4l2_capture_device dev;
  capture_format want;
  want.pixfmt = V4L2_PIX_FMT_MJPEG;
  EXPECT_EQ(dev.configure(want, nullptr), dev_status::unsupported_format);
  buffer_desc d;
  EXPECT_EQ(dev.allocate(1, &d), dev_status::allocation_failed);
  buffer_view v;
  EXPECT_EQ(dev.map(d, &v), dev_status::map_failed);
}

TEST(DevStatus, HasReadableNames) {
  EXPECT_STREQ(dev_status_str(dev_status::ok), "ok");
  EXPECT_STREQ(dev_status_str(dev_status::dequeue_failed), "dequeue failed");
  EXPECT_STREQ(dev_status_str(dev_status::interrupted), "interrupted");
}

}  // namespace
