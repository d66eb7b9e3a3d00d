#pragma once
#include <functional>
#include <memory>
#include <string>
#include "capture_device.h"
#include "frame_pump.h"
#include "frame_store.h"

// Owns the capture device, the frame store and the pump, and brings them up
// and down in order: configure, allocate, map, arm, stream on, pump; then
// pump stop/join, stream off, detach, unmap.
struct snapshot_source {
  std::unique_ptr<capture_device> dev;
  frame_store store;
  std::unique_ptr<frame_pump> pump;
  capture_format fmt{};
  buffer_desc slot{};
  buffer_view view{};
  std::string failed_step;
  bool streaming = false;
  bool mapped = false;

  explicit snapshot_source(std::unique_ptr<capture_device> d);
  ~snapshot_source();

  snapshot_source(const snapshot_source&) = delete;
  snapshot_source& operator=(const snapshot_source&) = delete;

  // Runs the startup sequence. On failure failed_step names the step and
  // everything acquired so far is released again.
  dev_status init(const capture_format &want, std::function<void(dev_status)> on_fatal);
  void shutdown();
};
