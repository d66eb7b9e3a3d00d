#include "snapshot_source.h"
#include <stdio.h>
#include "v4l2_caps.h"

snapshot_source::snapshot_source(std::unique_ptr<capture_device> d) : dev(std::move(d)) {}

snapshot_source::~snapshot_source() {
  shutdown();
}

dev_status snapshot_source::init(const capture_format &want, std::function<void(dev_status)> on_fatal) {
  failed_step.clear();
  if (!dev) {
    failed_step = "device";
    return dev_status::open_failed;
  }
  const std::string name = dev->describe();
  fprintf(stderr, "[source] init %s %s %ux%u\n", name.c_str(),
          fourcc_to_string(want.pixfmt).c_str(), want.width, want.height);

  auto bail = [&](const char *step, dev_status st) {
    failed_step = step;
    fprintf(stderr, "[source] %s: %s failed: %s\n", name.c_str(), step, dev_status_str(st));
    shutdown();
    return st;
  };

  dev_status st = dev->configure(want, &fmt);
  if (st != dev_status::ok) return bail("configure", st);

  st = dev->allocate(1, &slot);
  if (st != dev_status::ok) return bail("allocate", st);

  st = dev->map(slot, &view);
  if (st != dev_status::ok) return bail("map", st);
  mapped = true;
  store.attach(view);

  st = dev->enqueue(slot.index);
  if (st != dev_status::ok) return bail("enqueue", st);

  st = dev->start();
  if (st != dev_status::ok) return bail("start", st);
  streaming = true;

  pump.reset(new frame_pump(*dev, store, slot.index));
  pump->set_fatal_handler(on_fatal);
  (void)pump->start();

  fprintf(stderr, "[source] %s: streaming, buffer %u bytes mapped\n", name.c_str(), slot.length);
  return dev_status::ok;
}

void snapshot_source::shutdown() {
  if (pump) {
    pump->request_stop();
    pump->join();
    pump.reset();
  }
  if (!dev) return;
  if (streaming) {
    dev_status st = dev->stop();
    if (st != dev_status::ok) {
      fprintf(stderr, "[source] stream off failed: %s (ignored)\n", dev_status_str(st));
    }
    streaming = false;
  }
  store.detach();
  if (mapped) {
    dev->unmap();
    mapped = false;
    view = buffer_view{};
  }
}
