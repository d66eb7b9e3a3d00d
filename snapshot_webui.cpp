#include "snapshot_webui.h"
#include <stdio.h>
#include <chrono>
#include "snapshot_source.h"
#include "v4l2_caps.h"

using nlohmann::json;

// Live frames must never be served from a cache.
static inline void set_no_cache_headers(httplib::Response &res) {
  res.set_header("Cache-Control", "no-store, no-cache, must-revalidate, max-age=0");
  res.set_header("Pragma", "no-cache");
  res.set_header("Expires", "0");
}

void install_snapshot_endpoints(httplib::Server &svr, const webui_context &ctx) {
  svr.Get("/", [](const httplib::Request&, httplib::Response &res) {
    res.status = 302;
    res.set_header("Location", "/image.jpg");
  });

  const frame_store *store = ctx.store;
  const std::string content_type = ctx.content_type;
  svr.Get("/image.jpg", [store, content_type](const httplib::Request&, httplib::Response &res) {
    set_no_cache_headers(res);
    std::string body;
    frame_meta meta;
    // Copy out under shared access so slow clients never hold the pump off.
    if (!store || store->copy_latest(&body, &meta) != read_status::ok) {
      res.status = 503;
      res.set_header("Retry-After", "1");
      res.set_content("no frame yet", "text/plain");
      return;
    }
    res.set_header("X-Frame-Sequence", std::to_string(meta.sequence));
    res.set_content(std::move(body), content_type);
  });

  std::function<std::string()> status = ctx.status;
  svr.Get("/api/status", [status](const httplib::Request&, httplib::Response &res) {
    set_no_cache_headers(res);
    if (!status) {
      res.status = 404;
      res.set_content("{\"error\":\"no status provider\"}", "application/json");
      return;
    }
    res.set_content(status(), "application/json");
  });
}

json source_status_json(const snapshot_source &src, const std::string &device,
                        const std::string &driver, const std::string &card) {
  json j;
  j["device"] = device;
  j["driver"] = driver;
  j["card"] = card;
  j["width"] = src.fmt.width;
  j["height"] = src.fmt.height;
  j["pixfmt"] = fourcc_to_string(src.fmt.pixfmt);
  j["bytesPerLine"] = src.fmt.bytes_per_line;
  j["sizeImage"] = src.fmt.size_image;
  j["bufferLength"] = src.slot.length;

  frame_meta meta;
  bool have = src.store.latest_meta(&meta) == read_status::ok;
  j["haveFrame"] = have;
  j["sequence"] = have ? meta.sequence : 0;
  j["deviceSequence"] = have ? meta.device_sequence : 0;
  j["bytesUsed"] = have ? meta.bytes_used : 0;
  j["capturedMs"] = have ? meta.captured_ms : 0;

  if (src.pump) {
    j["pumpRunning"] = src.pump->running();
    j["pumpFailed"] = src.pump->failed();
    j["lastError"] = src.pump->failed() ? dev_status_str(src.pump->last_error()) : "";
    j["framesCaptured"] = src.pump->frames_captured();
    j["framesDropped"] = src.pump->frames_dropped();
  } else {
    j["pumpRunning"] = false;
    j["pumpFailed"] = false;
    j["lastError"] = "";
    j["framesCaptured"] = 0;
    j["framesDropped"] = 0;
  }
  return j;
}

webui_server::~webui_server() {
  stop();
}

bool webui_server::start(const std::string &addr, int port, const webui_context &ctx) {
  if (th.joinable()) return false;
  install_snapshot_endpoints(svr, ctx);

  if (port == 0) {
    port_ = svr.bind_to_any_port(addr.c_str());
  } else {
    port_ = svr.bind_to_port(addr.c_str(), port) ? port : -1;
  }
  if (port_ <= 0) {
    fprintf(stderr, "[webui] bind %s:%d failed\n", addr.c_str(), port);
    port_ = -1;
    return false;
  }

  listen_done.store(false);
  th = std::thread([this]() {
    if (!svr.listen_after_bind()) fprintf(stderr, "[webui] listen loop ended with error\n");
    listen_done.store(true);
  });
  fprintf(stderr, "[webui] listening on %s:%d\n", addr.c_str(), port_);
  return true;
}

void webui_server::stop() {
  if (!th.joinable()) return;
  // stop() is only honoured once the accept loop is running.
  while (!svr.is_running() && !listen_done.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  svr.stop();
  th.join();
  fprintf(stderr, "[webui] stopped\n");
}
