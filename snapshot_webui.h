#pragma once
#include <atomic>
#include <functional>
#include <string>
#include <thread>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "frame_store.h"

struct snapshot_source;

// What the HTTP side needs from the capture core. Everything here is fixed
// before the server starts.
struct webui_context {
  const frame_store *store = nullptr;
  std::string content_type = "image/jpeg";
  std::function<std::string()> status;   // body for /api/status; 404 if unset
};

// Registers / (redirect), /image.jpg and /api/status on svr.
void install_snapshot_endpoints(httplib::Server &svr, const webui_context &ctx);

// Status document for /api/status.
nlohmann::json source_status_json(const snapshot_source &src, const std::string &device,
                                  const std::string &driver, const std::string &card);

// httplib server on its own thread with an explicit stop/join.
class webui_server {
public:
  webui_server() {}
  ~webui_server();

  webui_server(const webui_server&) = delete;
  webui_server& operator=(const webui_server&) = delete;

  // port 0 binds an ephemeral port; see bound_port().
  bool start(const std::string &addr, int port, const webui_context &ctx);
  void stop();
  int bound_port() const { return port_; }

private:
  httplib::Server svr;
  std::thread th;
  std::atomic<bool> listen_done{false};
  int port_ = -1;
};
