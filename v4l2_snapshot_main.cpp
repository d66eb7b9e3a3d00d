#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>
#include <atomic>
#include <memory>
#include <string>
#include "snapshot_config.h"
#include "snapshot_source.h"
#include "snapshot_webui.h"
#include "v4l2_capture_device.h"
#include "v4l2_caps.h"

static std::atomic<bool> g_quit{false};
static std::atomic<bool> g_capture_dead{false};

static void on_signal(int) { g_quit.store(true); }

static void install_signal_handlers() {
  struct sigaction sa;
  memset(&sa, 0, sizeof(sa));
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);
  signal(SIGPIPE, SIG_IGN);
}

int main(int argc, char **argv) {
  snapshot_cli cli;
  cli_scan_meta(argc, argv, cli);
  if (cli.show_help) { usage(argv[0]); return 0; }

  snapshot_config cfg;
  (void)config_load_file(cli.config_path, cfg);
  cfg_normalize(cfg);

  std::string err;
  if (!cli_apply_overrides(argc, argv, cfg, cli, &err)) {
    fprintf(stderr, "[config] %s\n", err.c_str());
    usage(argv[0]);
    return 1;
  }
  cfg_normalize(cfg);
  if (cli.save_config) {
    if (config_save_file(cli.config_path, cfg)) fprintf(stderr, "[config] saved %s\n", cli.config_path.c_str());
    else fprintf(stderr, "[config] failed to save %s\n", cli.config_path.c_str());
  }

  install_signal_handlers();

  std::unique_ptr<v4l2_capture_device> vdev(new v4l2_capture_device());
  dev_status st = vdev->open(cfg.device);
  if (st != dev_status::ok) {
    fprintf(stderr, "[main] cannot open %s: %s\n", cfg.device.c_str(), dev_status_str(st));
    return 1;
  }
  const std::string driver = vdev->caps().driver;
  const std::string card = vdev->caps().card;

  snapshot_source src(std::move(vdev));
  capture_format want;
  want.width = cfg.width;
  want.height = cfg.height;
  want.pixfmt = string_to_fourcc(cfg.pixfmt);
  want.field = V4L2_FIELD_NONE;
  st = src.init(want, [](dev_status) {
    g_capture_dead.store(true);
  });
  if (st != dev_status::ok) {
    fprintf(stderr, "[main] capture startup failed at %s: %s\n", src.failed_step.c_str(), dev_status_str(st));
    return 1;
  }

  webui_context ctx;
  ctx.store = &src.store;
  ctx.content_type = pixfmt_content_type(src.fmt.pixfmt);
  const std::string device = cfg.device;
  ctx.status = [&src, device, driver, card]() -> std::string {
    return source_status_json(src, device, driver, card).dump();
  };

  webui_server web;
  if (!web.start(cfg.listen_addr, cfg.port, ctx)) {
    src.shutdown();
    return 1;
  }
  fprintf(stderr, "[main] serving http://%s:%d/image.jpg\n", cfg.listen_addr.c_str(), web.bound_port());

  while (!g_quit.load() && !g_capture_dead.load()) {
    usleep(100*1000);
  }

  int rc = 0;
  if (g_capture_dead.load()) {
    fprintf(stderr, "[main] capture loop died; shutting down\n");
    rc = 1;
  }
  fprintf(stderr, "[main] shutting down...\n");
  web.stop();
  src.shutdown();
  return rc;
}
