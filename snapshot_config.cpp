#include "snapshot_config.h"
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <fstream>
#include <sstream>
#include "v4l2_caps.h"

using nlohmann::json;

static bool parse_u32(const char *s, uint32_t *out) {
  if (!s || !*s) return false;
  char *end = NULL;
  errno = 0;
  unsigned long v = strtoul(s, &end, 10);
  if (errno != 0 || end == s || *end != '\0') return false;
  if (v > 0xFFFFFFFFul) return false;
  *out = (uint32_t)v;
  return true;
}

static bool parse_port(const char *s, int *out) {
  uint32_t v = 0;
  if (!parse_u32(s, &v) || v == 0 || v > 65535) return false;
  *out = (int)v;
  return true;
}

bool parse_dim(const char *s, uint32_t *out_w, uint32_t *out_h) {
  if (!s || !*s) return false;
  const char *x = strchr(s, 'x');
  if (!x) return false;
  char a[64], b[64];
  size_t la = (size_t)(x - s);
  size_t lb = strlen(x + 1);
  if (la == 0 || lb == 0 || la >= sizeof(a) || lb >= sizeof(b)) return false;
  memcpy(a, s, la); a[la] = 0;
  memcpy(b, x + 1, lb); b[lb] = 0;
  uint32_t w = 0, h = 0;
  if (!parse_u32(a, &w) || !parse_u32(b, &h)) return false;
  if (w == 0 || h == 0) return false;
  *out_w = w; *out_h = h;
  return true;
}

void cfg_normalize(snapshot_config &c) {
  const snapshot_config d;
  if (c.device.empty()) c.device = d.device;
  if (c.listen_addr.empty()) c.listen_addr = d.listen_addr;
  if (c.port <= 0 || c.port > 65535) {
    fprintf(stderr, "[config] invalid port %d -> using %d\n", c.port, d.port);
    c.port = d.port;
  }
  if (c.width == 0 || c.height == 0) {
    c.width = d.width;
    c.height = d.height;
  }
  if (!pixfmt_is_passthrough(string_to_fourcc(c.pixfmt))) {
    fprintf(stderr, "[config] pixfmt '%s' is not a compressed format -> using %s\n",
            c.pixfmt.c_str(), d.pixfmt.c_str());
    c.pixfmt = d.pixfmt;
  }
}

json config_to_json_obj(const snapshot_config &c_in) {
  snapshot_config c = c_in;
  cfg_normalize(c);
  json j;
  j["device"] = c.device;
  j["listenAddr"] = c.listen_addr;
  j["port"] = c.port;
  j["width"] = c.width;
  j["height"] = c.height;
  j["pixfmt"] = c.pixfmt;
  return j;
}

std::string config_to_json(const snapshot_config &c) {
  return config_to_json_obj(c).dump(2);
}

bool config_from_json_text(const std::string &text, snapshot_config &c) {
  json j = json::parse(text, nullptr, false);
  if (j.is_discarded() || !j.is_object()) return false;

  auto get_str = [&](const char *k, std::string &out) {
    if (j.contains(k) && j[k].is_string()) out = j[k].get<std::string>();
  };
  auto get_u32 = [&](const char *k, uint32_t &out) {
    if (j.contains(k) && j[k].is_number_integer()) {
      long long v = j[k].get<long long>();
      if (v > 0 && v <= 0xFFFFFFFFll) out = (uint32_t)v;
    }
  };

  get_str("device", c.device);
  get_str("listenAddr", c.listen_addr);
  if (j.contains("port") && j["port"].is_number_integer()) c.port = j["port"].get<int>();
  get_u32("width", c.width);
  get_u32("height", c.height);
  get_str("pixfmt", c.pixfmt);

  cfg_normalize(c);
  return true;
}

bool config_load_file(const std::string &path, snapshot_config &c) {
  std::ifstream f(path);
  if (!f.is_open()) {
    fprintf(stderr, "[config] no config at %s; using defaults\n", path.c_str());
    return true;
  }
  std::stringstream ss;
  ss << f.rdbuf();
  snapshot_config loaded = c;
  if (!config_from_json_text(ss.str(), loaded)) {
    fprintf(stderr, "[config] %s: parse failed; using defaults\n", path.c_str());
    return false;
  }
  c = loaded;
  fprintf(stderr, "[config] loaded %s\n", path.c_str());
  return true;
}

bool config_save_file(const std::string &path, const snapshot_config &c) {
  std::string tmp = path + ".tmp";
  {
    std::ofstream f(tmp, std::ios::trunc);
    if (!f.is_open()) return false;
    f << config_to_json(c) << "\n";
    f.flush();
    if (!f.good()) return false;
  }
  if (rename(tmp.c_str(), path.c_str()) != 0) {
    fprintf(stderr, "[config] rename %s -> %s failed: %s\n", tmp.c_str(), path.c_str(), strerror(errno));
    return false;
  }
  return true;
}

void cli_scan_meta(int argc, char **argv, snapshot_cli &cli) {
  for (int i=1;i<argc;i++) {
    if (strcmp(argv[i],"--config")==0 && i+1<argc) cli.config_path=argv[++i];
    else if (strcmp(argv[i],"-h")==0 || strcmp(argv[i],"--help")==0) cli.show_help=true;
  }
}

bool cli_apply_overrides(int argc, char **argv, snapshot_config &c, snapshot_cli &cli, std::string *err) {
  auto bad = [&](const std::string &msg) {
    if (err) *err = msg;
    return false;
  };
  for (int i=1;i<argc;i++) {
    const char *a = argv[i];
    bool has_val = i+1<argc;
    if (strcmp(a,"--config")==0 && has_val) { i++; continue; }
    if (strcmp(a,"-h")==0 || strcmp(a,"--help")==0) { cli.show_help=true; continue; }
    if (strcmp(a,"--save-config")==0) { cli.save_config=true; continue; }

    if (strcmp(a,"-i")==0 && has_val) c.device=argv[++i];
    else if (strcmp(a,"-p")==0 && has_val) {
      int port=0;
      if (!parse_port(argv[++i], &port)) return bad(std::string("bad -p '") + argv[i] + "'");
      c.port=port;
    } else if (strcmp(a,"--listen")==0 && has_val) {
      c.listen_addr=argv[++i];
      if (c.listen_addr.empty()) return bad("empty --listen");
    } else if (strcmp(a,"--size")==0 && has_val) {
      uint32_t w=0,h=0;
      if (!parse_dim(argv[++i], &w, &h)) return bad(std::string("bad --size '") + argv[i] + "'");
      c.width=w; c.height=h;
    } else if (strcmp(a,"--pixfmt")==0 && has_val) {
      std::string p=argv[++i];
      if (!pixfmt_is_passthrough(string_to_fourcc(p))) return bad("bad --pixfmt '" + p + "' (need MJPG or JPEG)");
      c.pixfmt=p;
    } else {
      return bad(std::string("unknown or incomplete option '") + a + "'");
    }
  }
  return true;
}

void usage(const char *argv0) {
  fprintf(stderr,
    "Usage: %s [--config PATH] [-i /dev/videoN] [-p PORT] [--listen ADDR]\n"
    "          [--size WxH] [--pixfmt MJPG|JPEG] [--save-config]\n",
    argv0
  );
}
