#pragma once
#include <stdint.h>
#include <string>
#include <nlohmann/json.hpp>

struct snapshot_config {
  std::string device="/dev/video0";
  std::string listen_addr="0.0.0.0";
  int port=8000;
  uint32_t width=1280;
  uint32_t height=960;
  std::string pixfmt="JPEG";   // FourCC as 4-char string; must be a compressed format
};

// Command-line switches that are not part of the persisted config.
struct snapshot_cli {
  std::string config_path="./v4l2_snapshot.json";
  bool save_config=false;
  bool show_help=false;
};

bool parse_dim(const char *s, uint32_t *out_w, uint32_t *out_h);

// Normalizes config in-place:
// - empty device falls back to /dev/video0
// - port outside 1..65535 falls back to 8000
// - zero dimensions fall back to 1280x960
// - pixfmt that is not a 4-char pass-through FourCC falls back to JPEG
void cfg_normalize(snapshot_config &c);

// JSON serialization / parsing
nlohmann::json config_to_json_obj(const snapshot_config &c);
std::string config_to_json(const snapshot_config &c);
bool config_from_json_text(const std::string &text, snapshot_config &c);

// Loads path into c. Missing file is not an error (defaults stay).
bool config_load_file(const std::string &path, snapshot_config &c);
bool config_save_file(const std::string &path, const snapshot_config &c);

// Pass 1: only picks up --config / -h so the file can be loaded first.
void cli_scan_meta(int argc, char **argv, snapshot_cli &cli);
// Pass 2: command-line overrides on top of the loaded config.
bool cli_apply_overrides(int argc, char **argv, snapshot_config &c, snapshot_cli &cli, std::string *err);

void usage(const char *argv0);
