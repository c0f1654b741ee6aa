// ============================================================================
// config.cpp: implementation for config.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================
#include "lanlight/config.hpp"

#include <arpa/inet.h>   // inet_pton for broadcast validation
#include <cstdlib>       // getenv for XDG/HOME lookups
#include <filesystem>    // create_directories, rename
#include <fstream>
#include <limits>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace lanlight {

std::string default_config_path() {
  const char* xdg  = std::getenv("XDG_CONFIG_HOME");
  const char* home = std::getenv("HOME");
  fs::path base = (xdg && *xdg) ? fs::path(xdg) : fs::path(home ? home : "") / ".config";
  return (base / "lanlight" / "config.json").string();
}

json to_json(const AppConfig& cfg) {
  json j;
  j["source_id"]            = cfg.backend.source_id;
  j["first_sequence"]       = cfg.backend.first_sequence;
  j["bind_port"]            = cfg.transport.bind_port;
  j["device_port"]          = cfg.transport.broadcast_port;
  j["broadcast"]            = cfg.transport.broadcast;
  j["discovery_broadcasts"] = cfg.backend.discovery_broadcasts;
  j["fade_step_ms"]         = cfg.backend.fade_step_ms;
  j["fade_max_steps"]       = cfg.backend.fade_max_steps;
  j["timeout_ms"]           = cfg.timeout_ms;
  j["log_level"]            = to_string(cfg.log_level);
  return j;
}

// ---------------------------------------------------------------------------
// read_int()
// PRE: key may be absent (then nothing happens).
// POLICY: must be an integer in [lo, hi]; otherwise err = "bad_value:<key>".
// ---------------------------------------------------------------------------
template <typename T>
static bool read_int(const json& j, const char* key, int64_t lo, int64_t hi, T& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_number_integer()) { err = std::string("bad_value:") + key; return false; }
  int64_t v = it->get<int64_t>();
  if (v < lo || v > hi) { err = std::string("bad_value:") + key; return false; }
  out = static_cast<T>(v);
  return true;
}

bool from_json(const json& j, AppConfig& cfg, std::string& err) {
  if (!j.is_object()) { err = "bad_config:not_an_object"; return false; }

  AppConfig next = cfg;   // all-or-nothing
  const int64_t u32max = std::numeric_limits<uint32_t>::max();

  if (!read_int(j, "source_id",            0,  u32max, next.backend.source_id, err))            return false;
  if (!read_int(j, "first_sequence",      -1,  255,    next.backend.first_sequence, err))       return false;
  if (!read_int(j, "bind_port",            0,  65535,  next.transport.bind_port, err))          return false;
  if (!read_int(j, "device_port",          1,  65535,  next.transport.broadcast_port, err))     return false;
  if (!read_int(j, "discovery_broadcasts", 1,  255,    next.backend.discovery_broadcasts, err)) return false;
  if (!read_int(j, "fade_step_ms",         1,  u32max, next.backend.fade_step_ms, err))         return false;
  if (!read_int(j, "fade_max_steps",       1,  65535,  next.backend.fade_max_steps, err))       return false;
  if (!read_int(j, "timeout_ms",           0,  u32max, next.timeout_ms, err))                   return false;

  if (auto it = j.find("broadcast"); it != j.end()) {
    if (!it->is_string()) { err = "bad_value:broadcast"; return false; }
    std::string b = it->get<std::string>();
    in_addr parsed{};
    if (b != "auto" && ::inet_pton(AF_INET, b.c_str(), &parsed) != 1) {
      err = "bad_value:broadcast";
      return false;
    }
    next.transport.broadcast = b;
  }

  if (auto it = j.find("log_level"); it != j.end()) {
    if (!it->is_string() || !parse_log_level(it->get<std::string>(), next.log_level)) {
      err = "bad_value:log_level";
      return false;
    }
  }

  cfg = next;
  return true;
}

bool load_config(const std::string& path, AppConfig& cfg, std::string& err, bool* found) {
  if (found) *found = false;
  std::error_code ec;
  if (!fs::exists(path, ec)) return true;     // defaults stand

  std::ifstream in(path);
  if (!in) { err = "open_failed:" + path; return false; }
  if (found) *found = true;

  json j = json::parse(in, nullptr, /*allow_exceptions*/ false);
  if (j.is_discarded()) { err = "parse_failed:" + path; return false; }
  return from_json(j, cfg, err);
}

// Write to <path>.tmp then rename, so a crash never leaves half a file.
bool save_config(const std::string& path, const AppConfig& cfg, std::string& err) {
  fs::path p(path);
  std::error_code ec;
  if (p.has_parent_path()) {
    fs::create_directories(p.parent_path(), ec);
    if (ec) { err = "mkdir_failed:" + ec.message(); return false; }
  }

  fs::path tmp = p;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) { err = "open_failed:" + tmp.string(); return false; }
    out << to_json(cfg).dump(2) << "\n";
    if (!out) { err = "write_failed:" + tmp.string(); return false; }
  }
  fs::rename(tmp, p, ec);
  if (ec) { err = "rename_failed:" + ec.message(); return false; }
  return true;
}

} // namespace lanlight
