/**
 * @file main.cpp
 * @brief lanlight CLI: one-shot discovery and control of LAN bulbs.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11), layered over the JSON settings file
 *    (~/.config/lanlight/config.json, see config.hpp).
 *  - Open one UDP socket, wrap it in a SyncClient, pick targets:
 *      --discover        every bulb answering within --window ms
 *      --host IP[:PORT]  a single known bulb (unicast service query)
 *  - Apply the requested operations to every target, sets before gets.
 *  - Print one `key=value` line per bulb, or a JSON array with --json.
 *
 * Exit codes: 0 all operations succeeded, 1 some operation failed,
 *             2 usage / configuration error.
 *
 * Examples:
 *   lanlight-cli --discover
 *   lanlight-cli --host 192.168.1.40 --on --color 120,1,0.8 --fade-ms 2000
 *   lanlight-cli --discover --white 0.5,2700 --json
 */

#include <cstdint>
#include <cstdio>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h> // isatty

#include "CLI/CLI.hpp"
#include "nlohmann/json.hpp"

#include "lanlight/config.hpp"
#include "lanlight/sync_client.hpp"
#include "lanlight/transport/transport_linux_udp.hpp"

using json = nlohmann::json;
using namespace lanlight;

// ---------- small utilities ----------

static bool is_tty_stdout() { return ::isatty(fileno(stdout)); }

struct Ansi {
  bool enabled{true};
  std::string bold (const std::string& s) const { return enabled ? "\033[1m"+s+"\033[0m" : s; }
  std::string red  (const std::string& s) const { return enabled ? "\033[31m"+s+"\033[0m" : s; }
};

// "a,b[,c]" -> doubles; false on junk or wrong count.
static bool parse_numbers(const std::string& text, std::size_t count, std::vector<double>& out) {
  out.clear();
  std::stringstream ss(text);
  std::string part;
  while (std::getline(ss, part, ',')) {
    try {
      std::size_t used = 0;
      double v = std::stod(part, &used);
      if (used != part.size()) return false;
      out.push_back(v);
    } catch (const std::invalid_argument&) {
      return false;
    } catch (const std::out_of_range&) {
      return false;
    }
  }
  return out.size() == count;
}

static json color_json(const ColorState& c) {
  json j;
  if (const auto* w = std::get_if<White>(&c)) {
    j["mode"] = "white";
    j["brightness"] = w->brightness;
    j["kelvin"] = w->kelvin;
  } else {
    const auto& col = std::get<Color>(c);
    j["mode"] = "color";
    j["hue"] = col.hue;
    j["saturation"] = col.saturation;
    j["brightness"] = col.brightness;
  }
  return j;
}

// One operation result: record ok/error under `key`, remember any failure.
struct Report {
  json fields = json::object();
  bool failed{false};

  void status(const std::string& key, Status st) {
    fields[key] = to_string(st);
    if (st != Status::Ok) failed = true;
  }
};

static std::string pretty_line(const json& j) {
  std::ostringstream os;
  bool first = true;
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (!first) os << ' ';
    first = false;
    os << it.key() << '=';
    if (it->is_string()) os << it->get<std::string>();
    else if (it->is_object()) {
      bool inner_first = true;
      for (auto in = it->begin(); in != it->end(); ++in) {
        if (!inner_first) os << ',';
        inner_first = false;
        os << in.key() << ':' << (in->is_string() ? in->get<std::string>() : in->dump());
      }
    }
    else os << it->dump();
  }
  return os.str();
}

// ---------- main ----------

int main(int argc, char** argv) {
  std::string opt_config;
  bool        opt_save_config = false;
  uint32_t    opt_timeout = 0;
  uint16_t    opt_bind_port = 0;
  std::string opt_broadcast;
  std::string opt_log_level;
  bool        opt_json = false;
  bool        opt_no_color = false;

  bool        opt_discover = false;
  uint32_t    opt_window = 1000;
  std::string opt_host;

  bool        opt_ping = false, opt_get_power = false, opt_on = false, opt_off = false;
  bool        opt_get_color = false, opt_label = false, opt_info = false;
  std::string opt_color, opt_white, opt_set_label;
  uint32_t    opt_fade_ms = 0;
  uint32_t    opt_transition_ms = 0;

  CLI::App app{"lanlight CLI"};

  app.add_option("--config", opt_config, "Settings file (default: XDG config dir)");
  app.add_flag("--save-config", opt_save_config, "Write merged settings back to the file");
  app.add_option("--timeout", opt_timeout, "Per-request timeout in ms");
  app.add_option("--bind-port", opt_bind_port, "Local UDP port (0 = ephemeral)");
  app.add_option("--broadcast", opt_broadcast, "Broadcast address or 'auto'");
  app.add_option("--log-level", opt_log_level, "debug|info|warn|error|off")
      ->check(CLI::IsMember({"debug", "info", "warn", "error", "off"}));
  app.add_flag("--json", opt_json, "Print results as JSON");
  app.add_flag("--no-color", opt_no_color, "Disable ANSI colors");

  auto* discover = app.add_flag("--discover", opt_discover, "Broadcast discovery");
  app.add_option("--window", opt_window, "Discovery window in ms")->capture_default_str();
  auto* host = app.add_option("--host", opt_host, "Target bulb IP[:PORT]");
  host->excludes(discover);

  app.add_flag("--ping", opt_ping, "Echo round trip");
  app.add_flag("--get-power", opt_get_power, "Read power state");
  auto* on  = app.add_flag("--on", opt_on, "Power on");
  auto* off = app.add_flag("--off", opt_off, "Power off");
  on->excludes(off);
  app.add_flag("--get-color", opt_get_color, "Read current color");
  auto* color = app.add_option("--color", opt_color, "Set color H,S,B (hue 0-360, s/b 0-1)");
  auto* white = app.add_option("--white", opt_white, "Set white B,K (brightness 0-1, kelvin)");
  color->excludes(white);
  app.add_option("--fade-ms", opt_fade_ms, "Fade to --color/--white over N ms");
  app.add_option("--transition-ms", opt_transition_ms, "Device-side transition for a plain set");
  app.add_flag("--label", opt_label, "Read label");
  app.add_option("--set-label", opt_set_label, "Write label (max 32 bytes)");
  app.add_flag("--info", opt_info, "Version, firmware, wifi and uptime");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return app.exit(e);
  }

  Ansi ansi;
  ansi.enabled = !opt_no_color && !opt_json && is_tty_stdout();

  // --- settings: file, then flags ---
  AppConfig cfg;
  std::string err;
  const std::string cfg_path = opt_config.empty() ? default_config_path() : opt_config;
  if (!load_config(cfg_path, cfg, err)) {
    std::cerr << ansi.red("status=error reason=" + err) << "\n";
    return 2;
  }
  if (opt_timeout)             cfg.timeout_ms = opt_timeout;
  if (opt_bind_port)           cfg.transport.bind_port = opt_bind_port;
  if (!opt_broadcast.empty())  cfg.transport.broadcast = opt_broadcast;
  if (!opt_log_level.empty())  parse_log_level(opt_log_level, cfg.log_level);

  if (opt_save_config && !save_config(cfg_path, cfg, err)) {
    std::cerr << ansi.red("status=error reason=" + err) << "\n";
    return 2;
  }

  // --- requested color, validated before any socket work ---
  bool has_color = false;
  ColorState wanted;
  std::vector<double> nums;
  if (!opt_color.empty()) {
    if (!parse_numbers(opt_color, 3, nums)) {
      std::cerr << "status=error reason=bad_value:color(H,S,B)\n";
      return 2;
    }
    wanted = Color{nums[0], nums[1], nums[2]};
    has_color = true;
  } else if (!opt_white.empty()) {
    if (!parse_numbers(opt_white, 2, nums) || nums[1] < 0 || nums[1] > 65535) {
      std::cerr << "status=error reason=bad_value:white(B,K)\n";
      return 2;
    }
    wanted = White{nums[0], static_cast<uint16_t>(nums[1])};
    has_color = true;
  }
  if (has_color && validate(wanted) != Status::Ok) {
    std::cerr << "status=error reason=validation_error value=\"" << describe(wanted) << "\"\n";
    return 2;
  }

  if (!opt_discover && opt_host.empty()) {
    if (opt_save_config) return 0;
    std::cerr << "status=error reason=no_target (use --discover or --host)\n";
    return 2;
  }

  Endpoint host_ep;
  if (!opt_host.empty() && !Endpoint::parse(opt_host, host_ep, cfg.transport.broadcast_port)) {
    std::cerr << "status=error reason=bad_value:host\n";
    return 2;
  }

  // --- network ---
  transport::LinuxUdp udp;
  if (!udp.begin(cfg.transport)) {
    std::cerr << ansi.red("status=error reason=socket_open_failed") << "\n";
    return 1;
  }

  SyncClient client(udp, cfg.backend);
  client.backend().logger().set_level(cfg.log_level);
  const uint32_t timeout = cfg.timeout_ms;

  std::vector<Light> targets;
  bool any_failed = false;

  if (opt_discover) {
    Status st = Status::Ok;
    targets = client.discover(opt_window, &st);
    if (st != Status::Ok) {
      std::cerr << ansi.red(std::string("status=error reason=") + to_string(st)) << "\n";
      return 1;
    }
  } else {
    auto found = client.connect(host_ep, timeout);
    if (!found.ok()) {
      std::cerr << ansi.red(std::string("status=error reason=") + to_string(found.status) +
                            " host=" + host_ep.to_string()) << "\n";
      return 1;
    }
    targets.push_back(found.value);
  }

  json all = json::array();
  for (Light& light : targets) {
    Report r;
    r.fields["id"]   = light.id().to_string();
    r.fields["addr"] = light.endpoint().to_string();

    // sets first, so the gets below observe them
    if (opt_on || opt_off)
      r.status("set_power", client.set_power(light, opt_on ? PowerState::On : PowerState::Off, timeout));
    if (has_color) {
      if (opt_fade_ms) r.status("fade", client.fade_color(light, wanted, opt_fade_ms, timeout));
      else             r.status("set_color", client.set_color(light, wanted, timeout, opt_transition_ms));
    }
    if (!opt_set_label.empty())
      r.status("set_label", client.set_label(light, opt_set_label, timeout));

    if (opt_ping) r.status("ping", client.ping(light, timeout));
    if (opt_get_power) {
      auto p = client.get_power(light, timeout);
      if (p.ok()) r.fields["power"] = to_string(p.value);
      else        r.status("power", p.status);
    }
    if (opt_get_color) {
      auto c = client.get_color(light, timeout);
      if (c.ok()) r.fields["color"] = color_json(c.value);
      else        r.status("color", c.status);
    }
    if (opt_label) {
      auto l = client.get_label(light, timeout);
      if (l.ok()) r.fields["label"] = std::string(l.value.c_str());
      else        r.status("label", l.status);
    }
    if (opt_info) {
      auto v = client.get_version(light, timeout);
      if (v.ok()) { r.fields["vendor"] = v.value.vendor; r.fields["product"] = v.value.product; }
      else        r.status("version", v.status);
      auto fw = client.get_host_firmware(light, timeout);
      if (fw.ok()) r.fields["firmware"] = std::to_string(fw.value.major()) + "." + std::to_string(fw.value.minor());
      else         r.status("firmware", fw.status);
      auto wifi = client.get_wifi_info(light, timeout);
      if (wifi.ok()) r.fields["wifi_signal"] = wifi.value.signal;
      else           r.status("wifi", wifi.status);
      auto t = client.get_info(light, timeout);
      if (t.ok()) r.fields["uptime_s"] = t.value.uptime / 1000000000ull;
      else        r.status("times", t.status);
    }

    any_failed = any_failed || r.failed;
    if (opt_json) {
      all.push_back(r.fields);
    } else {
      const std::string line = pretty_line(r.fields);
      std::cout << (r.failed ? ansi.red(line) : line) << "\n";
    }
  }

  if (opt_json) std::cout << all.dump(2) << "\n";
  else if (targets.empty()) std::cout << ansi.bold("status=ok found=0") << "\n";

  udp.end();
  return any_failed ? 1 : 0;
}
