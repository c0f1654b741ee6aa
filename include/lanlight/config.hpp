/**
 * @file config.hpp
 * @brief Settings file: load/save JSON, defaults, XDG location.
 *
 * File shape (every key optional):
 * @code
 * {
 *   "source_id": 0,
 *   "first_sequence": -1,
 *   "bind_port": 0,
 *   "device_port": 56700,
 *   "broadcast": "255.255.255.255",
 *   "discovery_broadcasts": 3,
 *   "fade_step_ms": 100,
 *   "fade_max_steps": 50,
 *   "timeout_ms": 1000,
 *   "log_level": "warn"
 * }
 * @endcode
 * Unknown keys are ignored. A key with the wrong type or out of range rejects
 * the whole load with `err` naming the key ("bad_value:fade_step_ms").
 */
#ifndef LANLIGHT_CONFIG_HPP
#define LANLIGHT_CONFIG_HPP

#include "lanlight/backend.hpp"
#include "lanlight/log.hpp"
#include "lanlight/transport/transport_base.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace lanlight {

struct AppConfig {
  BackendConfig     backend;
  transport::Config transport;
  LogLevel          log_level{LogLevel::Warn};
  uint32_t          timeout_ms{1000};   // per-call timeout used by tools
};

/// $XDG_CONFIG_HOME/lanlight/config.json, else ~/.config/lanlight/config.json.
std::string default_config_path();

nlohmann::json to_json(const AppConfig& cfg);
bool from_json(const nlohmann::json& j, AppConfig& cfg, std::string& err);

/// A missing file is not an error: cfg keeps its values and `found` is false.
bool load_config(const std::string& path, AppConfig& cfg, std::string& err,
                 bool* found = nullptr);
/// Creates parent directories as needed.
bool save_config(const std::string& path, const AppConfig& cfg, std::string& err);

} // namespace lanlight

#endif // LANLIGHT_CONFIG_HPP
