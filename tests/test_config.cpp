#include <doctest/doctest.h>
#include "lanlight/config.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

using namespace lanlight;
using json = nlohmann::json;

namespace {

std::string temp_path(const char* name) {
  return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

TEST_CASE("Config keys map onto backend and transport settings") {
  AppConfig cfg;
  std::string err;
  json j = {
    {"source_id", 99},
    {"first_sequence", 7},
    {"bind_port", 56701},
    {"device_port", 56700},
    {"broadcast", "192.168.1.255"},
    {"discovery_broadcasts", 5},
    {"fade_step_ms", 40},
    {"fade_max_steps", 20},
    {"timeout_ms", 2500},
    {"log_level", "debug"},
    {"unknown_key", true}
  };
  REQUIRE(from_json(j, cfg, err));
  CHECK(cfg.backend.source_id == 99);
  CHECK(cfg.backend.first_sequence == 7);
  CHECK(cfg.transport.bind_port == 56701);
  CHECK(cfg.transport.broadcast == "192.168.1.255");
  CHECK(cfg.backend.discovery_broadcasts == 5);
  CHECK(cfg.backend.fade_step_ms == 40);
  CHECK(cfg.backend.fade_max_steps == 20);
  CHECK(cfg.timeout_ms == 2500);
  CHECK(cfg.log_level == LogLevel::Debug);
}

TEST_CASE("A bad key rejects the whole config") {
  AppConfig cfg;
  cfg.timeout_ms = 1234;
  std::string err;

  CHECK_FALSE(from_json(json{{"timeout_ms", 10}, {"fade_step_ms", 0}}, cfg, err));
  CHECK(err == "bad_value:fade_step_ms");
  CHECK(cfg.timeout_ms == 1234);

  CHECK_FALSE(from_json(json{{"first_sequence", 256}}, cfg, err));
  CHECK(err == "bad_value:first_sequence");
  CHECK_FALSE(from_json(json{{"broadcast", "not-an-ip"}}, cfg, err));
  CHECK(err == "bad_value:broadcast");
  CHECK_FALSE(from_json(json{{"log_level", "loud"}}, cfg, err));
  CHECK_FALSE(from_json(json{{"bind_port", "56700"}}, cfg, err));
  CHECK_FALSE(from_json(json::array(), cfg, err));
}

TEST_CASE("Missing file keeps defaults, saved file loads back") {
  const std::string path = temp_path("lanlight_test_config.json");
  std::remove(path.c_str());

  AppConfig cfg;
  std::string err;
  bool found = true;
  REQUIRE(load_config(path, cfg, err, &found));
  CHECK_FALSE(found);
  CHECK(cfg.timeout_ms == 1000);

  cfg.backend.fade_step_ms = 25;
  cfg.transport.broadcast = "auto";
  cfg.log_level = LogLevel::Info;
  REQUIRE(save_config(path, cfg, err));

  AppConfig back;
  REQUIRE(load_config(path, back, err, &found));
  CHECK(found);
  CHECK(back.backend.fade_step_ms == 25);
  CHECK(back.transport.broadcast == "auto");
  CHECK(back.log_level == LogLevel::Info);
  std::remove(path.c_str());
}

TEST_CASE("Unparseable file is an error") {
  const std::string path = temp_path("lanlight_test_broken.json");
  {
    std::ofstream out(path);
    out << "{ \"timeout_ms\": ";
  }
  AppConfig cfg;
  std::string err;
  CHECK_FALSE(load_config(path, cfg, err));
  CHECK(err.rfind("parse_failed:", 0) == 0);
  std::remove(path.c_str());
}

TEST_CASE("Default path honours XDG_CONFIG_HOME") {
  ::setenv("XDG_CONFIG_HOME", "/tmp/xdg-test", 1);
  CHECK(default_config_path() == "/tmp/xdg-test/lanlight/config.json");
  ::unsetenv("XDG_CONFIG_HOME");
}

TEST_CASE("Log lines carry level and event") {
  Logger log;
  std::string last;
  log.set_sink([&](LogLevel, const std::string& line) { last = line; });
  log.set_level(LogLevel::Info);
  log.debug("hidden");
  CHECK(last.empty());
  log.info("discovered", "id=d073d5000001");
  CHECK(last == "level=info event=discovered id=d073d5000001");

  LogLevel lvl;
  CHECK(parse_log_level("warn", lvl));
  CHECK(lvl == LogLevel::Warn);
  CHECK_FALSE(parse_log_level("chatty", lvl));
}

TEST_CASE("Saved config carries only settings the client uses") {
  AppConfig cfg;
  const json j = to_json(cfg);
  CHECK_FALSE(j.contains("mtu"));
  CHECK(j.contains("timeout_ms"));

  std::string err;
  CHECK(from_json(json{{"mtu", 1400}, {"timeout_ms", 700}}, cfg, err));
  CHECK(cfg.timeout_ms == 700);
  CHECK_FALSE(to_json(cfg).contains("mtu"));
}
