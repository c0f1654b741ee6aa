// ============================================================================
// log.cpp: implementation for log.hpp
// For API/overview see the matching .hpp.
// ============================================================================
#include "lanlight/log.hpp"

#include <iostream>
#include <utility>

namespace lanlight {

const char* to_string(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
    case LogLevel::Off:   return "off";
  }
  return "unknown";
}

bool parse_log_level(const std::string& s, LogLevel& out) {
  if      (s == "debug") out = LogLevel::Debug;
  else if (s == "info")  out = LogLevel::Info;
  else if (s == "warn")  out = LogLevel::Warn;
  else if (s == "error") out = LogLevel::Error;
  else if (s == "off")   out = LogLevel::Off;
  else return false;
  return true;
}

// Default sink: one line per record on stderr, stdout stays clean for results.
static void stderr_sink(LogLevel lvl, const std::string& line) {
  (void)lvl;
  std::cerr << line << "\n";
}

Logger::Logger() : sink_(stderr_sink) {}

void Logger::set_sink(Sink sink) {
  sink_ = sink ? std::move(sink) : Sink(stderr_sink);
}

void Logger::log(LogLevel lvl, const char* event, const std::string& fields) const {
  if (!enabled(lvl)) return;
  std::string line = "level=";
  line += to_string(lvl);
  line += " event=";
  line += event;
  if (!fields.empty()) {
    line += ' ';
    line += fields;
  }
  sink_(lvl, line);
}

} // namespace lanlight
