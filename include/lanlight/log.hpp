/**
 * @file log.hpp
 * @brief Tiny leveled logger emitting `key=value` lines.
 *
 * The default sink writes to std::cerr in the same shape the CLI prints its
 * results (`level=warn event=drop reason=malformed_frame from=...`). Tests swap
 * the sink to capture lines.
 */
#ifndef LANLIGHT_LOG_HPP
#define LANLIGHT_LOG_HPP

#include <cstdint>
#include <functional>
#include <string>

namespace lanlight {

enum class LogLevel : uint8_t { Debug = 0, Info, Warn, Error, Off };

const char* to_string(LogLevel lvl);
bool parse_log_level(const std::string& s, LogLevel& out);

class Logger {
public:
  using Sink = std::function<void(LogLevel, const std::string&)>;

  Logger();

  void set_level(LogLevel lvl) { level_ = lvl; }
  LogLevel level() const { return level_; }
  void set_sink(Sink sink);

  bool enabled(LogLevel lvl) const {
    return level_ != LogLevel::Off && lvl >= level_;
  }

  // `fields` is appended verbatim after "level=.. event=..".
  void log(LogLevel lvl, const char* event, const std::string& fields = {}) const;

  void debug(const char* event, const std::string& fields = {}) const { log(LogLevel::Debug, event, fields); }
  void info (const char* event, const std::string& fields = {}) const { log(LogLevel::Info,  event, fields); }
  void warn (const char* event, const std::string& fields = {}) const { log(LogLevel::Warn,  event, fields); }
  void error(const char* event, const std::string& fields = {}) const { log(LogLevel::Error, event, fields); }

private:
  LogLevel level_{LogLevel::Warn};
  Sink     sink_;
};

} // namespace lanlight

#endif // LANLIGHT_LOG_HPP
