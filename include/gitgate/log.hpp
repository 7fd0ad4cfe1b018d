#pragma once
#include <mutex>
#include <ostream>
#include <string_view>

namespace gitgate {

enum class LogLevel { Debug, Info, Warn, Error };

// Line-oriented diagnostic sink shared by the daemon's components.
// Passed explicitly to whoever needs it; safe to use from many sessions.
class Logger {
public:
  explicit Logger(std::ostream &out, LogLevel min_level = LogLevel::Info);

  void debug(std::string_view msg) { write(LogLevel::Debug, msg); }
  void info(std::string_view msg) { write(LogLevel::Info, msg); }
  void warn(std::string_view msg) { write(LogLevel::Warn, msg); }
  void error(std::string_view msg) { write(LogLevel::Error, msg); }

  void write(LogLevel level, std::string_view msg);

  void set_level(LogLevel level);
  [[nodiscard]] auto level() const -> LogLevel;

private:
  std::ostream &out_;
  LogLevel min_level_;
  mutable std::mutex mu_;
};

[[nodiscard]] auto to_string(LogLevel level) -> std::string_view;

} // namespace gitgate
