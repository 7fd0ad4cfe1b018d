#include "gitgate/log.hpp"

namespace gitgate {

Logger::Logger(std::ostream &out, LogLevel min_level) : out_(out), min_level_(min_level) {}

void Logger::write(LogLevel level, std::string_view msg) {
  std::lock_guard lock(mu_);
  if (level < min_level_)
    return;
  out_ << "gitgate: [" << to_string(level) << "] " << msg << '\n';
  out_.flush();
}

void Logger::set_level(LogLevel level) {
  std::lock_guard lock(mu_);
  min_level_ = level;
}

auto Logger::level() const -> LogLevel {
  std::lock_guard lock(mu_);
  return min_level_;
}

auto to_string(LogLevel level) -> std::string_view {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warn:
    return "warn";
  case LogLevel::Error:
    return "error";
  }
  return "?";
}

} // namespace gitgate
