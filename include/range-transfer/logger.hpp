#pragma once

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <string>

namespace rangexfer {

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

class Logger {
public:
  static void setComponent(const std::string &component);
  static void setLevel(LogLevel level) { min_level_ = level; }
  static LogLevel level() { return min_level_; }
  static void log(LogLevel level, const std::string &message);

private:
  static std::string component_;
  static std::atomic<LogLevel> min_level_;
  static const char *levelToString(LogLevel level);
  static std::string getCurrentTimestamp();
};

} // namespace rangexfer
