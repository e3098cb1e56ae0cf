#include <range-transfer/logger.hpp>

#include <cstdio>
#include <ctime>
#include <sstream>

namespace rangexfer {

std::string Logger::component_ = "range-transfer";
std::atomic<LogLevel> Logger::min_level_{LogLevel::INFO};

void Logger::setComponent(const std::string &component) {
  component_ = component;
}

void Logger::log(LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::string timestamp = getCurrentTimestamp();
  fprintf(stderr, "%s [%s] [%s] %s\n", timestamp.c_str(),
          levelToString(level), component_.c_str(), message.c_str());
  fflush(stderr);
}

const char *Logger::levelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

std::string Logger::getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm local{};
  localtime_r(&time, &local);

  std::ostringstream timestamp;
  timestamp << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
            << std::setfill('0') << std::setw(3) << ms.count();

  return timestamp.str();
}

} // namespace rangexfer
