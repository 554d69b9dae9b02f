#pragma once

#include <string>

namespace geogrid {
namespace engine {

enum class LogLevel {
  DEBUG,
  INFO,
  WARNING,
  ERROR
};

class Logger {
 public:
  // Minimum level comes from GEOGRID_LOG_LEVEL, INFO when unset or unknown.
  Logger();
  explicit Logger(LogLevel min_level);

  void Info(const std::string& message);
  void Warning(const std::string& message);
  void Error(const std::string& message);
  void Debug(const std::string& message);

  LogLevel MinLevel() const {
    return min_level_;
  }

  static LogLevel ParseLevel(const std::string& name, LogLevel fallback);

 private:
  void Log(LogLevel level, const std::string& message);

  LogLevel min_level_;
};

}  // namespace engine
}  // namespace geogrid
