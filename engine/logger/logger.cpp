#include "logger/logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iostream>

namespace geogrid {
namespace engine {

namespace {

const char* LevelTag(LogLevel level) {
  switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::ERROR:
      return "ERROR";
    default:
      return "";
  }
}

}  // namespace

Logger::Logger() {
  const char* env_level = std::getenv("GEOGRID_LOG_LEVEL");
  min_level_ = env_level == nullptr ? LogLevel::INFO : ParseLevel(env_level, LogLevel::INFO);
}

Logger::Logger(LogLevel min_level) : min_level_(min_level) {
}

LogLevel Logger::ParseLevel(const std::string& name, LogLevel fallback) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  if (upper == "DEBUG") {
    return LogLevel::DEBUG;
  }
  if (upper == "INFO") {
    return LogLevel::INFO;
  }
  if (upper == "WARNING" || upper == "WARN") {
    return LogLevel::WARNING;
  }
  if (upper == "ERROR") {
    return LogLevel::ERROR;
  }
  return fallback;
}

void Logger::Log(LogLevel level, const std::string& message) {
  if (level < min_level_) {
    return;
  }

  std::time_t now = std::time(nullptr);
  char timestamp[20];
  std::strftime(timestamp, sizeof(timestamp), "%Y-%m-%d %H:%M:%S", std::localtime(&now));

  std::cout << "[" << timestamp << "] [" << LevelTag(level) << "] " << message << std::endl;
}

void Logger::Error(const std::string& message) {
  Log(LogLevel::ERROR, message);
}

void Logger::Info(const std::string& message) {
  Log(LogLevel::INFO, message);
}

void Logger::Warning(const std::string& message) {
  Log(LogLevel::WARNING, message);
}

void Logger::Debug(const std::string& message) {
  Log(LogLevel::DEBUG, message);
}

}  // namespace engine
}  // namespace geogrid
