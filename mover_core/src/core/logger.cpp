/**
 * @file logger.cpp
 * @brief Logger implementation
 */

#include "ResourceMover/core/logger.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>

#include <unistd.h>

namespace ResourceMover::core {

bool parseLogLevel(std::string_view name, LogLevel& outLevel) {
  if (name == "trace") {
    outLevel = LogLevel::Trace;
  } else if (name == "debug") {
    outLevel = LogLevel::Debug;
  } else if (name == "info") {
    outLevel = LogLevel::Info;
  } else if (name == "warning" || name == "warn") {
    outLevel = LogLevel::Warning;
  } else if (name == "error") {
    outLevel = LogLevel::Error;
  } else if (name == "fatal") {
    outLevel = LogLevel::Fatal;
  } else if (name == "off") {
    outLevel = LogLevel::Off;
  } else {
    return false;
  }
  return true;
}

Logger& Logger::instance() {
  static Logger logger;
  return logger;
}

Logger::Logger() : m_level(LogLevel::Info), m_useColors(isatty(fileno(stderr)) != 0) {}

Logger::~Logger() {
  closeOutputFile();
}

void Logger::setLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_level = level;
}

LogLevel Logger::getLevel() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_level;
}

void Logger::setUseColors(bool useColors) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_useColors = useColors;
}

bool Logger::setOutputFile(const std::string& path) {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.close();
  }
  m_fileStream.open(path, std::ios::out | std::ios::app);
  return m_fileStream.is_open();
}

void Logger::closeOutputFile() {
  std::lock_guard<std::mutex> lock(m_mutex);
  if (m_fileStream.is_open()) {
    m_fileStream.close();
  }
}

void Logger::addLogCallback(LogCallback callback) {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.push_back(std::move(callback));
}

void Logger::clearLogCallbacks() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_callbacks.clear();
}

void Logger::log(LogLevel level, std::string_view message) {
  std::vector<LogCallback> callbacks;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (level < m_level || m_level == LogLevel::Off) {
      return;
    }

    const std::string timestamp = getCurrentTimestamp();
    const std::string line =
        "[" + timestamp + "] [" + levelToString(level) + "] " + std::string(message);

    if (m_useColors) {
      std::cerr << levelToColor(level) << line << "\033[0m\n";
    } else {
      std::cerr << line << "\n";
    }

    if (m_fileStream.is_open()) {
      m_fileStream << line << "\n";
      m_fileStream.flush();
    }

    callbacks = m_callbacks;
  }

  // Invoked unlocked so a callback may log
  const std::string text(message);
  for (const auto& callback : callbacks) {
    callback(level, text);
  }
}

void Logger::trace(std::string_view message) {
  log(LogLevel::Trace, message);
}

void Logger::debug(std::string_view message) {
  log(LogLevel::Debug, message);
}

void Logger::info(std::string_view message) {
  log(LogLevel::Info, message);
}

void Logger::warning(std::string_view message) {
  log(LogLevel::Warning, message);
}

void Logger::error(std::string_view message) {
  log(LogLevel::Error, message);
}

void Logger::fatal(std::string_view message) {
  log(LogLevel::Fatal, message);
}

const char* Logger::levelToString(LogLevel level) const {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE";
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warning:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Fatal:
    return "FATAL";
  default:
    return "UNKNOWN";
  }
}

const char* Logger::levelToColor(LogLevel level) const {
  switch (level) {
  case LogLevel::Trace:
  case LogLevel::Debug:
    return "\033[90m";
  case LogLevel::Warning:
    return "\033[33m";
  case LogLevel::Error:
  case LogLevel::Fatal:
    return "\033[31m";
  default:
    return "\033[0m";
  }
}

std::string Logger::getCurrentTimestamp() const {
  auto now = std::chrono::system_clock::now();
  std::time_t time = std::chrono::system_clock::to_time_t(now);
  auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

  std::tm tm{};
  localtime_r(&time, &tm);

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<int>(ms));
  return buffer;
}

} // namespace ResourceMover::core
