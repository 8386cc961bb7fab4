#pragma once

#include <format>
#include <fstream>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ResourceMover::core {

enum class LogLevel { Trace, Debug, Info, Warning, Error, Fatal, Off };

/**
 * @brief Parse a level name ("trace", "debug", "info", "warning", "error",
 * "fatal", "off"), case-sensitive
 * @return false if the name is unknown
 */
bool parseLogLevel(std::string_view name, LogLevel& outLevel);

class Logger {
public:
  static Logger& instance();

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;

  void setLevel(LogLevel level);
  [[nodiscard]] LogLevel getLevel() const;

  void setUseColors(bool useColors);

  bool setOutputFile(const std::string& path);
  void closeOutputFile();

  using LogCallback = std::function<void(LogLevel, const std::string&)>;
  void addLogCallback(LogCallback callback);
  void clearLogCallbacks();

  void log(LogLevel level, std::string_view message);

  void trace(std::string_view message);
  void debug(std::string_view message);
  void info(std::string_view message);
  void warning(std::string_view message);
  void error(std::string_view message);
  void fatal(std::string_view message);

  // Template overloads for format strings with variadic arguments
  template <typename... Args> void trace(std::format_string<Args...> fmt, Args&&... args) {
    trace(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void debug(std::format_string<Args...> fmt, Args&&... args) {
    debug(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void info(std::format_string<Args...> fmt, Args&&... args) {
    info(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void warning(std::format_string<Args...> fmt, Args&&... args) {
    warning(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void error(std::format_string<Args...> fmt, Args&&... args) {
    error(std::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args> void fatal(std::format_string<Args...> fmt, Args&&... args) {
    fatal(std::format(fmt, std::forward<Args>(args)...));
  }

private:
  Logger();
  ~Logger();

  [[nodiscard]] const char* levelToString(LogLevel level) const;
  [[nodiscard]] const char* levelToColor(LogLevel level) const;
  [[nodiscard]] std::string getCurrentTimestamp() const;

  LogLevel m_level;
  std::ofstream m_fileStream;
  mutable std::mutex m_mutex;
  bool m_useColors;
  std::vector<LogCallback> m_callbacks;
};

} // namespace ResourceMover::core

#define RESOURCEMOVER_LOG_TRACE(...) ::ResourceMover::core::Logger::instance().trace(__VA_ARGS__)
#define RESOURCEMOVER_LOG_DEBUG(...) ::ResourceMover::core::Logger::instance().debug(__VA_ARGS__)
#define RESOURCEMOVER_LOG_INFO(...) ::ResourceMover::core::Logger::instance().info(__VA_ARGS__)
#define RESOURCEMOVER_LOG_WARN(...) ::ResourceMover::core::Logger::instance().warning(__VA_ARGS__)
#define RESOURCEMOVER_LOG_ERROR(...) ::ResourceMover::core::Logger::instance().error(__VA_ARGS__)
#define RESOURCEMOVER_LOG_FATAL(...) ::ResourceMover::core::Logger::instance().fatal(__VA_ARGS__)
