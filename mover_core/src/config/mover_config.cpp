/**
 * @file mover_config.cpp
 * @brief Configuration file loading
 */

#include "ResourceMover/config/mover_config.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <sstream>

namespace fs = std::filesystem;

namespace ResourceMover::config {

// Minimal JSON reader for a flat object of scalars and string arrays
namespace json {

inline std::string trim(const std::string& s) {
  auto start = s.find_first_not_of(" \t\n\r");
  if (start == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t\n\r");
  return s.substr(start, end - start + 1);
}

/// Position of the first character of the value stored under @p key, npos if absent
inline size_t findValue(const std::string& json, const std::string& key) {
  const std::string quoted = "\"" + key + "\"";
  size_t keyPos = json.find(quoted);
  while (keyPos != std::string::npos) {
    auto colonPos = json.find_first_not_of(" \t\n\r", keyPos + quoted.size());
    if (colonPos != std::string::npos && json[colonPos] == ':') {
      return json.find_first_not_of(" \t\n\r", colonPos + 1);
    }
    // The key text appeared as a value; keep looking
    keyPos = json.find(quoted, keyPos + quoted.size());
  }
  return std::string::npos;
}

inline bool isValueEnd(const std::string& json, size_t pos) {
  if (pos >= json.size())
    return true;
  const char c = json[pos];
  return c == ',' || c == '}' || c == ']' || c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

inline Result<std::string> extractString(const std::string& json, const std::string& key,
                                         size_t valueStart) {
  if (json[valueStart] != '"') {
    return Result<std::string>::error("'" + key + "' must be a string");
  }
  auto valueEnd = json.find('"', valueStart + 1);
  if (valueEnd == std::string::npos) {
    return Result<std::string>::error("Unterminated string for '" + key + "'");
  }
  return Result<std::string>::ok(json.substr(valueStart + 1, valueEnd - valueStart - 1));
}

inline Result<u32> extractUnsigned(const std::string& json, const std::string& key,
                                   size_t valueStart) {
  size_t end = valueStart;
  while (end < json.size() && json[end] >= '0' && json[end] <= '9') {
    ++end;
  }
  if (end == valueStart || !isValueEnd(json, end)) {
    return Result<u32>::error("'" + key + "' must be a non-negative integer");
  }
  try {
    unsigned long value = std::stoul(json.substr(valueStart, end - valueStart));
    if (value > 0xFFFFFFFFul) {
      return Result<u32>::error("'" + key + "' is out of range");
    }
    return Result<u32>::ok(static_cast<u32>(value));
  } catch (const std::out_of_range&) {
    return Result<u32>::error("'" + key + "' is out of range");
  }
}

inline Result<bool> extractBool(const std::string& json, const std::string& key,
                                size_t valueStart) {
  if (json.compare(valueStart, 4, "true") == 0 && isValueEnd(json, valueStart + 4)) {
    return Result<bool>::ok(true);
  }
  if (json.compare(valueStart, 5, "false") == 0 && isValueEnd(json, valueStart + 5)) {
    return Result<bool>::ok(false);
  }
  return Result<bool>::error("'" + key + "' must be true or false");
}

inline Result<std::vector<std::string>> extractStringArray(const std::string& json,
                                                           const std::string& key,
                                                           size_t valueStart) {
  using ArrayResult = Result<std::vector<std::string>>;
  if (json[valueStart] != '[') {
    return ArrayResult::error("'" + key + "' must be an array of strings");
  }

  std::vector<std::string> result;
  size_t pos = json.find_first_not_of(" \t\n\r", valueStart + 1);
  while (pos != std::string::npos && json[pos] != ']') {
    if (json[pos] != '"') {
      return ArrayResult::error("'" + key + "' must be an array of strings");
    }
    auto end = json.find('"', pos + 1);
    if (end == std::string::npos) {
      return ArrayResult::error("Unterminated string in '" + key + "'");
    }
    result.push_back(json.substr(pos + 1, end - pos - 1));

    pos = json.find_first_not_of(" \t\n\r", end + 1);
    if (pos != std::string::npos && json[pos] == ',') {
      pos = json.find_first_not_of(" \t\n\r", pos + 1);
    }
  }
  if (pos == std::string::npos) {
    return ArrayResult::error("Unterminated array for '" + key + "'");
  }
  return ArrayResult::ok(std::move(result));
}

} // namespace json

Result<MoverConfig> MoverConfigLoader::loadFromFile(const std::string& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return Result<MoverConfig>::error("Configuration file not found: " + path);
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<MoverConfig>::error("Cannot open configuration file: " + path);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();

  MoverConfig config;
  auto parsed = parseJson(buffer.str(), config);
  if (parsed.isError()) {
    return Result<MoverConfig>::error("Invalid configuration file " + path + ": " +
                                      parsed.error());
  }
  return Result<MoverConfig>::ok(std::move(config));
}

Result<void> MoverConfigLoader::parseJson(const std::string& jsonStr, MoverConfig& config) {
  const std::string content = json::trim(jsonStr);
  if (content.size() < 2 || content.front() != '{' || content.back() != '}') {
    return Result<void>::error("expected a JSON object");
  }

  size_t pos = json::findValue(content, "max_rounds");
  if (pos != std::string::npos) {
    auto value = json::extractUnsigned(content, "max_rounds", pos);
    if (value.isError()) {
      return Result<void>::error(value.error());
    }
    if (value.value() < 1) {
      return Result<void>::error("'max_rounds' must be at least 1");
    }
    config.maxRounds = value.value();
  }

  pos = json::findValue(content, "indent_width");
  if (pos != std::string::npos) {
    auto value = json::extractUnsigned(content, "indent_width", pos);
    if (value.isError()) {
      return Result<void>::error(value.error());
    }
    config.indentWidth = value.value();
  }

  pos = json::findValue(content, "source_extensions");
  if (pos != std::string::npos) {
    auto value = json::extractStringArray(content, "source_extensions", pos);
    if (value.isError()) {
      return Result<void>::error(value.error());
    }
    config.sourceExtensions = std::move(value).value();
  }

  pos = json::findValue(content, "resource_extensions");
  if (pos != std::string::npos) {
    auto value = json::extractStringArray(content, "resource_extensions", pos);
    if (value.isError()) {
      return Result<void>::error(value.error());
    }
    config.resourceExtensions = std::move(value).value();
  }

  pos = json::findValue(content, "log_level");
  if (pos != std::string::npos) {
    auto value = json::extractString(content, "log_level", pos);
    if (value.isError()) {
      return Result<void>::error(value.error());
    }
    if (!core::parseLogLevel(value.value(), config.logLevel)) {
      return Result<void>::error("Unknown log level '" + value.value() + "'");
    }
  }

  pos = json::findValue(content, "log_file");
  if (pos != std::string::npos) {
    auto value = json::extractString(content, "log_file", pos);
    if (value.isError()) {
      return Result<void>::error(value.error());
    }
    config.logFile = value.value();
  }

  pos = json::findValue(content, "use_colors");
  if (pos != std::string::npos) {
    auto value = json::extractBool(content, "use_colors", pos);
    if (value.isError()) {
      return Result<void>::error(value.error());
    }
    config.useColors = value.value();
  }

  return Result<void>::ok();
}

} // namespace ResourceMover::config
