#pragma once

/**
 * @file mover_config.hpp
 * @brief Tunables of a run and their JSON file
 *
 * Handles:
 * - Built-in defaults
 * - Loading an optional configuration file given with --config
 * - Strict value checking (a value of the wrong kind is an error, an
 *   unknown key is ignored)
 *
 * Example file:
 * @code
 * {
 *   "max_rounds": 20,
 *   "indent_width": 2,
 *   "source_extensions": ["java", "kt", "xml"],
 *   "resource_extensions": ["xml", "png", "webp"],
 *   "log_level": "debug",
 *   "log_file": "resource_mover.log",
 *   "use_colors": false
 * }
 * @endcode
 */

#include "ResourceMover/core/logger.hpp"
#include "ResourceMover/core/result.hpp"
#include "ResourceMover/core/types.hpp"
#include <string>
#include <vector>

namespace ResourceMover::config {

struct MoverConfig {
  u32 maxRounds = 10;
  u32 indentWidth = 4;
  std::vector<std::string> sourceExtensions = {"java", "kt", "xml"};
  std::vector<std::string> resourceExtensions = {"xml", "png", "webp", "jpg", "jpeg", "gif"};
  core::LogLevel logLevel = core::LogLevel::Info;
  std::string logFile;
  bool useColors = true;
};

class MoverConfigLoader {
public:
  /**
   * @brief Read @p path over the defaults
   * @return The merged configuration, or an error naming the file
   */
  [[nodiscard]] static Result<MoverConfig> loadFromFile(const std::string& path);

  /**
   * @brief Apply the keys present in @p jsonStr on top of @p config
   */
  [[nodiscard]] static Result<void> parseJson(const std::string& jsonStr, MoverConfig& config);
};

} // namespace ResourceMover::config
