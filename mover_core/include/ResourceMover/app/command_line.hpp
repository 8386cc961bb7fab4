#pragma once

/**
 * @file command_line.hpp
 * @brief Command-line options of the resource_mover tool
 *
 * Usage:
 *   resource_mover move -s <module> -o <module>... [-d <module>...]
 *                       [-i <type>... | -e <type>...] [options]
 *   resource_mover remove -s <module> [-d <module>...]
 *                         [-i <type>... | -e <type>...] [--skip <regex>] [options]
 *
 * Options that take several values are repeated (-o a -o b).
 */

#include "ResourceMover/core/result.hpp"
#include "ResourceMover/resources/resource_type.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace ResourceMover::app {

enum class Command { None, Move, Remove };

struct CommandLineOptions {
  Command command = Command::None;
  std::string source;                        // -s, --source
  std::vector<std::string> outputs;          // -o, --output (move only)
  std::vector<std::string> dependencies;     // -d, --dependency
  std::vector<resources::ResourceType> includeTypes; // -i, --include
  std::vector<resources::ResourceType> excludeTypes; // -e, --exclude
  std::optional<std::string> skipPattern;    // --skip (remove only)
  std::optional<u32> maxRounds;              // --max-rounds
  std::string configPath;                    // --config
  std::string logFile;                       // --log-file
  bool verbose = false;                      // -v, --verbose
  bool noColor = false;                      // --no-color
  bool help = false;                         // -h, --help
  bool version = false;                      // --version
};

/**
 * @brief Parse the arguments after the program name
 *
 * Only shape errors are reported here: unknown options, missing values,
 * unknown type names, a non-numeric round limit, a missing command or
 * source. Combinations (include with exclude, no output) are left to
 * request validation. With -h or --version nothing else is required.
 */
[[nodiscard]] Result<CommandLineOptions> parseCommandLine(int argc, const char* const argv[]);

/**
 * @brief Classify raw type names, rejecting unknown ones with the list of
 * valid names
 */
[[nodiscard]] Result<std::vector<resources::ResourceType>>
parseResourceTypeNames(const std::vector<std::string>& names);

void printHelp(std::ostream& out, const char* programName);
void printVersion(std::ostream& out);

} // namespace ResourceMover::app
