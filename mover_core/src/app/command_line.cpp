/**
 * @file command_line.cpp
 * @brief Argument parsing and help text
 */

#include "ResourceMover/app/command_line.hpp"
#include <ostream>

#ifndef RESOURCEMOVER_VERSION_MAJOR
#define RESOURCEMOVER_VERSION_MAJOR 0
#endif
#ifndef RESOURCEMOVER_VERSION_MINOR
#define RESOURCEMOVER_VERSION_MINOR 1
#endif
#ifndef RESOURCEMOVER_VERSION_PATCH
#define RESOURCEMOVER_VERSION_PATCH 0
#endif

namespace ResourceMover::app {

namespace {

Result<u32> parseRoundLimit(const std::string& text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    return Result<u32>::error("--max-rounds expects a positive integer, got '" + text + "'");
  }
  if (text.size() > 9) {
    return Result<u32>::error("--max-rounds is out of range: " + text);
  }
  return Result<u32>::ok(static_cast<u32>(std::stoul(text)));
}

} // namespace

Result<std::vector<resources::ResourceType>>
parseResourceTypeNames(const std::vector<std::string>& names) {
  std::vector<resources::ResourceType> types;
  types.reserve(names.size());
  for (const auto& name : names) {
    auto type = resources::resourceTypeFromRawName(name);
    if (!type.has_value()) {
      return Result<std::vector<resources::ResourceType>>::error(
          name + " is not a valid android resource, pick from [" +
          resources::describeResourceTypes() + "].");
    }
    types.push_back(*type);
  }
  return Result<std::vector<resources::ResourceType>>::ok(std::move(types));
}

Result<CommandLineOptions> parseCommandLine(int argc, const char* const argv[]) {
  CommandLineOptions opts;
  std::vector<std::string> includeNames;
  std::vector<std::string> excludeNames;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    auto needsValue = [&](const std::string& option) -> Result<std::string> {
      if (i + 1 >= argc) {
        return Result<std::string>::error("Missing value for " + option);
      }
      return Result<std::string>::ok(argv[++i]);
    };

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "--version") {
      opts.version = true;
    } else if (arg == "-v" || arg == "--verbose") {
      opts.verbose = true;
    } else if (arg == "--no-color") {
      opts.noColor = true;
    } else if (arg == "-s" || arg == "--source" || arg == "-o" || arg == "--output" ||
               arg == "-d" || arg == "--dependency" || arg == "-i" || arg == "--include" ||
               arg == "-e" || arg == "--exclude" || arg == "--skip" || arg == "--max-rounds" ||
               arg == "--config" || arg == "--log-file") {
      auto value = needsValue(arg);
      if (value.isError()) {
        return Result<CommandLineOptions>::error(value.error());
      }

      if (arg == "-s" || arg == "--source") {
        opts.source = value.value();
      } else if (arg == "-o" || arg == "--output") {
        opts.outputs.push_back(value.value());
      } else if (arg == "-d" || arg == "--dependency") {
        opts.dependencies.push_back(value.value());
      } else if (arg == "-i" || arg == "--include") {
        includeNames.push_back(value.value());
      } else if (arg == "-e" || arg == "--exclude") {
        excludeNames.push_back(value.value());
      } else if (arg == "--skip") {
        opts.skipPattern = value.value();
      } else if (arg == "--max-rounds") {
        auto rounds = parseRoundLimit(value.value());
        if (rounds.isError()) {
          return Result<CommandLineOptions>::error(rounds.error());
        }
        opts.maxRounds = rounds.value();
      } else if (arg == "--config") {
        opts.configPath = value.value();
      } else {
        opts.logFile = value.value();
      }
    } else if (!arg.empty() && arg[0] == '-') {
      return Result<CommandLineOptions>::error("Unknown option: " + arg);
    } else if (opts.command == Command::None && arg == "move") {
      opts.command = Command::Move;
    } else if (opts.command == Command::None && arg == "remove") {
      opts.command = Command::Remove;
    } else {
      return Result<CommandLineOptions>::error("Unexpected argument: " + arg);
    }
  }

  if (opts.help || opts.version) {
    return Result<CommandLineOptions>::ok(std::move(opts));
  }

  if (opts.command == Command::None) {
    return Result<CommandLineOptions>::error("Missing command, expected 'move' or 'remove'");
  }
  if (opts.source.empty()) {
    return Result<CommandLineOptions>::error("Missing required option -s/--source");
  }
  if (opts.command == Command::Remove && !opts.outputs.empty()) {
    return Result<CommandLineOptions>::error("-o/--output is only valid for 'move'");
  }
  if (opts.command == Command::Move && opts.skipPattern.has_value()) {
    return Result<CommandLineOptions>::error("--skip is only valid for 'remove'");
  }

  auto included = parseResourceTypeNames(includeNames);
  if (included.isError()) {
    return Result<CommandLineOptions>::error(included.error());
  }
  auto excluded = parseResourceTypeNames(excludeNames);
  if (excluded.isError()) {
    return Result<CommandLineOptions>::error(excluded.error());
  }
  opts.includeTypes = std::move(included).value();
  opts.excludeTypes = std::move(excluded).value();

  return Result<CommandLineOptions>::ok(std::move(opts));
}

void printVersion(std::ostream& out) {
  out << "resource_mover version " << RESOURCEMOVER_VERSION_MAJOR << "."
      << RESOURCEMOVER_VERSION_MINOR << "." << RESOURCEMOVER_VERSION_PATCH << "\n";
  out << "Moves Android resources between modules and removes unused ones\n";
}

void printHelp(std::ostream& out, const char* programName) {
  out << "Usage: " << programName << " <move|remove> [options]\n\n";
  out << "Commands:\n";
  out << "  move     Moves resources from one module to many destination modules\n";
  out << "  remove   Removes unused resources from specified module\n\n";
  out << "Options:\n";
  out << "  -s, --source <dir>       Source module (required)\n";
  out << "  -o, --output <dir>       Module to move to, repeatable (move only)\n";
  out << "  -d, --dependency <dir>   Module that depends on the source, repeatable\n";
  out << "  -i, --include <type>     Resource type to act on, repeatable\n";
  out << "  -e, --exclude <type>     Resource type to leave alone, repeatable\n";
  out << "  --skip <regex>           Resource names never to remove (remove only)\n";
  out << "  --max-rounds <n>         Maximum number of rounds (default 10)\n";
  out << "  --config <path>          JSON configuration file\n";
  out << "  --log-file <path>        Also write diagnostics to a file\n";
  out << "  -v, --verbose            Verbose logging\n";
  out << "  --no-color               Disable colored output\n";
  out << "  -h, --help               Show this help message\n";
  out << "  --version                Show version information\n\n";
  out << "Resource types: " << resources::describeResourceTypes() << "\n";
}

} // namespace ResourceMover::app
