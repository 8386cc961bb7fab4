/**
 * @file resource_mover_app.cpp
 * @brief Tool start-up and run dispatch
 */

#include "ResourceMover/app/resource_mover_app.hpp"
#include "ResourceMover/core/logger.hpp"
#include "ResourceMover/editing/resource_editor.hpp"
#include "ResourceMover/resources/module_resolver.hpp"
#include "ResourceMover/resources/reference_scanner.hpp"
#include "ResourceMover/runner/progress_logger.hpp"
#include "ResourceMover/runner/resource_mover_runner.hpp"
#include "ResourceMover/runner/resource_remover_runner.hpp"
#include <filesystem>
#include <ostream>

namespace ResourceMover::app {

namespace fs = std::filesystem;

namespace {

std::vector<fs::path> toPaths(const std::vector<std::string>& values) {
  return std::vector<fs::path>(values.begin(), values.end());
}

editing::ResourceEditorOptions editorOptionsFrom(const config::MoverConfig& config) {
  editing::ResourceEditorOptions options;
  options.resourceExtensions = config.resourceExtensions;
  options.indentWidth = config.indentWidth;
  return options;
}

} // namespace

ResourceMoverApp::ResourceMoverApp(std::ostream& out, std::ostream& err)
    : m_out(out), m_err(err) {}

int ResourceMoverApp::run(int argc, const char* const argv[]) {
  const char* programName = argc > 0 ? argv[0] : "resource_mover";

  auto parsed = parseCommandLine(argc, argv);
  if (parsed.isError()) {
    m_err << "Error: " << parsed.error() << "\n";
    m_err << "Run '" << programName << " --help' for usage.\n";
    return kExitConfigurationError;
  }
  const CommandLineOptions& options = parsed.value();

  if (options.help) {
    printHelp(m_out, programName);
    return kExitSuccess;
  }
  if (options.version) {
    printVersion(m_out);
    return kExitSuccess;
  }

  auto config = resolveConfig(options);
  if (config.isError()) {
    return reportConfigurationError(config.error());
  }

  // Requests are validated before the log file is created
  int status = kExitSuccess;
  if (options.command == Command::Move) {
    auto request = buildMoveRequest(options, config.value());
    if (request.isError()) {
      return reportConfigurationError(request.error());
    }
    if (!startLogging(config.value())) {
      return kExitRunError;
    }
    status = runMove(request.value(), config.value());
  } else {
    auto request = buildRemoveRequest(options, config.value());
    if (request.isError()) {
      return reportConfigurationError(request.error());
    }
    if (!startLogging(config.value())) {
      return kExitRunError;
    }
    status = runRemove(request.value(), config.value());
  }

  core::Logger::instance().closeOutputFile();
  return status;
}

Result<config::MoverConfig>
ResourceMoverApp::resolveConfig(const CommandLineOptions& options) const {
  config::MoverConfig config;
  if (!options.configPath.empty()) {
    auto loaded = config::MoverConfigLoader::loadFromFile(options.configPath);
    if (loaded.isError()) {
      return loaded;
    }
    config = std::move(loaded).value();
  }

  // Command line wins over the file
  if (options.maxRounds.has_value()) {
    config.maxRounds = *options.maxRounds;
  }
  if (options.verbose) {
    config.logLevel = core::LogLevel::Debug;
  }
  if (options.noColor) {
    config.useColors = false;
  }
  if (!options.logFile.empty()) {
    config.logFile = options.logFile;
  }
  return Result<config::MoverConfig>::ok(std::move(config));
}

Result<void> ResourceMoverApp::initializeLogging(const config::MoverConfig& config) const {
  auto& logger = core::Logger::instance();
  logger.setLevel(config.logLevel);
  logger.setUseColors(config.useColors);

  if (!config.logFile.empty() && !logger.setOutputFile(config.logFile)) {
    return Result<void>::error("Cannot open log file: " + config.logFile);
  }
  return Result<void>::ok();
}

bool ResourceMoverApp::startLogging(const config::MoverConfig& config) {
  auto logging = initializeLogging(config);
  if (logging.isError()) {
    m_err << "Error: " << logging.error() << "\n";
    return false;
  }
  return true;
}

Result<runner::MoveRequest>
ResourceMoverApp::buildMoveRequest(const CommandLineOptions& options,
                                   const config::MoverConfig& config) const {
  auto types = runner::deriveTypeFilter(options.includeTypes, options.excludeTypes);
  if (types.isError()) {
    return Result<runner::MoveRequest>::error(types.error());
  }

  runner::MoveRequest request;
  request.source = options.source;
  request.destinations = toPaths(options.outputs);
  request.protectedModules = toPaths(options.dependencies);
  request.types = std::move(types).value();
  request.maxRounds = config.maxRounds;

  auto valid = runner::validateMoveRequest(request);
  if (valid.isError()) {
    return Result<runner::MoveRequest>::error(valid.error());
  }
  return Result<runner::MoveRequest>::ok(std::move(request));
}

Result<runner::RemoveRequest>
ResourceMoverApp::buildRemoveRequest(const CommandLineOptions& options,
                                     const config::MoverConfig& config) const {
  auto types = runner::deriveTypeFilter(options.includeTypes, options.excludeTypes);
  if (types.isError()) {
    return Result<runner::RemoveRequest>::error(types.error());
  }

  runner::RemoveRequest request;
  request.target = options.source;
  request.protectedModules = toPaths(options.dependencies);
  request.types = std::move(types).value();
  request.maxRounds = config.maxRounds;
  request.ignorePattern = options.skipPattern;

  auto valid = runner::validateRemoveRequest(request);
  if (valid.isError()) {
    return Result<runner::RemoveRequest>::error(valid.error());
  }
  return Result<runner::RemoveRequest>::ok(std::move(request));
}

int ResourceMoverApp::runMove(const runner::MoveRequest& request,
                              const config::MoverConfig& config) {
  RESOURCEMOVER_LOG_INFO("Moving resources out of {} into {} module(s)", request.source.string(),
                         request.destinations.size());

  resources::ReferenceScanner scanner(config.sourceExtensions);
  resources::ModuleResolver resolver(scanner);
  editing::ResourceEditor editor(editorOptionsFrom(config));
  runner::ConsoleProgressLogger progress(m_out, config.useColors);

  runner::ResourceMoverRunner moverRunner(progress, resolver, editor);
  auto summary = moverRunner.moveResources(request);
  if (summary.isError()) {
    m_err << "Error: " << summary.error() << "\n";
    return kExitRunError;
  }
  return kExitSuccess;
}

int ResourceMoverApp::runRemove(const runner::RemoveRequest& request,
                                const config::MoverConfig& config) {
  RESOURCEMOVER_LOG_INFO("Removing unused resources from {}", request.target.string());

  resources::ReferenceScanner scanner(config.sourceExtensions);
  resources::ModuleResolver resolver(scanner);
  editing::ResourceEditor editor(editorOptionsFrom(config));
  runner::ConsoleProgressLogger progress(m_out, config.useColors);

  runner::ResourceRemoverRunner removerRunner(progress, resolver, editor);
  auto summary = removerRunner.removeResources(request);
  if (summary.isError()) {
    m_err << "Error: " << summary.error() << "\n";
    return kExitRunError;
  }
  return kExitSuccess;
}

int ResourceMoverApp::reportConfigurationError(const std::string& message) {
  RESOURCEMOVER_LOG_ERROR("Configuration error: {}", message);
  m_err << "Error: " << message << "\n";
  return kExitConfigurationError;
}

} // namespace ResourceMover::app
