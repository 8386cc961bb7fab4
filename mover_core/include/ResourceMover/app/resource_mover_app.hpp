#pragma once

/**
 * @file resource_mover_app.hpp
 * @brief Wires command line, configuration, logging and the runners
 *
 * Start-up order:
 * 1. Parse the command line (help and version stop here)
 * 2. Load the configuration file given with --config, if any
 * 3. Apply command-line overrides
 * 4. Build and validate the move or remove request
 * 5. Set up logging (this may create the log file)
 * 6. Run it and translate the outcome into an exit status
 *
 * Everything up to step 4 happens before a single file is touched.
 */

#include "ResourceMover/app/command_line.hpp"
#include "ResourceMover/config/mover_config.hpp"
#include "ResourceMover/runner/run_request.hpp"
#include <iosfwd>

namespace ResourceMover::app {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitConfigurationError = 1;
inline constexpr int kExitRunError = 2;

class ResourceMoverApp {
public:
  ResourceMoverApp(std::ostream& out, std::ostream& err);

  /**
   * @brief Run the tool
   * @return kExitSuccess, kExitConfigurationError or kExitRunError
   */
  int run(int argc, const char* const argv[]);

private:
  [[nodiscard]] Result<config::MoverConfig> resolveConfig(const CommandLineOptions& options) const;
  [[nodiscard]] Result<void> initializeLogging(const config::MoverConfig& config) const;

  bool startLogging(const config::MoverConfig& config);

  [[nodiscard]] Result<runner::MoveRequest>
  buildMoveRequest(const CommandLineOptions& options, const config::MoverConfig& config) const;
  [[nodiscard]] Result<runner::RemoveRequest>
  buildRemoveRequest(const CommandLineOptions& options, const config::MoverConfig& config) const;

  int runMove(const runner::MoveRequest& request, const config::MoverConfig& config);
  int runRemove(const runner::RemoveRequest& request, const config::MoverConfig& config);

  int reportConfigurationError(const std::string& message);

  std::ostream& m_out;
  std::ostream& m_err;
};

} // namespace ResourceMover::app
