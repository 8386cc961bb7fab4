#pragma once

/**
 * @file resource_mover_runner.hpp
 * @brief Moves resources out of a module into the modules that use them
 */

#include "ResourceMover/editing/resource_editor.hpp"
#include "ResourceMover/resources/module_resolver.hpp"
#include "ResourceMover/runner/progress_logger.hpp"
#include "ResourceMover/runner/run_request.hpp"

namespace ResourceMover::runner {

/**
 * @brief Orchestrates moving resources between modules in rounds
 *
 * A resource is moved from the source to a destination only when:
 * - the destination references it
 * - its type is selected
 * - the source does not reference it
 * - no other destination references it
 * - no protected module references it
 *
 * Moving a unit can make the destination reference resources it did not
 * reference before (a layout brings along the drawables it names), so
 * rounds repeat from a fresh scan until one moves nothing or the round
 * limit is hit.
 */
class ResourceMoverRunner {
public:
  ResourceMoverRunner(IProgressLogger& logger, const resources::ModuleResolver& resolver,
                      const editing::ResourceEditor& editor);

  [[nodiscard]] Result<RunSummary> moveResources(const MoveRequest& request);

private:
  [[nodiscard]] Result<usize> runRound(const MoveRequest& request, u32 depth);

  IProgressLogger& m_logger;
  const resources::ModuleResolver& m_resolver;
  const editing::ResourceEditor& m_editor;
};

} // namespace ResourceMover::runner
