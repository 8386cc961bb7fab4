#pragma once

/**
 * @file resource_remover_runner.hpp
 * @brief Deletes resources nothing references any more
 */

#include "ResourceMover/editing/resource_editor.hpp"
#include "ResourceMover/resources/module_resolver.hpp"
#include "ResourceMover/runner/progress_logger.hpp"
#include "ResourceMover/runner/run_request.hpp"

namespace ResourceMover::runner {

/**
 * @brief Orchestrates removal of unused resources from a module in rounds
 *
 * A resource defined in the target is deleted when its type is selected,
 * neither the target nor any protected module references its name, and
 * its name does not match the ignore pattern. Deleting a resource can
 * orphan the resources it referenced, so rounds repeat until one removes
 * nothing or the round limit is hit.
 */
class ResourceRemoverRunner {
public:
  ResourceRemoverRunner(IProgressLogger& logger, const resources::ModuleResolver& resolver,
                        const editing::ResourceEditor& editor);

  [[nodiscard]] Result<RunSummary> removeResources(const RemoveRequest& request);

private:
  [[nodiscard]] Result<usize> runRound(const RemoveRequest& request,
                                       const std::optional<std::regex>& namesToIgnore, u32 depth);

  IProgressLogger& m_logger;
  const resources::ModuleResolver& m_resolver;
  const editing::ResourceEditor& m_editor;
};

} // namespace ResourceMover::runner
