/**
 * @file resource_remover_runner.cpp
 * @brief Round-based unused resource removal
 */

#include "ResourceMover/runner/resource_remover_runner.hpp"
#include "ResourceMover/core/logger.hpp"

namespace ResourceMover::runner {

ResourceRemoverRunner::ResourceRemoverRunner(IProgressLogger& logger,
                                             const resources::ModuleResolver& resolver,
                                             const editing::ResourceEditor& editor)
    : m_logger(logger), m_resolver(resolver), m_editor(editor) {}

Result<RunSummary> ResourceRemoverRunner::removeResources(const RemoveRequest& request) {
  auto valid = validateRemoveRequest(request);
  if (valid.isError()) {
    return Result<RunSummary>::error(valid.error());
  }

  std::optional<std::regex> namesToIgnore;
  if (request.ignorePattern.has_value()) {
    namesToIgnore.emplace(*request.ignorePattern);
  }

  RunSummary summary;
  u32 round = 1;
  bool active = true;
  std::string failure;

  while (active) {
    logFrame(m_logger, 0, "Round #" + std::to_string(round), [&](u32 depth) {
      auto removed = runRound(request, namesToIgnore, depth);
      if (removed.isError()) {
        m_logger.log(depth, "Aborting: " + removed.error(), MessageTone::Failure);
        failure = removed.error();
        active = false;
        return;
      }

      summary.rounds = round;
      summary.affectedPerRound.push_back(removed.value());
      summary.totalAffected += removed.value();

      if (removed.value() > 0) {
        m_logger.log(depth,
                     "Removed " + std::to_string(removed.value()) +
                         " resource(s). Attempting another round of removal to see if new "
                         "unused resources were introduced.",
                     MessageTone::Success);
        ++round;
      } else {
        m_logger.log(depth, "No resources were removed. Removal is done.");
        active = false;
      }

      if (active && round > request.maxRounds) {
        m_logger.log(depth,
                     "Exceeded maximum removal rounds (" + std::to_string(request.maxRounds) +
                         "). Terminating removal.",
                     MessageTone::Failure);
        summary.roundLimitReached = true;
        active = false;
      }
    });
  }

  if (!failure.empty()) {
    RESOURCEMOVER_LOG_ERROR("Resource removal aborted: {}", failure);
    return Result<RunSummary>::error(failure);
  }

  if (summary.roundLimitReached) {
    RESOURCEMOVER_LOG_WARN(
        "Round limit reached after removing {} resource(s); more resources may still be unused",
        summary.totalAffected);
  }

  logFrame(m_logger, 0, "Resource removal finished.", [&](u32 depth) {
    m_logger.log(depth, std::to_string(summary.totalAffected) + " resource(s) removed over " +
                            std::to_string(summary.rounds) + " rounds.");
  });

  return Result<RunSummary>::ok(std::move(summary));
}

Result<usize> ResourceRemoverRunner::runRound(const RemoveRequest& request,
                                              const std::optional<std::regex>& namesToIgnore,
                                              u32 depth) {
  auto targetInfo = m_resolver.resolve(request.target, request.types);
  if (targetInfo.isError()) {
    return Result<usize>::error(targetInfo.error());
  }
  auto protectedDependencies = m_resolver.resolveAll(request.protectedModules, request.types);
  if (protectedDependencies.isError()) {
    return Result<usize>::error(protectedDependencies.error());
  }

  resources::ResourceDependencySet keep = std::move(targetInfo.value().dependencies);
  resources::mergeInto(keep, protectedDependencies.value());

  auto removed = m_editor.removeResources(request.target, request.types, resources::namesOf(keep),
                                          namesToIgnore);
  if (removed.isError()) {
    return removed;
  }

  if (removed.value() > 0) {
    m_logger.log(depth, "Removed " + std::to_string(removed.value()) + " matching resource(s).",
                 MessageTone::Success);
  } else {
    m_logger.log(depth, "No resources were removed", MessageTone::Notice);
  }
  return removed;
}

} // namespace ResourceMover::runner
