/**
 * @file resource_mover_runner.cpp
 * @brief Round-based resource moving
 */

#include "ResourceMover/runner/resource_mover_runner.hpp"
#include "ResourceMover/core/logger.hpp"

namespace ResourceMover::runner {

using resources::ModuleInfo;
using resources::ResourceDependencySet;

ResourceMoverRunner::ResourceMoverRunner(IProgressLogger& logger,
                                         const resources::ModuleResolver& resolver,
                                         const editing::ResourceEditor& editor)
    : m_logger(logger), m_resolver(resolver), m_editor(editor) {}

Result<RunSummary> ResourceMoverRunner::moveResources(const MoveRequest& request) {
  auto valid = validateMoveRequest(request);
  if (valid.isError()) {
    return Result<RunSummary>::error(valid.error());
  }

  RunSummary summary;
  u32 round = 1;
  bool active = true;
  std::string failure;

  while (active) {
    logFrame(m_logger, 0, "Round #" + std::to_string(round), [&](u32 depth) {
      auto moved = runRound(request, depth);
      if (moved.isError()) {
        m_logger.log(depth, "Aborting: " + moved.error(), MessageTone::Failure);
        failure = moved.error();
        active = false;
        return;
      }

      summary.rounds = round;
      summary.affectedPerRound.push_back(moved.value());
      summary.totalAffected += moved.value();

      if (moved.value() > 0) {
        m_logger.log(depth,
                     "Moved " + std::to_string(moved.value()) +
                         " resource(s). Attempting another round of extraction to see if new "
                         "dependencies were introduced.",
                     MessageTone::Success);
        ++round;
      } else {
        m_logger.log(depth, "No resources were moved. Extraction is done.");
        active = false;
      }

      if (active && round > request.maxRounds) {
        m_logger.log(depth,
                     "Exceeded maximum moving rounds (" + std::to_string(request.maxRounds) +
                         "). Terminating moving.",
                     MessageTone::Failure);
        summary.roundLimitReached = true;
        active = false;
      }
    });
  }

  if (!failure.empty()) {
    RESOURCEMOVER_LOG_ERROR("Resource moving aborted: {}", failure);
    return Result<RunSummary>::error(failure);
  }

  if (summary.roundLimitReached) {
    RESOURCEMOVER_LOG_WARN(
        "Round limit reached after moving {} resource(s); more resources may still be movable",
        summary.totalAffected);
  }

  logFrame(m_logger, 0, "Resource moving finished.", [&](u32 depth) {
    m_logger.log(depth, std::to_string(summary.totalAffected) + " resource(s) moved over " +
                            std::to_string(summary.rounds) + " rounds.");
  });

  return Result<RunSummary>::ok(std::move(summary));
}

Result<usize> ResourceMoverRunner::runRound(const MoveRequest& request, u32 depth) {
  auto sourceInfo = m_resolver.resolve(request.source, request.types);
  if (sourceInfo.isError()) {
    return Result<usize>::error(sourceInfo.error());
  }
  auto protectedDependencies = m_resolver.resolveAll(request.protectedModules, request.types);
  if (protectedDependencies.isError()) {
    return Result<usize>::error(protectedDependencies.error());
  }

  ResourceDependencySet blocked = std::move(sourceInfo.value().dependencies);
  resources::mergeInto(blocked, protectedDependencies.value());

  std::vector<ModuleInfo> destinations;
  destinations.reserve(request.destinations.size());
  for (const auto& destination : request.destinations) {
    auto info = m_resolver.resolve(destination, request.types);
    if (info.isError()) {
      return Result<usize>::error(info.error());
    }
    destinations.push_back(std::move(info).value());
  }

  usize movedThisRound = 0;
  for (usize j = 0; j < destinations.size(); ++j) {
    const ModuleInfo& module = destinations[j];
    const std::string label = module.root.string();

    ResourceDependencySet otherDestinations;
    for (usize k = 0; k < destinations.size(); ++k) {
      if (k != j) {
        resources::mergeInto(otherDestinations, destinations[k].dependencies);
      }
    }

    const ResourceDependencySet candidates = resources::subtract(
        resources::subtract(module.dependencies, blocked), otherDestinations);

    if (candidates.empty()) {
      m_logger.log(depth, label + ": No resources can be moved.", MessageTone::Notice);
      continue;
    }

    m_logger.log(depth, label + ": Only " + std::to_string(candidates.size()) + "/" +
                            std::to_string(module.dependencies.size()) +
                            " resource(s) referenced can be extracted due to other modules "
                            "referencing them.");

    auto moved = m_editor.moveResources(request.source, module.root, candidates);
    if (moved.isError()) {
      return moved;
    }

    if (moved.value() > 0) {
      m_logger.log(depth, label + ": Moved " + std::to_string(moved.value()) +
                              " matching resource(s).",
                   MessageTone::Success);
    } else {
      m_logger.log(depth, label + ": No resources were moved.", MessageTone::Notice);
    }
    movedThisRound += moved.value();
  }

  return Result<usize>::ok(movedThisRound);
}

} // namespace ResourceMover::runner
