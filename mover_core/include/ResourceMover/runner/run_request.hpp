#pragma once

/**
 * @file run_request.hpp
 * @brief Inputs and outputs of a move or remove run
 */

#include "ResourceMover/core/result.hpp"
#include "ResourceMover/resources/resource_type.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ResourceMover::runner {

namespace fs = std::filesystem;

inline constexpr u32 kDefaultMaxRounds = 10;

struct MoveRequest {
  fs::path source;
  std::vector<fs::path> destinations;
  /// Modules that consume the source; anything they reference stays put
  std::vector<fs::path> protectedModules;
  resources::ResourceTypeSet types;
  u32 maxRounds = kDefaultMaxRounds;
};

struct RemoveRequest {
  fs::path target;
  std::vector<fs::path> protectedModules;
  resources::ResourceTypeSet types;
  u32 maxRounds = kDefaultMaxRounds;
  /// ECMAScript pattern; names containing a match are never removed
  std::optional<std::string> ignorePattern;
};

struct RunSummary {
  usize totalAffected = 0;
  u32 rounds = 0;
  bool roundLimitReached = false;
  std::vector<usize> affectedPerRound;
};

/**
 * @brief Build the type filter from an include list or an exclude list
 *
 * An include list is used as is; an exclude list is subtracted from all
 * types; neither selects every type. Giving both is an error.
 */
[[nodiscard]] Result<resources::ResourceTypeSet>
deriveTypeFilter(const std::vector<resources::ResourceType>& include,
                 const std::vector<resources::ResourceType>& exclude);

[[nodiscard]] Result<void> validateMoveRequest(const MoveRequest& request);
[[nodiscard]] Result<void> validateRemoveRequest(const RemoveRequest& request);

} // namespace ResourceMover::runner
