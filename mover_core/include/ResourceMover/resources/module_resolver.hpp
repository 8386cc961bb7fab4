#pragma once

/**
 * @file module_resolver.hpp
 * @brief Snapshot of the resources a module references right now
 *
 * A ModuleInfo is only valid for the round it was resolved in: every edit
 * can change what a module references, so callers resolve again at the
 * start of each round instead of keeping old snapshots around.
 */

#include "ResourceMover/core/result.hpp"
#include "ResourceMover/resources/reference_scanner.hpp"
#include <filesystem>
#include <vector>

namespace ResourceMover::resources {

struct ModuleInfo {
  fs::path root;
  ResourceDependencySet dependencies;
};

class ModuleResolver {
public:
  explicit ModuleResolver(const ReferenceScanner& scanner);

  /**
   * @brief Scan @p directory and keep only references of a type in @p types
   */
  [[nodiscard]] Result<ModuleInfo> resolve(const fs::path& directory,
                                           const ResourceTypeSet& types) const;

  /**
   * @brief Union of the filtered references of every directory
   */
  [[nodiscard]] Result<ResourceDependencySet> resolveAll(const std::vector<fs::path>& directories,
                                                         const ResourceTypeSet& types) const;

private:
  const ReferenceScanner& m_scanner;
};

} // namespace ResourceMover::resources
