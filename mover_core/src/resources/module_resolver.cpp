#include "ResourceMover/resources/module_resolver.hpp"
#include "ResourceMover/core/logger.hpp"

namespace ResourceMover::resources {

ModuleResolver::ModuleResolver(const ReferenceScanner& scanner) : m_scanner(scanner) {}

Result<ModuleInfo> ModuleResolver::resolve(const fs::path& directory,
                                           const ResourceTypeSet& types) const {
  auto scanned = m_scanner.scanModule(directory);
  if (scanned.isError()) {
    return Result<ModuleInfo>::error(scanned.error());
  }

  ModuleInfo info;
  info.root = directory;
  info.dependencies = filterByType(scanned.value(), types);

  RESOURCEMOVER_LOG_DEBUG("{}: {} referenced resource(s) of the selected types",
                          directory.string(), info.dependencies.size());
  return Result<ModuleInfo>::ok(std::move(info));
}

Result<ResourceDependencySet> ModuleResolver::resolveAll(const std::vector<fs::path>& directories,
                                                         const ResourceTypeSet& types) const {
  ResourceDependencySet all;
  for (const auto& directory : directories) {
    auto info = resolve(directory, types);
    if (info.isError()) {
      return Result<ResourceDependencySet>::error(info.error());
    }
    mergeInto(all, info.value().dependencies);
  }
  return Result<ResourceDependencySet>::ok(std::move(all));
}

} // namespace ResourceMover::resources
