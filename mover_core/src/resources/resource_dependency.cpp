#include "ResourceMover/resources/resource_dependency.hpp"

#include <algorithm>

namespace ResourceMover::resources {

std::string normalizeResourceName(std::string name) {
  std::replace(name.begin(), name.end(), '.', '_');
  return name;
}

ResourceDependencySet filterByType(const ResourceDependencySet& dependencies,
                                   const ResourceTypeSet& types) {
  ResourceDependencySet result;
  for (const auto& dependency : dependencies) {
    if (types.count(dependency.type) > 0) {
      result.insert(dependency);
    }
  }
  return result;
}

ResourceDependencySet subtract(const ResourceDependencySet& from,
                               const ResourceDependencySet& excluded) {
  ResourceDependencySet result;
  for (const auto& dependency : from) {
    if (excluded.count(dependency) == 0) {
      result.insert(dependency);
    }
  }
  return result;
}

void mergeInto(ResourceDependencySet& target, const ResourceDependencySet& source) {
  target.insert(source.begin(), source.end());
}

std::unordered_set<std::string> namesOf(const ResourceDependencySet& dependencies) {
  std::unordered_set<std::string> names;
  names.reserve(dependencies.size());
  for (const auto& dependency : dependencies) {
    names.insert(dependency.name);
  }
  return names;
}

std::string toString(const ResourceDependency& dependency) {
  return std::string("@") + resourceTypeToRawName(dependency.type) + "/" + dependency.name;
}

} // namespace ResourceMover::resources
