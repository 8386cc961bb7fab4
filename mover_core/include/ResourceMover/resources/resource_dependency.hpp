#pragma once

/**
 * @file resource_dependency.hpp
 * @brief A (type, name) reference to a resource
 */

#include "ResourceMover/resources/resource_type.hpp"
#include <functional>
#include <string>
#include <unordered_set>
#include <utility>

namespace ResourceMover::resources {

/**
 * @brief Normalize a resource name as the R class sees it ('.' becomes '_')
 */
[[nodiscard]] std::string normalizeResourceName(std::string name);

struct ResourceDependency {
  ResourceDependency(ResourceType type, std::string name)
      : type(type), name(normalizeResourceName(std::move(name))) {}

  ResourceType type;
  std::string name;

  bool operator==(const ResourceDependency& other) const {
    return type == other.type && name == other.name;
  }
  bool operator!=(const ResourceDependency& other) const { return !(*this == other); }
};

struct ResourceDependencyHash {
  usize operator()(const ResourceDependency& dependency) const {
    usize seed = std::hash<std::string>{}(dependency.name);
    seed ^= static_cast<usize>(dependency.type) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
  }
};

using ResourceDependencySet = std::unordered_set<ResourceDependency, ResourceDependencyHash>;

/**
 * @brief Keep only dependencies whose type is in @p types
 */
[[nodiscard]] ResourceDependencySet filterByType(const ResourceDependencySet& dependencies,
                                                 const ResourceTypeSet& types);

/**
 * @brief Set difference: elements of @p from not present in @p excluded
 */
[[nodiscard]] ResourceDependencySet subtract(const ResourceDependencySet& from,
                                             const ResourceDependencySet& excluded);

void mergeInto(ResourceDependencySet& target, const ResourceDependencySet& source);

[[nodiscard]] std::unordered_set<std::string> namesOf(const ResourceDependencySet& dependencies);

[[nodiscard]] std::string toString(const ResourceDependency& dependency);

} // namespace ResourceMover::resources
