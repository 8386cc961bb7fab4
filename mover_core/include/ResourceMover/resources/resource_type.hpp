#pragma once

/**
 * @file resource_type.hpp
 * @brief Android resource categories and their raw names
 *
 * A raw name is the token that names a type both in resource directories
 * (res/drawable-hdpi) and in references (@drawable/..., R.drawable...).
 */

#include "ResourceMover/core/types.hpp"
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ResourceMover::resources {

enum class ResourceType : u8 {
  Animation,
  Animator,
  Array,
  Attribute,
  Boolean,
  Color,
  Dimension,
  Drawable,
  Font,
  Fraction,
  Id,
  Integer,
  Interpolator,
  Layout,
  Menu,
  Mipmap,
  Navigation,
  Plurals,
  Raw,
  String,
  Style,
  Styleable,
  Transition,
  Xml
};

using ResourceTypeSet = std::set<ResourceType>;

[[nodiscard]] const char* resourceTypeToRawName(ResourceType type);

/**
 * @brief Classify a raw name; anything outside the enumeration yields nullopt
 */
[[nodiscard]] std::optional<ResourceType> resourceTypeFromRawName(std::string_view rawName);

/**
 * @brief Classify a resource directory name, ignoring its qualifiers
 *
 * "drawable-night-hdpi" and "drawable" both classify as Drawable.
 */
[[nodiscard]] std::optional<ResourceType> resourceTypeFromDirectoryName(std::string_view dirName);

/**
 * @brief Classify a unit inside a container document by its tag
 *
 * Understands the spellings that compile into a shared R class:
 * string-array and integer-array are arrays, declare-styleable is a
 * styleable and <item type="T"> is T.
 */
[[nodiscard]] std::optional<ResourceType> resourceTypeFromElementTag(std::string_view tagName,
                                                                     std::string_view typeAttribute);

[[nodiscard]] const std::vector<ResourceType>& allResourceTypes();

/**
 * @brief Raw names of every type, comma separated, for diagnostics
 */
[[nodiscard]] std::string describeResourceTypes();

} // namespace ResourceMover::resources
