#include "ResourceMover/resources/resource_type.hpp"

#include <array>
#include <utility>

namespace ResourceMover::resources {

namespace {

constexpr std::array<std::pair<ResourceType, const char*>, 24> kRawNames = {{
    {ResourceType::Animation, "anim"},
    {ResourceType::Animator, "animator"},
    {ResourceType::Array, "array"},
    {ResourceType::Attribute, "attr"},
    {ResourceType::Boolean, "bool"},
    {ResourceType::Color, "color"},
    {ResourceType::Dimension, "dimen"},
    {ResourceType::Drawable, "drawable"},
    {ResourceType::Font, "font"},
    {ResourceType::Fraction, "fraction"},
    {ResourceType::Id, "id"},
    {ResourceType::Integer, "integer"},
    {ResourceType::Interpolator, "interpolator"},
    {ResourceType::Layout, "layout"},
    {ResourceType::Menu, "menu"},
    {ResourceType::Mipmap, "mipmap"},
    {ResourceType::Navigation, "navigation"},
    {ResourceType::Plurals, "plurals"},
    {ResourceType::Raw, "raw"},
    {ResourceType::String, "string"},
    {ResourceType::Style, "style"},
    {ResourceType::Styleable, "styleable"},
    {ResourceType::Transition, "transition"},
    {ResourceType::Xml, "xml"},
}};

} // namespace

const char* resourceTypeToRawName(ResourceType type) {
  for (const auto& [candidate, rawName] : kRawNames) {
    if (candidate == type) {
      return rawName;
    }
  }
  return "";
}

std::optional<ResourceType> resourceTypeFromRawName(std::string_view rawName) {
  for (const auto& [type, candidate] : kRawNames) {
    if (rawName == candidate) {
      return type;
    }
  }
  return std::nullopt;
}

std::optional<ResourceType> resourceTypeFromDirectoryName(std::string_view dirName) {
  return resourceTypeFromRawName(dirName.substr(0, dirName.find('-')));
}

std::optional<ResourceType> resourceTypeFromElementTag(std::string_view tagName,
                                                       std::string_view typeAttribute) {
  if (tagName == "item") {
    return resourceTypeFromRawName(typeAttribute);
  }
  if (tagName == "string-array" || tagName == "integer-array") {
    return ResourceType::Array;
  }
  if (tagName == "declare-styleable") {
    return ResourceType::Styleable;
  }
  return resourceTypeFromRawName(tagName);
}

const std::vector<ResourceType>& allResourceTypes() {
  static const std::vector<ResourceType> types = [] {
    std::vector<ResourceType> result;
    result.reserve(kRawNames.size());
    for (const auto& entry : kRawNames) {
      result.push_back(entry.first);
    }
    return result;
  }();
  return types;
}

std::string describeResourceTypes() {
  std::string result;
  for (const auto& entry : kRawNames) {
    if (!result.empty()) {
      result += ", ";
    }
    result += entry.second;
  }
  return result;
}

} // namespace ResourceMover::resources
