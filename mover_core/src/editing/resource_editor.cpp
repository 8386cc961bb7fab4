/**
 * @file resource_editor.cpp
 * @brief Resource file relocation and removal
 */

#include "ResourceMover/editing/resource_editor.hpp"
#include "ResourceMover/core/logger.hpp"
#include "ResourceMover/editing/escape_sequences.hpp"
#include "ResourceMover/resources/resource_files.hpp"

namespace ResourceMover::editing {

using resources::ResourceDependency;
using resources::ResourceDependencySet;
using resources::ResourceType;
using resources::ResourceTypeSet;

namespace {

const std::vector<std::string> kXmlExtension = {"xml"};

bool matchesIgnorePattern(const std::optional<std::regex>& pattern, const std::string& name) {
  return pattern.has_value() && std::regex_search(name, *pattern);
}

} // namespace

std::optional<ResourceType> resourceTypeOfElement(const XmlNode& node) {
  if (!node.isElement()) {
    return std::nullopt;
  }
  const std::string* typeAttribute = node.attribute("type");
  return resources::resourceTypeFromElementTag(node.tagName,
                                               typeAttribute ? *typeAttribute : std::string());
}

std::string resourceNameOfElement(const XmlNode& node) {
  const std::string* name = node.attribute("name");
  if (name == nullptr) {
    return {};
  }
  return resources::normalizeResourceName(*name);
}

ResourceEditor::ResourceEditor() = default;

ResourceEditor::ResourceEditor(ResourceEditorOptions options) : m_options(std::move(options)) {}

// ============================================================================
// Module level
// ============================================================================

Result<usize> ResourceEditor::moveResources(const fs::path& fromModule, const fs::path& toModule,
                                            const ResourceDependencySet& dependencies) const {
  auto files = resources::listResourceFiles(fromModule, m_options.resourceExtensions);
  if (files.isError()) {
    return Result<usize>::error(files.error());
  }

  usize moved = 0;
  for (const auto& fromFile : files.value()) {
    const fs::path toFile = toModule / fromFile.lexically_relative(fromModule);
    auto result = applyMove(fromFile, toFile, dependencies);
    if (result.isError()) {
      return result;
    }
    moved += result.value();
  }
  return Result<usize>::ok(moved);
}

Result<usize> ResourceEditor::removeResources(const fs::path& module,
                                              const ResourceTypeSet& typesToRemove,
                                              const std::unordered_set<std::string>& namesToKeep,
                                              const std::optional<std::regex>& namesToIgnore) const {
  auto files = resources::listResourceFiles(module, m_options.resourceExtensions);
  if (files.isError()) {
    return Result<usize>::error(files.error());
  }

  usize removed = 0;
  for (const auto& file : files.value()) {
    auto result = applyRemove(file, typesToRemove, namesToKeep, namesToIgnore);
    if (result.isError()) {
      return result;
    }
    removed += result.value();
  }
  return Result<usize>::ok(removed);
}

// ============================================================================
// File level
// ============================================================================

Result<usize> ResourceEditor::applyMove(const fs::path& fromFile, const fs::path& toFile,
                                        const ResourceDependencySet& toMove) const {
  if (!resources::hasExtension(fromFile, kXmlExtension)) {
    return moveStandalone(fromFile, toFile, toMove);
  }

  auto loaded = loadDocument(fromFile);
  if (loaded.isError()) {
    return Result<usize>::error(loaded.error());
  }
  XmlDocument& source = loaded.value();

  if (source.rootName() != kContainerRootName) {
    return moveStandalone(fromFile, toFile, toMove);
  }

  std::vector<usize> indices;
  const auto& children = source.children();
  for (usize i = 0; i < children.size(); ++i) {
    const auto type = resourceTypeOfElement(children[i]);
    const std::string name = resourceNameOfElement(children[i]);
    if (type.has_value() && !name.empty() && toMove.count(ResourceDependency(*type, name)) > 0) {
      indices.push_back(i);
    }
  }

  if (indices.empty()) {
    return Result<usize>::ok(0);
  }

  std::error_code ec;
  const bool destinationExists = fs::exists(toFile, ec);
  if (ec) {
    return Result<usize>::error("Failed to access " + toFile.string() + ": " + ec.message());
  }

  XmlDocument destination = XmlDocument::emptyResources();
  if (destinationExists) {
    auto existing = loadDocument(toFile);
    if (existing.isError()) {
      return Result<usize>::error(existing.error());
    }
    if (existing.value().rootName() != kContainerRootName) {
      return Result<usize>::error("Cannot move values into " + toFile.string() +
                                  ": root element is <" + existing.value().rootName() + ">");
    }
    destination = std::move(existing).value();
  }

  // Values the destination already defines stay where they are
  ResourceDependencySet alreadyDefined;
  for (const auto& child : destination.children()) {
    const auto type = resourceTypeOfElement(child);
    const std::string name = resourceNameOfElement(child);
    if (type.has_value() && !name.empty()) {
      alreadyDefined.insert(ResourceDependency(*type, name));
    }
  }

  std::vector<usize> movable;
  movable.reserve(indices.size());
  for (usize index : indices) {
    const auto& child = source.children()[index];
    const ResourceDependency dependency(*resourceTypeOfElement(child), resourceNameOfElement(child));
    if (alreadyDefined.count(dependency) > 0) {
      RESOURCEMOVER_LOG_WARN("Not moving {} out of {}: {} already defines it",
                             resources::toString(dependency), fromFile.string(), toFile.string());
      continue;
    }
    movable.push_back(index);
  }
  indices = std::move(movable);

  if (indices.empty()) {
    return Result<usize>::ok(0);
  }

  usize detachedSoFar = 0;
  for (usize index : indices) {
    auto detached = source.detachElement(index - detachedSoFar);
    detachedSoFar += detached.size();
    destination.appendChildren(std::move(detached));
  }

  destination.trimStart(std::string(m_options.indentWidth, ' '));
  destination.appendChild(XmlNode::text("\n"));

  auto saved = saveDocument(toFile, destination);
  if (saved.isError()) {
    return Result<usize>::error(saved.error());
  }

  if (source.elementCount() == 0) {
    auto removed = resources::removeFile(fromFile);
    if (removed.isError()) {
      return Result<usize>::error(removed.error());
    }
    RESOURCEMOVER_LOG_DEBUG("Deleted emptied {}", fromFile.string());
  } else {
    saved = saveDocument(fromFile, source);
    if (saved.isError()) {
      return Result<usize>::error(saved.error());
    }
  }

  RESOURCEMOVER_LOG_DEBUG("Moved {} value(s) from {} to {}", indices.size(), fromFile.string(),
                          toFile.string());
  return Result<usize>::ok(indices.size());
}

Result<usize> ResourceEditor::applyRemove(const fs::path& file, const ResourceTypeSet& typesToRemove,
                                          const std::unordered_set<std::string>& namesToKeep,
                                          const std::optional<std::regex>& namesToIgnore) const {
  if (!resources::hasExtension(file, kXmlExtension)) {
    return removeStandalone(file, typesToRemove, namesToKeep, namesToIgnore);
  }

  auto loaded = loadDocument(file);
  if (loaded.isError()) {
    return Result<usize>::error(loaded.error());
  }
  XmlDocument& document = loaded.value();

  if (document.rootName() != kContainerRootName) {
    return removeStandalone(file, typesToRemove, namesToKeep, namesToIgnore);
  }

  std::vector<usize> indices;
  const auto& children = document.children();
  for (usize i = 0; i < children.size(); ++i) {
    const auto type = resourceTypeOfElement(children[i]);
    const std::string name = resourceNameOfElement(children[i]);
    if (!type.has_value() || name.empty() || typesToRemove.count(*type) == 0) {
      continue;
    }
    if (namesToKeep.count(name) > 0) {
      continue;
    }
    if (matchesIgnorePattern(namesToIgnore, *children[i].attribute("name"))) {
      continue;
    }
    indices.push_back(i);
  }

  if (indices.empty()) {
    return Result<usize>::ok(0);
  }

  usize detachedSoFar = 0;
  for (usize index : indices) {
    detachedSoFar += document.detachElement(index - detachedSoFar).size();
  }

  if (document.elementCount() == 0) {
    auto removed = resources::removeFile(file);
    if (removed.isError()) {
      return Result<usize>::error(removed.error());
    }
    RESOURCEMOVER_LOG_DEBUG("Deleted emptied {}", file.string());
  } else {
    auto saved = saveDocument(file, document);
    if (saved.isError()) {
      return Result<usize>::error(saved.error());
    }
  }

  RESOURCEMOVER_LOG_DEBUG("Removed {} value(s) from {}", indices.size(), file.string());
  return Result<usize>::ok(indices.size());
}

// ============================================================================
// Helpers
// ============================================================================

Result<usize> ResourceEditor::moveStandalone(const fs::path& fromFile, const fs::path& toFile,
                                             const ResourceDependencySet& toMove) const {
  const auto type = resources::resourceTypeOfFile(fromFile);
  if (!type.has_value() ||
      toMove.count(ResourceDependency(*type, resources::resourceNameOfFile(fromFile))) == 0) {
    return Result<usize>::ok(0);
  }

  std::error_code ec;
  if (fs::exists(toFile, ec) || ec) {
    RESOURCEMOVER_LOG_WARN("Not moving {}: {} already exists", fromFile.string(),
                           toFile.string());
    return Result<usize>::ok(0);
  }

  auto moved = resources::moveFile(fromFile, toFile);
  if (moved.isError()) {
    return Result<usize>::error(moved.error());
  }
  RESOURCEMOVER_LOG_DEBUG("Moved {} to {}", fromFile.string(), toFile.string());
  return Result<usize>::ok(1);
}

Result<usize> ResourceEditor::removeStandalone(const fs::path& file,
                                               const ResourceTypeSet& typesToRemove,
                                               const std::unordered_set<std::string>& namesToKeep,
                                               const std::optional<std::regex>& namesToIgnore) const {
  const auto type = resources::resourceTypeOfFile(file);
  const std::string name = resources::resourceNameOfFile(file);
  if (!type.has_value() || typesToRemove.count(*type) == 0 || namesToKeep.count(name) > 0 ||
      matchesIgnorePattern(namesToIgnore, name)) {
    return Result<usize>::ok(0);
  }

  auto removed = resources::removeFile(file);
  if (removed.isError()) {
    return Result<usize>::error(removed.error());
  }
  RESOURCEMOVER_LOG_DEBUG("Deleted {}", file.string());
  return Result<usize>::ok(1);
}

Result<XmlDocument> ResourceEditor::loadDocument(const fs::path& file) const {
  auto text = resources::readTextFile(file);
  if (text.isError()) {
    return Result<XmlDocument>::error(text.error());
  }
  auto parsed = XmlDocument::parse(protectEscapeSequences(text.value()));
  if (parsed.isError()) {
    return Result<XmlDocument>::error("Malformed XML in " + file.string() + ": " + parsed.error());
  }
  return parsed;
}

Result<void> ResourceEditor::saveDocument(const fs::path& file, const XmlDocument& document) const {
  return resources::writeTextFileAtomic(file, restoreEscapeSequences(document.serialize()));
}

} // namespace ResourceMover::editing
