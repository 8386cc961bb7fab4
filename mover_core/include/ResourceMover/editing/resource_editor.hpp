#pragma once

/**
 * @file resource_editor.hpp
 * @brief Physical relocation and deletion of resource definitions
 *
 * Works on two kinds of files:
 * - standalone resources (one file is one resource: drawables, layouts,
 *   any XML whose root is not <resources>), moved or deleted whole
 * - container documents (<resources> files under values*), edited one
 *   child unit at a time with their attached comment and indentation
 *
 * A file is either rewritten in full, deleted, or left byte-for-byte
 * untouched.
 */

#include "ResourceMover/core/result.hpp"
#include "ResourceMover/editing/xml_document.hpp"
#include "ResourceMover/resources/resource_dependency.hpp"
#include <filesystem>
#include <optional>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

namespace ResourceMover::editing {

namespace fs = std::filesystem;

inline constexpr const char* kContainerRootName = "resources";

/**
 * @brief Type of a child unit of a container document, nullopt if unknown
 */
[[nodiscard]] std::optional<resources::ResourceType> resourceTypeOfElement(const XmlNode& node);

/**
 * @brief Normalized name of a child unit ("" when it has no name attribute)
 */
[[nodiscard]] std::string resourceNameOfElement(const XmlNode& node);

struct ResourceEditorOptions {
  std::vector<std::string> resourceExtensions = {"xml", "png", "webp", "jpg", "jpeg", "gif"};
  u32 indentWidth = 4;
};

class ResourceEditor {
public:
  ResourceEditor();
  explicit ResourceEditor(ResourceEditorOptions options);

  /**
   * @brief Move every definition in @p dependencies from one module to another
   *
   * Each resource file of @p fromModule is mapped to the same relative path
   * under @p toModule.
   *
   * @return Number of resources moved
   */
  [[nodiscard]] Result<usize> moveResources(const fs::path& fromModule, const fs::path& toModule,
                                            const resources::ResourceDependencySet& dependencies) const;

  /**
   * @brief Delete every definition of a type in @p typesToRemove whose name
   * is not in @p namesToKeep and does not match @p namesToIgnore
   *
   * @return Number of resources removed
   */
  [[nodiscard]] Result<usize>
  removeResources(const fs::path& module, const resources::ResourceTypeSet& typesToRemove,
                  const std::unordered_set<std::string>& namesToKeep,
                  const std::optional<std::regex>& namesToIgnore) const;

  /**
   * @brief Move the matching definitions of one file into @p toFile
   *
   * A standalone resource is moved whole unless @p toFile already exists.
   * Units of a container document are appended to @p toFile, which is
   * created from an empty <resources> document when missing.
   */
  [[nodiscard]] Result<usize> applyMove(const fs::path& fromFile, const fs::path& toFile,
                                        const resources::ResourceDependencySet& toMove) const;

  [[nodiscard]] Result<usize> applyRemove(const fs::path& file,
                                          const resources::ResourceTypeSet& typesToRemove,
                                          const std::unordered_set<std::string>& namesToKeep,
                                          const std::optional<std::regex>& namesToIgnore) const;

private:
  [[nodiscard]] Result<XmlDocument> loadDocument(const fs::path& file) const;
  [[nodiscard]] Result<void> saveDocument(const fs::path& file,
                                          const XmlDocument& document) const;

  [[nodiscard]] Result<usize> moveStandalone(const fs::path& fromFile, const fs::path& toFile,
                                             const resources::ResourceDependencySet& toMove) const;
  [[nodiscard]] Result<usize>
  removeStandalone(const fs::path& file, const resources::ResourceTypeSet& typesToRemove,
                   const std::unordered_set<std::string>& namesToKeep,
                   const std::optional<std::regex>& namesToIgnore) const;

  ResourceEditorOptions m_options;
};

} // namespace ResourceMover::editing
