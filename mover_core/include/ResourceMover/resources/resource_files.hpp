#pragma once

/**
 * @file resource_files.hpp
 * @brief Module directory conventions and file helpers
 *
 * A module keeps its resource definitions in src/main/res/<type>[-qualifiers]/
 * and references them from anywhere under src/.
 */

#include "ResourceMover/core/result.hpp"
#include "ResourceMover/resources/resource_type.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ResourceMover::resources {

namespace fs = std::filesystem;

inline constexpr const char* kSourceDirectory = "src";
inline constexpr const char* kResourceDirectory = "src/main/res";

/**
 * @brief List every regular file below @p directory, sorted
 *
 * A directory that does not exist yields an empty list.
 */
[[nodiscard]] Result<std::vector<fs::path>> listFilesRecursively(const fs::path& directory);

/**
 * @brief List the resource files of a module filtered by extension
 * @param moduleRoot Module directory (the one containing src/)
 * @param extensions Extensions without the dot, compared case-insensitively
 */
[[nodiscard]] Result<std::vector<fs::path>>
listResourceFiles(const fs::path& moduleRoot, const std::vector<std::string>& extensions);

[[nodiscard]] bool hasExtension(const fs::path& path, const std::vector<std::string>& extensions);

/**
 * @brief Resource name of a standalone file: the filename up to its first '.'
 *
 * "ic_star.xml" is "ic_star" and the nine-patch "btn.9.png" is "btn".
 */
[[nodiscard]] std::string resourceNameOfFile(const fs::path& path);

/**
 * @brief Type of a standalone file, from its parent directory name
 *
 * src/main/res/anim-v21/slide_in.xml is an Animation.
 */
[[nodiscard]] std::optional<ResourceType> resourceTypeOfFile(const fs::path& path);

[[nodiscard]] Result<std::string> readTextFile(const fs::path& path);

/**
 * @brief Write a file through a temporary sibling and a rename
 *
 * Either the full new content lands at @p path or the previous file is
 * left untouched. Parent directories are created as needed.
 */
[[nodiscard]] Result<void> writeTextFileAtomic(const fs::path& path, const std::string& content);

/**
 * @brief Relocate a file, creating parent directories of @p to
 */
[[nodiscard]] Result<void> moveFile(const fs::path& from, const fs::path& to);

[[nodiscard]] Result<void> removeFile(const fs::path& path);

} // namespace ResourceMover::resources
