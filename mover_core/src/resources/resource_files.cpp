#include "ResourceMover/resources/resource_files.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace ResourceMover::resources {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

} // namespace

Result<std::vector<fs::path>> listFilesRecursively(const fs::path& directory) {
  std::vector<fs::path> files;

  std::error_code ec;
  if (!fs::is_directory(directory, ec)) {
    return Result<std::vector<fs::path>>::ok(std::move(files));
  }

  fs::recursive_directory_iterator it(directory, ec);
  if (ec) {
    return Result<std::vector<fs::path>>::error("Failed to list directory " + directory.string() +
                                                ": " + ec.message());
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      return Result<std::vector<fs::path>>::error("Failed to list directory " +
                                                  directory.string() + ": " + ec.message());
    }
    if (it->is_regular_file(ec)) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    return Result<std::vector<fs::path>>::error("Failed to list directory " + directory.string() +
                                                ": " + ec.message());
  }

  std::sort(files.begin(), files.end());
  return Result<std::vector<fs::path>>::ok(std::move(files));
}

Result<std::vector<fs::path>> listResourceFiles(const fs::path& moduleRoot,
                                                const std::vector<std::string>& extensions) {
  auto listed = listFilesRecursively(moduleRoot / kResourceDirectory);
  if (listed.isError()) {
    return listed;
  }

  std::vector<fs::path> files;
  for (auto& path : listed.value()) {
    if (hasExtension(path, extensions)) {
      files.push_back(std::move(path));
    }
  }
  return Result<std::vector<fs::path>>::ok(std::move(files));
}

bool hasExtension(const fs::path& path, const std::vector<std::string>& extensions) {
  std::string ext = path.extension().string();
  if (ext.empty()) {
    return false;
  }
  ext = toLower(ext.substr(1));
  return std::any_of(extensions.begin(), extensions.end(),
                     [&ext](const std::string& candidate) { return toLower(candidate) == ext; });
}

std::string resourceNameOfFile(const fs::path& path) {
  std::string filename = path.filename().string();
  return filename.substr(0, filename.find('.'));
}

std::optional<ResourceType> resourceTypeOfFile(const fs::path& path) {
  return resourceTypeFromDirectoryName(path.parent_path().filename().string());
}

Result<std::string> readTextFile(const fs::path& path) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return Result<std::string>::error("Failed to open file: " + path.string());
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return Result<std::string>::error("Failed to read file: " + path.string());
  }
  return Result<std::string>::ok(buffer.str());
}

Result<void> writeTextFileAtomic(const fs::path& path, const std::string& content) {
  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return Result<void>::error("Failed to create directory " + path.parent_path().string() +
                                 ": " + ec.message());
    }
  }

  fs::path tempPath = path;
  tempPath += ".tmp";

  {
    std::ofstream file(tempPath, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return Result<void>::error("Failed to open file for writing: " + tempPath.string());
    }
    file << content;
    file.flush();
    if (!file.good()) {
      file.close();
      fs::remove(tempPath, ec);
      return Result<void>::error("Failed to write file: " + tempPath.string());
    }
  }

  fs::rename(tempPath, path, ec);
  if (ec) {
    std::error_code cleanupEc;
    fs::remove(tempPath, cleanupEc);
    return Result<void>::error("Failed to replace " + path.string() + ": " + ec.message());
  }
  return Result<void>::ok();
}

Result<void> moveFile(const fs::path& from, const fs::path& to) {
  std::error_code ec;
  if (to.has_parent_path()) {
    fs::create_directories(to.parent_path(), ec);
    if (ec) {
      return Result<void>::error("Failed to create directory " + to.parent_path().string() + ": " +
                                 ec.message());
    }
  }

  fs::rename(from, to, ec);
  if (!ec) {
    return Result<void>::ok();
  }

  // rename fails across filesystems; fall back to copy and delete
  ec.clear();
  fs::copy_file(from, to, fs::copy_options::none, ec);
  if (ec) {
    return Result<void>::error("Failed to copy " + from.string() + " to " + to.string() + ": " +
                               ec.message());
  }
  return removeFile(from);
}

Result<void> removeFile(const fs::path& path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    return Result<void>::error("Failed to delete " + path.string() + ": " + ec.message());
  }
  return Result<void>::ok();
}

} // namespace ResourceMover::resources
