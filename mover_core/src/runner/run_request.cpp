#include "ResourceMover/runner/run_request.hpp"

#include <regex>

namespace ResourceMover::runner {

using resources::ResourceType;
using resources::ResourceTypeSet;

Result<ResourceTypeSet> deriveTypeFilter(const std::vector<ResourceType>& include,
                                         const std::vector<ResourceType>& exclude) {
  if (!include.empty() && !exclude.empty()) {
    return Result<ResourceTypeSet>::error(
        "Cannot specify both resources to include and resources to exclude");
  }

  if (!include.empty()) {
    return Result<ResourceTypeSet>::ok(ResourceTypeSet(include.begin(), include.end()));
  }

  ResourceTypeSet types(resources::allResourceTypes().begin(),
                        resources::allResourceTypes().end());
  for (ResourceType type : exclude) {
    types.erase(type);
  }
  return Result<ResourceTypeSet>::ok(std::move(types));
}

namespace {

Result<void> validateCommon(const fs::path& module, const ResourceTypeSet& types, u32 maxRounds) {
  if (module.empty()) {
    return Result<void>::error("A source directory is required");
  }
  if (types.empty()) {
    return Result<void>::error("No resource types selected");
  }
  if (maxRounds < 1) {
    return Result<void>::error("The maximum number of rounds must be at least 1");
  }
  return Result<void>::ok();
}

} // namespace

Result<void> validateMoveRequest(const MoveRequest& request) {
  if (request.destinations.empty()) {
    return Result<void>::error("You must specify at least one output directory");
  }
  return validateCommon(request.source, request.types, request.maxRounds);
}

Result<void> validateRemoveRequest(const RemoveRequest& request) {
  auto common = validateCommon(request.target, request.types, request.maxRounds);
  if (common.isError()) {
    return common;
  }
  if (request.ignorePattern.has_value()) {
    try {
      std::regex pattern(*request.ignorePattern);
    } catch (const std::regex_error& e) {
      return Result<void>::error("Invalid skip pattern '" + *request.ignorePattern +
                                 "': " + e.what());
    }
  }
  return Result<void>::ok();
}

} // namespace ResourceMover::runner
