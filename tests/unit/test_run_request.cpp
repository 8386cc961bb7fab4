#include "ResourceMover/runner/run_request.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace ResourceMover;
using namespace ResourceMover::runner;
using resources::ResourceType;

TEST_CASE("Type filter derivation", "[run_request]") {
  SECTION("Include list is used directly") {
    auto types = deriveTypeFilter({ResourceType::Drawable, ResourceType::String}, {});
    REQUIRE(types.isOk());
    REQUIRE(types.value() ==
            resources::ResourceTypeSet{ResourceType::Drawable, ResourceType::String});
  }

  SECTION("Exclude list is subtracted from all types") {
    auto types = deriveTypeFilter({}, {ResourceType::Id, ResourceType::Styleable});
    REQUIRE(types.isOk());
    REQUIRE(types.value().size() == resources::allResourceTypes().size() - 2);
    REQUIRE(types.value().count(ResourceType::Id) == 0);
    REQUIRE(types.value().count(ResourceType::Drawable) == 1);
  }

  SECTION("Neither list selects everything") {
    auto types = deriveTypeFilter({}, {});
    REQUIRE(types.isOk());
    REQUIRE(types.value().size() == resources::allResourceTypes().size());
  }

  SECTION("Both lists are rejected") {
    auto types = deriveTypeFilter({ResourceType::Drawable}, {ResourceType::String});
    REQUIRE(types.isError());
    REQUIRE(types.error() == "Cannot specify both resources to include and resources to exclude");
  }
}

TEST_CASE("Move requests are validated", "[run_request]") {
  MoveRequest request;
  request.source = "lib";
  request.destinations = {"feature"};
  request.types = {ResourceType::Drawable};

  REQUIRE(validateMoveRequest(request).isOk());

  SECTION("At least one destination") {
    request.destinations.clear();
    auto result = validateMoveRequest(request);
    REQUIRE(result.isError());
    REQUIRE(result.error() == "You must specify at least one output directory");
  }

  SECTION("A non-empty type filter") {
    request.types.clear();
    REQUIRE(validateMoveRequest(request).isError());
  }

  SECTION("At least one round") {
    request.maxRounds = 0;
    REQUIRE(validateMoveRequest(request).isError());
  }
}

TEST_CASE("Remove requests are validated", "[run_request]") {
  RemoveRequest request;
  request.target = "lib";
  request.types = {ResourceType::String};
  REQUIRE(request.maxRounds == kDefaultMaxRounds);
  REQUIRE(validateRemoveRequest(request).isOk());

  SECTION("A valid skip pattern") {
    request.ignorePattern = "^keep_";
    REQUIRE(validateRemoveRequest(request).isOk());
  }

  SECTION("An invalid skip pattern") {
    request.ignorePattern = "([unclosed";
    auto result = validateRemoveRequest(request);
    REQUIRE(result.isError());
    REQUIRE(result.error().find("Invalid skip pattern") == 0);
  }

  SECTION("A target module") {
    request.target.clear();
    REQUIRE(validateRemoveRequest(request).isError());
  }
}
