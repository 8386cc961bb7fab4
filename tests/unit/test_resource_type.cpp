#include "ResourceMover/resources/resource_files.hpp"
#include "ResourceMover/resources/resource_type.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace ResourceMover;
using namespace ResourceMover::resources;

// =============================================================================
// Raw name classification
// =============================================================================

TEST_CASE("Raw names classify every resource type", "[resource_type]") {
  SECTION("Known raw names") {
    REQUIRE(resourceTypeFromRawName("drawable") == ResourceType::Drawable);
    REQUIRE(resourceTypeFromRawName("anim") == ResourceType::Animation);
    REQUIRE(resourceTypeFromRawName("attr") == ResourceType::Attribute);
    REQUIRE(resourceTypeFromRawName("dimen") == ResourceType::Dimension);
    REQUIRE(resourceTypeFromRawName("bool") == ResourceType::Boolean);
    REQUIRE(resourceTypeFromRawName("styleable") == ResourceType::Styleable);
  }

  SECTION("Unknown raw names yield nothing") {
    REQUIRE_FALSE(resourceTypeFromRawName("values").has_value());
    REQUIRE_FALSE(resourceTypeFromRawName("Drawable").has_value());
    REQUIRE_FALSE(resourceTypeFromRawName("").has_value());
  }

  SECTION("Raw names round-trip for all types") {
    REQUIRE(allResourceTypes().size() == 24);
    for (ResourceType type : allResourceTypes()) {
      REQUIRE(resourceTypeFromRawName(resourceTypeToRawName(type)) == type);
    }
  }

  SECTION("Description lists every raw name") {
    const std::string description = describeResourceTypes();
    REQUIRE(description.find("anim, animator, array") == 0);
    REQUIRE(description.find("xml") != std::string::npos);
  }
}

TEST_CASE("Directory names classify by their leading segment", "[resource_type]") {
  REQUIRE(resourceTypeFromDirectoryName("drawable") == ResourceType::Drawable);
  REQUIRE(resourceTypeFromDirectoryName("drawable-night-hdpi") == ResourceType::Drawable);
  REQUIRE(resourceTypeFromDirectoryName("mipmap-xxhdpi") == ResourceType::Mipmap);
  REQUIRE(resourceTypeFromDirectoryName("layout-land") == ResourceType::Layout);
  REQUIRE_FALSE(resourceTypeFromDirectoryName("values").has_value());
  REQUIRE_FALSE(resourceTypeFromDirectoryName("values-fr").has_value());
}

TEST_CASE("Element tags classify container units", "[resource_type]") {
  REQUIRE(resourceTypeFromElementTag("string", "") == ResourceType::String);
  REQUIRE(resourceTypeFromElementTag("color", "") == ResourceType::Color);
  REQUIRE(resourceTypeFromElementTag("style", "") == ResourceType::Style);
  REQUIRE(resourceTypeFromElementTag("string-array", "") == ResourceType::Array);
  REQUIRE(resourceTypeFromElementTag("integer-array", "") == ResourceType::Array);
  REQUIRE(resourceTypeFromElementTag("declare-styleable", "") == ResourceType::Styleable);
  REQUIRE(resourceTypeFromElementTag("item", "id") == ResourceType::Id);
  REQUIRE(resourceTypeFromElementTag("item", "dimen") == ResourceType::Dimension);
  REQUIRE_FALSE(resourceTypeFromElementTag("item", "").has_value());
  REQUIRE_FALSE(resourceTypeFromElementTag("eat-comment", "").has_value());
}

// =============================================================================
// Standalone resource files
// =============================================================================

TEST_CASE("Standalone files are named by their filename", "[resource_type][resource_files]") {
  SECTION("Name stops at the first dot") {
    REQUIRE(resourceNameOfFile("res/drawable/ic_star.xml") == "ic_star");
    REQUIRE(resourceNameOfFile("res/drawable-hdpi/btn.9.png") == "btn");
    REQUIRE(resourceNameOfFile("res/raw/intro") == "intro");
  }

  SECTION("Type comes from the parent directory") {
    REQUIRE(resourceTypeOfFile("res/drawable-hdpi/btn.9.png") == ResourceType::Drawable);
    REQUIRE(resourceTypeOfFile("res/layout/activity_main.xml") == ResourceType::Layout);
    REQUIRE_FALSE(resourceTypeOfFile("res/values/strings.xml").has_value());
  }

  SECTION("Extensions match case-insensitively") {
    const std::vector<std::string> extensions = {"xml", "png"};
    REQUIRE(hasExtension("a/b/icon.PNG", extensions));
    REQUIRE(hasExtension("a/b/strings.xml", extensions));
    REQUIRE_FALSE(hasExtension("a/b/notes.txt", extensions));
    REQUIRE_FALSE(hasExtension("a/b/Makefile", extensions));
  }
}
