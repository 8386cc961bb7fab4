#include "ResourceMover/editing/resource_editor.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

using namespace ResourceMover;
using namespace ResourceMover::editing;
using namespace ResourceMover::resources;
namespace fs = std::filesystem;

// =============================================================================
// Test fixture helpers
// =============================================================================

static std::string createTempDir() {
  std::string tempPath =
      fs::temp_directory_path().string() + "/rm_editor_test_" +
      std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
  fs::create_directories(tempPath);
  return tempPath;
}

static void cleanupTempDir(const std::string& path) {
  if (fs::exists(path)) {
    fs::remove_all(path);
  }
}

static void createFile(const fs::path& path, const std::string& content) {
  fs::create_directories(path.parent_path());
  std::ofstream file(path, std::ios::binary);
  file << content;
  file.close();
}

static std::string readFile(const fs::path& path) {
  std::ifstream file(path, std::ios::binary);
  std::stringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

static const std::string kStrings = "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
                                    "<resources>\n"
                                    "    <string name=\"a\">Don&apos;t</string>\n"
                                    "    <!-- About b -->\n"
                                    "    <string name=\"b\">B&#8230;</string>\n"
                                    "    <dimen name=\"b\">4dp</dimen>\n"
                                    "    <string name=\"c\">C</string>\n"
                                    "</resources>\n";

// =============================================================================
// Moving units of container documents
// =============================================================================

TEST_CASE("applyMove moves container units with their comment", "[resource_editor][move]") {
  std::string tempPath = createTempDir();
  const fs::path from = fs::path(tempPath) / "lib/src/main/res/values/strings.xml";
  const fs::path to = fs::path(tempPath) / "feature/src/main/res/values/strings.xml";
  createFile(from, kStrings);

  ResourceEditor editor;

  SECTION("Into a new destination file") {
    auto moved = editor.applyMove(from, to, {{ResourceType::String, "b"}});
    REQUIRE(moved.isOk());
    REQUIRE(moved.value() == 1);

    REQUIRE(readFile(to) == "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
                            "<resources xmlns:tools=\"http://schemas.android.com/tools\">\n"
                            "    <!-- About b -->\n"
                            "    <string name=\"b\">B&#8230;</string>\n"
                            "</resources>\n");

    // The dimen shares the name but not the type
    REQUIRE(readFile(from) == "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
                              "<resources>\n"
                              "    <string name=\"a\">Don&apos;t</string>\n"
                              "    <dimen name=\"b\">4dp</dimen>\n"
                              "    <string name=\"c\">C</string>\n"
                              "</resources>\n");
  }

  SECTION("Several units of one file") {
    auto moved = editor.applyMove(from, to,
                                  {{ResourceType::String, "a"},
                                   {ResourceType::String, "c"},
                                   {ResourceType::Dimension, "b"}});
    REQUIRE(moved.isOk());
    REQUIRE(moved.value() == 3);

    const std::string destination = readFile(to);
    const auto posA = destination.find("<string name=\"a\">Don&apos;t</string>");
    const auto posDimen = destination.find("<dimen name=\"b\">4dp</dimen>");
    const auto posC = destination.find("<string name=\"c\">C</string>");
    REQUIRE(posA != std::string::npos);
    REQUIRE(posDimen != std::string::npos);
    REQUIRE(posC != std::string::npos);
    REQUIRE(posA < posDimen);
    REQUIRE(posDimen < posC);

    REQUIRE(readFile(from) == "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
                              "<resources>\n"
                              "    <!-- About b -->\n"
                              "    <string name=\"b\">B&#8230;</string>\n"
                              "</resources>\n");
  }

  SECTION("Into an existing destination file") {
    createFile(to, "<resources>\n    <color name=\"accent\">#f00</color>\n</resources>\n");

    auto moved = editor.applyMove(from, to, {{ResourceType::String, "c"}});
    REQUIRE(moved.isOk());
    REQUIRE(moved.value() == 1);

    const std::string destination = readFile(to);
    REQUIRE(destination.find("<resources>\n    <color name=\"accent\">#f00</color>\n") == 0);
    REQUIRE(destination.find("\n    <string name=\"c\">C</string>\n</resources>\n") !=
            std::string::npos);
  }

  SECTION("Values the destination already defines stay in the source") {
    createFile(to, "<resources>\n    <string name=\"c\">Mine</string>\n</resources>\n");

    auto moved =
        editor.applyMove(from, to, {{ResourceType::String, "a"}, {ResourceType::String, "c"}});
    REQUIRE(moved.isOk());
    REQUIRE(moved.value() == 1);

    const std::string destination = readFile(to);
    REQUIRE(destination.find("<string name=\"c\">Mine</string>") != std::string::npos);
    REQUIRE(destination.find("<string name=\"c\">C</string>") == std::string::npos);
    REQUIRE(destination.find("<string name=\"a\">Don&apos;t</string>") != std::string::npos);

    REQUIRE(readFile(from) == "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
                              "<resources>\n"
                              "    <!-- About b -->\n"
                              "    <string name=\"b\">B&#8230;</string>\n"
                              "    <dimen name=\"b\">4dp</dimen>\n"
                              "    <string name=\"c\">C</string>\n"
                              "</resources>\n");

    SECTION("Nothing is written when every value is already defined") {
      auto again = editor.applyMove(from, to, {{ResourceType::String, "c"}});
      REQUIRE(again.isOk());
      REQUIRE(again.value() == 0);
      REQUIRE(readFile(to) == destination);
    }
  }

  SECTION("Emptied source files are deleted") {
    auto moved = editor.applyMove(from, to,
                                  {{ResourceType::String, "a"},
                                   {ResourceType::String, "b"},
                                   {ResourceType::String, "c"},
                                   {ResourceType::Dimension, "b"}});
    REQUIRE(moved.isOk());
    REQUIRE(moved.value() == 4);
    REQUIRE_FALSE(fs::exists(from));
    REQUIRE(fs::exists(to));
  }

  SECTION("Nothing to move leaves both sides untouched") {
    auto moved = editor.applyMove(from, to, {{ResourceType::String, "zzz"}});
    REQUIRE(moved.isOk());
    REQUIRE(moved.value() == 0);
    REQUIRE(readFile(from) == kStrings);
    REQUIRE_FALSE(fs::exists(to));
  }

  SECTION("A malformed destination aborts without touching the source") {
    createFile(to, "<resources><string name=\"x\">X</resources>");

    auto moved = editor.applyMove(from, to, {{ResourceType::String, "b"}});
    REQUIRE(moved.isError());
    REQUIRE(moved.error().find("Malformed XML") != std::string::npos);
    REQUIRE(moved.error().find(to.string()) != std::string::npos);
    REQUIRE(readFile(from) == kStrings);
    REQUIRE(readFile(to) == "<resources><string name=\"x\">X</resources>");
  }

  cleanupTempDir(tempPath);
}

TEST_CASE("applyMove matches dotted names after normalization", "[resource_editor][move]") {
  std::string tempPath = createTempDir();
  const fs::path from = fs::path(tempPath) / "lib/src/main/res/values/styles.xml";
  const fs::path to = fs::path(tempPath) / "feature/src/main/res/values/styles.xml";
  createFile(from, "<resources>\n"
                   "    <style name=\"Widget.Button\" parent=\"Base\">\n"
                   "        <item name=\"android:textSize\">14sp</item>\n"
                   "    </style>\n"
                   "    <style name=\"Base\" />\n"
                   "</resources>\n");

  ResourceEditor editor;
  auto moved = editor.applyMove(from, to, {{ResourceType::Style, "Widget_Button"}});
  REQUIRE(moved.isOk());
  REQUIRE(moved.value() == 1);
  REQUIRE(readFile(to).find("<style name=\"Widget.Button\" parent=\"Base\">\n"
                            "        <item name=\"android:textSize\">14sp</item>\n"
                            "    </style>") != std::string::npos);
  REQUIRE(readFile(from) == "<resources>\n"
                            "    <style name=\"Base\" />\n"
                            "</resources>\n");

  cleanupTempDir(tempPath);
}

// =============================================================================
// Moving standalone resources
// =============================================================================

TEST_CASE("applyMove moves standalone resources whole", "[resource_editor][move]") {
  std::string tempPath = createTempDir();
  const fs::path root(tempPath);
  const fs::path vector = root / "lib/src/main/res/drawable/ic_star.xml";
  const fs::path bitmap = root / "lib/src/main/res/drawable-hdpi/btn.9.png";
  createFile(vector, "<vector android:tint=\"@color/star\"/>\n");
  createFile(bitmap, "\x89PNG binary");

  ResourceEditor editor;
  const ResourceDependencySet toMove = {{ResourceType::Drawable, "ic_star"},
                                        {ResourceType::Drawable, "btn"}};

  SECTION("Files are relocated") {
    const fs::path vectorTo = root / "feature/src/main/res/drawable/ic_star.xml";
    const fs::path bitmapTo = root / "feature/src/main/res/drawable-hdpi/btn.9.png";

    auto moved = editor.applyMove(vector, vectorTo, toMove);
    REQUIRE(moved.isOk());
    REQUIRE(moved.value() == 1);
    REQUIRE(readFile(vectorTo) == "<vector android:tint=\"@color/star\"/>\n");
    REQUIRE_FALSE(fs::exists(vector));

    moved = editor.applyMove(bitmap, bitmapTo, toMove);
    REQUIRE(moved.isOk());
    REQUIRE(moved.value() == 1);
    REQUIRE(readFile(bitmapTo) == "\x89PNG binary");
  }

  SECTION("Unreferenced files stay") {
    const fs::path vectorTo = root / "feature/src/main/res/drawable/ic_star.xml";
    auto moved = editor.applyMove(vector, vectorTo, {{ResourceType::Layout, "ic_star"}});
    REQUIRE(moved.isOk());
    REQUIRE(moved.value() == 0);
    REQUIRE(fs::exists(vector));
  }

  SECTION("An existing destination file is never overwritten") {
    const fs::path vectorTo = root / "feature/src/main/res/drawable/ic_star.xml";
    createFile(vectorTo, "<vector/>\n");

    auto moved = editor.applyMove(vector, vectorTo, toMove);
    REQUIRE(moved.isOk());
    REQUIRE(moved.value() == 0);
    REQUIRE(fs::exists(vector));
    REQUIRE(readFile(vectorTo) == "<vector/>\n");
  }

  cleanupTempDir(tempPath);
}

TEST_CASE("moveResources mirrors the relative layout of the module", "[resource_editor][move]") {
  std::string tempPath = createTempDir();
  const fs::path lib = fs::path(tempPath) / "lib";
  const fs::path feature = fs::path(tempPath) / "feature";
  createFile(lib / "src/main/res/values/strings.xml",
             "<resources>\n    <string name=\"title\">Title</string>\n</resources>\n");
  createFile(lib / "src/main/res/values-fr/strings.xml",
             "<resources>\n    <string name=\"title\">Titre</string>\n</resources>\n");
  createFile(lib / "src/main/res/drawable/ic_star.xml", "<vector/>\n");

  ResourceEditor editor;
  auto moved = editor.moveResources(lib, feature,
                                    {{ResourceType::String, "title"},
                                     {ResourceType::Drawable, "ic_star"}});
  REQUIRE(moved.isOk());
  REQUIRE(moved.value() == 3);
  REQUIRE(fs::exists(feature / "src/main/res/values/strings.xml"));
  REQUIRE(readFile(feature / "src/main/res/values-fr/strings.xml").find("Titre") !=
          std::string::npos);
  REQUIRE(fs::exists(feature / "src/main/res/drawable/ic_star.xml"));
  REQUIRE_FALSE(fs::exists(lib / "src/main/res/values/strings.xml"));
  REQUIRE_FALSE(fs::exists(lib / "src/main/res/values-fr/strings.xml"));

  cleanupTempDir(tempPath);
}

// =============================================================================
// Removing
// =============================================================================

TEST_CASE("applyRemove deletes unkept units", "[resource_editor][remove]") {
  std::string tempPath = createTempDir();
  const fs::path file = fs::path(tempPath) / "lib/src/main/res/values/strings.xml";
  createFile(file, kStrings);

  ResourceEditor editor;

  SECTION("Only selected types are removed") {
    auto removed = editor.applyRemove(file, {ResourceType::String}, {"a"}, std::nullopt);
    REQUIRE(removed.isOk());
    REQUIRE(removed.value() == 2);
    REQUIRE(readFile(file) == "<?xml version=\"1.0\" encoding=\"utf-8\"?>\n"
                              "<resources>\n"
                              "    <string name=\"a\">Don&apos;t</string>\n"
                              "    <dimen name=\"b\">4dp</dimen>\n"
                              "</resources>\n");
  }

  SECTION("Kept names protect every type sharing the name") {
    auto removed = editor.applyRemove(file, {ResourceType::String, ResourceType::Dimension},
                                      {"b"}, std::nullopt);
    REQUIRE(removed.isOk());
    REQUIRE(removed.value() == 2);
    const std::string content = readFile(file);
    REQUIRE(content.find("name=\"a\"") == std::string::npos);
    REQUIRE(content.find("<string name=\"b\">") != std::string::npos);
    REQUIRE(content.find("<dimen name=\"b\">") != std::string::npos);
  }

  SECTION("Ignored names are skipped") {
    auto removed =
        editor.applyRemove(file, {ResourceType::String}, {}, std::regex("^[ab]$"));
    REQUIRE(removed.isOk());
    REQUIRE(removed.value() == 1);
    REQUIRE(readFile(file).find("name=\"c\"") == std::string::npos);
  }

  SECTION("Emptied documents are deleted") {
    auto removed = editor.applyRemove(file, {ResourceType::String, ResourceType::Dimension}, {},
                                      std::nullopt);
    REQUIRE(removed.isOk());
    REQUIRE(removed.value() == 4);
    REQUIRE_FALSE(fs::exists(file));
  }

  SECTION("Nothing to remove leaves the file untouched") {
    auto removed = editor.applyRemove(file, {ResourceType::Color}, {}, std::nullopt);
    REQUIRE(removed.isOk());
    REQUIRE(removed.value() == 0);
    REQUIRE(readFile(file) == kStrings);
  }

  cleanupTempDir(tempPath);
}

TEST_CASE("removeResources deletes unreferenced standalone files", "[resource_editor][remove]") {
  std::string tempPath = createTempDir();
  const fs::path module = fs::path(tempPath) / "lib";
  createFile(module / "src/main/res/drawable/ic_used.xml", "<vector/>\n");
  createFile(module / "src/main/res/drawable/ic_unused.xml", "<vector/>\n");
  createFile(module / "src/main/res/drawable/keep_me.png", "png");
  createFile(module / "src/main/res/layout/screen.xml", "<LinearLayout/>\n");
  createFile(module / "src/main/res/values/broken.txt", "not a resource");

  ResourceEditor editor;
  auto removed = editor.removeResources(module, {ResourceType::Drawable}, {"ic_used"},
                                        std::regex("^keep_"));
  REQUIRE(removed.isOk());
  REQUIRE(removed.value() == 1);
  REQUIRE(fs::exists(module / "src/main/res/drawable/ic_used.xml"));
  REQUIRE_FALSE(fs::exists(module / "src/main/res/drawable/ic_unused.xml"));
  REQUIRE(fs::exists(module / "src/main/res/drawable/keep_me.png"));
  REQUIRE(fs::exists(module / "src/main/res/layout/screen.xml"));
  REQUIRE(fs::exists(module / "src/main/res/values/broken.txt"));

  cleanupTempDir(tempPath);
}

TEST_CASE("Malformed source documents are reported", "[resource_editor]") {
  std::string tempPath = createTempDir();
  const fs::path file = fs::path(tempPath) / "lib/src/main/res/values/strings.xml";
  createFile(file, "<resources>\n  <string name=\"a\">A & B</string>\n</resources>\n");

  ResourceEditor editor;
  auto removed = editor.applyRemove(file, {ResourceType::String}, {}, std::nullopt);
  REQUIRE(removed.isError());
  REQUIRE(removed.error().find("Malformed XML in " + file.string()) == 0);
  REQUIRE(removed.error().find("line 2") != std::string::npos);
  REQUIRE(fs::exists(file));

  cleanupTempDir(tempPath);
}
