#include "ResourceMover/app/resource_mover_app.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

using namespace ResourceMover;
using namespace ResourceMover::app;
namespace fs = std::filesystem;

// =============================================================================
// Test fixture helpers
// =============================================================================

static std::string createTempDir() {
  std::string tempPath =
      fs::temp_directory_path().string() + "/rm_app_test_" +
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

namespace {

struct AppRun {
  int status = -1;
  std::string out;
  std::string err;
};

AppRun runApp(const std::vector<std::string>& args) {
  std::vector<const char*> argv = {"resource_mover"};
  for (const auto& arg : args) {
    argv.push_back(arg.c_str());
  }

  std::ostringstream out;
  std::ostringstream err;
  ResourceMoverApp app(out, err);

  AppRun run;
  run.status = app.run(static_cast<int>(argv.size()), argv.data());
  run.out = out.str();
  run.err = err.str();
  return run;
}

} // namespace

TEST_CASE("Help and version exit successfully", "[resource_mover_app]") {
  auto help = runApp({"--help"});
  REQUIRE(help.status == kExitSuccess);
  REQUIRE(help.out.find("Usage: resource_mover") == 0);

  auto version = runApp({"--version"});
  REQUIRE(version.status == kExitSuccess);
  REQUIRE(version.out.find("resource_mover version ") == 0);
}

TEST_CASE("Configuration errors exit before touching files", "[resource_mover_app]") {
  std::string tempPath = createTempDir();
  const fs::path lib = fs::path(tempPath) / "lib";
  const fs::path feature = fs::path(tempPath) / "feature";
  createFile(lib / "src/main/res/drawable/ic_star.xml", "<vector/>\n");
  createFile(feature / "src/main/java/F.kt", "R.drawable.ic_star\n");

  SECTION("Unparseable command line") {
    auto run = runApp({"move", "--bogus"});
    REQUIRE(run.status == kExitConfigurationError);
    REQUIRE(run.err.find("Error: Unknown option: --bogus") == 0);
  }

  SECTION("Include and exclude together") {
    auto run = runApp({"move", "-s", lib.string(), "-o", feature.string(), "-i", "drawable",
                       "-e", "string", "--no-color"});
    REQUIRE(run.status == kExitConfigurationError);
    REQUIRE(run.err.find("Cannot specify both") != std::string::npos);
  }

  SECTION("No destination") {
    auto run = runApp({"move", "-s", lib.string(), "--no-color"});
    REQUIRE(run.status == kExitConfigurationError);
    REQUIRE(run.err.find("at least one output directory") != std::string::npos);
  }

  SECTION("Invalid skip pattern") {
    auto run = runApp({"remove", "-s", lib.string(), "--skip", "(", "--no-color"});
    REQUIRE(run.status == kExitConfigurationError);
    REQUIRE(run.err.find("Invalid skip pattern") != std::string::npos);
  }

  SECTION("The log file is not created for a rejected request") {
    const fs::path logFile = fs::path(tempPath) / "run.log";
    auto run = runApp({"move", "-s", lib.string(), "-o", feature.string(), "-i", "string", "-e",
                       "drawable", "--log-file", logFile.string(), "--no-color"});
    REQUIRE(run.status == kExitConfigurationError);
    REQUIRE_FALSE(fs::exists(logFile));
  }

  SECTION("Missing configuration file") {
    auto run = runApp({"move", "-s", lib.string(), "-o", feature.string(), "--config",
                       (fs::path(tempPath) / "absent.json").string()});
    REQUIRE(run.status == kExitConfigurationError);
    REQUIRE(run.err.find("Configuration file not found") != std::string::npos);
  }

  REQUIRE(fs::exists(lib / "src/main/res/drawable/ic_star.xml"));
  cleanupTempDir(tempPath);
}

TEST_CASE("Move and remove run end to end", "[resource_mover_app]") {
  std::string tempPath = createTempDir();
  const fs::path lib = fs::path(tempPath) / "lib";
  const fs::path feature = fs::path(tempPath) / "feature";

  SECTION("Move") {
    createFile(lib / "src/main/res/drawable/ic_star.xml", "<vector/>\n");
    createFile(feature / "src/main/java/F.kt", "R.drawable.ic_star\n");

    auto run = runApp({"move", "-s", lib.string(), "-o", feature.string(), "-i", "drawable",
                       "--no-color"});
    REQUIRE(run.status == kExitSuccess);
    REQUIRE(run.out.find("1 resource(s) moved over 2 rounds.") != std::string::npos);
    REQUIRE(fs::exists(feature / "src/main/res/drawable/ic_star.xml"));
    REQUIRE_FALSE(fs::exists(lib / "src/main/res/drawable/ic_star.xml"));
  }

  SECTION("Round limit from the configuration file, overridden on the command line") {
    createFile(lib / "src/main/res/layout/old.xml", "<ImageView android:src=\"@drawable/ic_old\"/>\n");
    createFile(lib / "src/main/res/drawable/ic_old.xml", "<vector/>\n");
    const fs::path config = fs::path(tempPath) / "mover.json";
    createFile(config, R"({ "max_rounds": 1, "use_colors": false })");

    auto limited = runApp({"remove", "-s", lib.string(), "--config", config.string()});
    REQUIRE(limited.status == kExitSuccess);
    REQUIRE(limited.out.find("Exceeded maximum removal rounds (1)") != std::string::npos);
    REQUIRE(fs::exists(lib / "src/main/res/drawable/ic_old.xml"));

    auto unlimited = runApp({"remove", "-s", lib.string(), "--config", config.string(),
                             "--max-rounds", "5"});
    REQUIRE(unlimited.status == kExitSuccess);
    REQUIRE_FALSE(fs::exists(lib / "src/main/res/drawable/ic_old.xml"));
  }

  SECTION("Malformed resources are run errors") {
    createFile(lib / "src/main/res/values/strings.xml", "<resources><string name=\"a\">");
    createFile(feature / "src/main/java/F.kt", "R.string.a\n");

    auto run = runApp({"move", "-s", lib.string(), "-o", feature.string(), "--no-color"});
    REQUIRE(run.status == kExitRunError);
    REQUIRE(run.err.find("Malformed XML") != std::string::npos);
  }

  cleanupTempDir(tempPath);
}
