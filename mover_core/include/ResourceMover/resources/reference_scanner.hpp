#pragma once

/**
 * @file reference_scanner.hpp
 * @brief Collects the resources a module references from its sources
 *
 * Every line of every eligible file under <module>/src is run through an
 * ordered table of extraction rules. A rule is a regular expression plus a
 * function turning one match into a dependency; supporting a new reference
 * syntax means adding a rule.
 *
 * Default rules:
 * - code usage          R.drawable.ic_star, binding.string.title
 * - markup usage        @drawable/ic_star, @style/Widget.Button
 * - style inheritance   parent="Widget.Button"
 * - generated bindings  databinding.ActivityMainBinding -> layout activity_main
 */

#include "ResourceMover/core/result.hpp"
#include "ResourceMover/resources/resource_dependency.hpp"
#include <filesystem>
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace ResourceMover::resources {

namespace fs = std::filesystem;

struct ReferenceRule {
  std::string name;
  std::regex pattern;
  std::function<std::optional<ResourceDependency>(const std::smatch&)> extract;
};

/**
 * @brief Layout name behind a generated binding class
 *
 * "ActivityMainBinding" becomes "activity_main".
 */
[[nodiscard]] std::string bindingClassToLayoutName(const std::string& className);

class ReferenceScanner {
public:
  ReferenceScanner();
  explicit ReferenceScanner(std::vector<std::string> sourceExtensions);

  /**
   * @brief The four built-in extraction rules, in evaluation order
   */
  [[nodiscard]] static std::vector<ReferenceRule> defaultRules();

  void addRule(ReferenceRule rule);
  [[nodiscard]] const std::vector<ReferenceRule>& getRules() const { return m_rules; }

  [[nodiscard]] const std::vector<std::string>& getSourceExtensions() const {
    return m_sourceExtensions;
  }

  /**
   * @brief Every dependency referenced under <moduleRoot>/src
   *
   * A module without a src directory references nothing. Any file that
   * cannot be read fails the whole scan.
   */
  [[nodiscard]] Result<ResourceDependencySet> scanModule(const fs::path& moduleRoot) const;

  [[nodiscard]] Result<void> scanFile(const fs::path& file, ResourceDependencySet& out) const;

  void scanLine(const std::string& line, ResourceDependencySet& out) const;

private:
  std::vector<std::string> m_sourceExtensions;
  std::vector<ReferenceRule> m_rules;
};

} // namespace ResourceMover::resources
