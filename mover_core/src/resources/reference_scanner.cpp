#include "ResourceMover/resources/reference_scanner.hpp"
#include "ResourceMover/resources/resource_files.hpp"

#include <cctype>
#include <fstream>

namespace ResourceMover::resources {

namespace {

const std::vector<std::string> kDefaultSourceExtensions = {"java", "kt", "xml"};

std::string resourceTypeAlternation() {
  std::string alternation;
  for (ResourceType type : allResourceTypes()) {
    if (!alternation.empty()) {
      alternation += '|';
    }
    alternation += resourceTypeToRawName(type);
  }
  return alternation;
}

} // namespace

std::string bindingClassToLayoutName(const std::string& className) {
  static const std::string kBindingSuffix = "Binding";

  std::string stem = className;
  if (stem.size() >= kBindingSuffix.size() &&
      stem.compare(stem.size() - kBindingSuffix.size(), kBindingSuffix.size(), kBindingSuffix) ==
          0) {
    stem.erase(stem.size() - kBindingSuffix.size());
  }

  std::string layoutName;
  layoutName.reserve(stem.size() + 8);
  for (usize i = 0; i < stem.size(); ++i) {
    const auto c = static_cast<unsigned char>(stem[i]);
    if (std::isupper(c)) {
      if (i != 0) {
        layoutName += '_';
      }
      layoutName += static_cast<char>(std::tolower(c));
    } else {
      layoutName += stem[i];
    }
  }
  return layoutName;
}

std::vector<ReferenceRule> ReferenceScanner::defaultRules() {
  std::vector<ReferenceRule> rules;

  rules.push_back({"code usage", std::regex("(" + resourceTypeAlternation() + R"()\.(\w+))"),
                   [](const std::smatch& match) -> std::optional<ResourceDependency> {
                     const auto type = resourceTypeFromRawName(match[1].str());
                     if (!type.has_value()) {
                       return std::nullopt;
                     }
                     return ResourceDependency(*type, match[2].str());
                   }});

  rules.push_back({"markup usage", std::regex(R"(@([A-Za-z]+)/([\w.]+))"),
                   [](const std::smatch& match) -> std::optional<ResourceDependency> {
                     const auto type = resourceTypeFromRawName(match[1].str());
                     if (!type.has_value()) {
                       return std::nullopt;
                     }
                     return ResourceDependency(*type, match[2].str());
                   }});

  rules.push_back({"style inheritance", std::regex(R"re(parent\s*=\s*"([\w.]+)")re"),
                   [](const std::smatch& match) -> std::optional<ResourceDependency> {
                     return ResourceDependency(ResourceType::Style, match[1].str());
                   }});

  rules.push_back({"generated binding", std::regex(R"(databinding\.(\w+))"),
                   [](const std::smatch& match) -> std::optional<ResourceDependency> {
                     return ResourceDependency(ResourceType::Layout,
                                               bindingClassToLayoutName(match[1].str()));
                   }});

  return rules;
}

ReferenceScanner::ReferenceScanner() : ReferenceScanner(kDefaultSourceExtensions) {}

ReferenceScanner::ReferenceScanner(std::vector<std::string> sourceExtensions)
    : m_sourceExtensions(std::move(sourceExtensions)), m_rules(defaultRules()) {}

void ReferenceScanner::addRule(ReferenceRule rule) {
  m_rules.push_back(std::move(rule));
}

Result<ResourceDependencySet> ReferenceScanner::scanModule(const fs::path& moduleRoot) const {
  auto files = listFilesRecursively(moduleRoot / kSourceDirectory);
  if (files.isError()) {
    return Result<ResourceDependencySet>::error(files.error());
  }

  ResourceDependencySet dependencies;
  for (const auto& file : files.value()) {
    if (!hasExtension(file, m_sourceExtensions)) {
      continue;
    }
    auto scanned = scanFile(file, dependencies);
    if (scanned.isError()) {
      return Result<ResourceDependencySet>::error(scanned.error());
    }
  }
  return Result<ResourceDependencySet>::ok(std::move(dependencies));
}

Result<void> ReferenceScanner::scanFile(const fs::path& file, ResourceDependencySet& out) const {
  std::ifstream stream(file, std::ios::in | std::ios::binary);
  if (!stream.is_open()) {
    return Result<void>::error("Failed to open file for scanning: " + file.string());
  }

  std::string line;
  while (std::getline(stream, line)) {
    scanLine(line, out);
  }
  if (stream.bad()) {
    return Result<void>::error("Failed to read file: " + file.string());
  }
  return Result<void>::ok();
}

void ReferenceScanner::scanLine(const std::string& line, ResourceDependencySet& out) const {
  for (const auto& rule : m_rules) {
    auto begin = std::sregex_iterator(line.begin(), line.end(), rule.pattern);
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
      auto dependency = rule.extract(*it);
      if (dependency.has_value()) {
        out.insert(std::move(*dependency));
      }
    }
  }
}

} // namespace ResourceMover::resources
