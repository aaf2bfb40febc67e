// modgraph/project/project_config.cpp - Project configuration implementation
//
#include "modgraph/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>

namespace modgraph
{

namespace
{

namespace fs = std::filesystem;

std::string lowercase(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

std::optional<StyleConfig> parse_style(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap()) {
    error = "style must be a map";
    return std::nullopt;
  }

  StyleConfig style;
  if (node["options"]) {
    if (!node["options"].IsMap()) {
      error = "style.options must be a map";
      return std::nullopt;
    }
    for (const auto & kv : node["options"]) {
      style.options[kv.first.as<std::string>()] = kv.second.as<std::string>();
    }
  }
  if (node["plugins"]) {
    if (!node["plugins"].IsSequence()) {
      error = "style.plugins must be a list";
      return std::nullopt;
    }
    for (const auto & p : node["plugins"]) {
      style.plugins.push_back(p.as<std::string>());
    }
  }
  return style;
}

ConfigLoadResult parse_root(const YAML::Node & root, const fs::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;
  config.build.root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("top level of configuration must be a map");
  }

  // 'package'
  if (const auto pkg = root["package"]) {
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // 'build'
  if (const auto build = root["build"]) {
    if (build["entry_points"]) {
      if (!build["entry_points"].IsSequence()) {
        return ConfigLoadResult::fail("build.entry_points must be a list");
      }
      for (const auto & ep : build["entry_points"]) {
        config.build.entry_points.emplace_back(ep.as<std::string>());
      }
    }
    if (build["root"]) {
      const fs::path r = build["root"].as<std::string>();
      config.build.root = (r.is_absolute() ? r : project_root / r).lexically_normal();
    }
    if (build["hmr_client"]) {
      config.build.hmr_client = build["hmr_client"].as<std::string>();
    }
    if (build["runtime_module"]) {
      config.build.runtime_module = build["runtime_module"].as<std::string>();
    }
    if (build["composite_extension"]) {
      config.build.composite_extension = lowercase(build["composite_extension"].as<std::string>());
      if (config.build.composite_extension.empty()) {
        return ConfigLoadResult::fail("build.composite_extension must not be empty");
      }
    }
  }

  // 'cache'
  if (const auto cache = root["cache"]) {
    if (cache["max_entries"]) {
      const auto n = cache["max_entries"].as<long long>();
      if (n <= 0) {
        return ConfigLoadResult::fail("cache.max_entries must be positive");
      }
      config.cache.max_entries = static_cast<size_t>(n);
    }
    if (cache["content_entries"]) {
      const auto n = cache["content_entries"].as<long long>();
      if (n <= 0) {
        return ConfigLoadResult::fail("cache.content_entries must be positive");
      }
      config.cache.content_entries = static_cast<size_t>(n);
    }
  }

  // 'transforms'
  if (const auto transforms = root["transforms"]) {
    if (!transforms.IsMap()) {
      return ConfigLoadResult::fail("transforms must be a map of extension aliases");
    }
    for (const auto & kv : transforms) {
      config.transform_aliases[lowercase(kv.first.as<std::string>())] =
        lowercase(kv.second.as<std::string>());
    }
  }

  // 'externals'
  if (const auto externals = root["externals"]) {
    if (!externals.IsSequence()) {
      return ConfigLoadResult::fail("externals must be a list");
    }
    for (const auto & e : externals) {
      config.externals.push_back(e.as<std::string>());
    }
  }

  // 'style'
  if (const auto style = root["style"]) {
    std::string error;
    auto parsed = parse_style(style, error);
    if (!parsed) {
      return ConfigLoadResult::fail("invalid style section: " + error);
    }
    config.style = std::move(*parsed);
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    const fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::optional<StyleConfig> discover_style_config(const std::filesystem::path & root)
{
  const auto config_path = find_project_config(root);
  if (!config_path) {
    return std::nullopt;
  }
  auto loaded = load_project_config(*config_path);
  if (!loaded.success) {
    return std::nullopt;
  }
  return loaded.config.style;
}

}  // namespace modgraph
