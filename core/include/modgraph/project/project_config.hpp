// modgraph/project/project_config.hpp - Project configuration (modgraph.yaml)
//
// Parses and validates modgraph.yaml project configuration files.
//
#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace modgraph
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Style-processing configuration handed to the style processor.
 */
struct StyleConfig
{
  std::map<std::string, std::string> options;
  std::vector<std::string> plugins;
};

struct BuildConfig
{
  /// Entry files (relative to the project root)
  std::vector<std::filesystem::path> entry_points;

  /// Project root; public paths are computed relative to it
  std::filesystem::path root;

  /// Module exporting the hot-style-update helper `updateStyle`
  std::string hmr_client = "/vite/hmr";

  /// Runtime module the template compiler imports helpers from
  std::string runtime_module = "/@modules/vue";

  /// Extension treated as a composite-component file
  std::string composite_extension = "vue";
};

struct CacheConfig
{
  /// Bound of the Compiled-Artifact Cache
  size_t max_entries = 65535;

  /// Bound of the raw-content cache
  size_t content_entries = 4096;
};

struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (modgraph.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  BuildConfig build;
  CacheConfig cache;

  /// Extension aliases onto registered transforms (e.g. cjs -> js)
  std::map<std::string, std::string> transform_aliases;

  /// Bare specifiers always treated as external modules
  std::vector<std::string> externals;

  std::optional<StyleConfig> style;

  /// Directory containing modgraph.yaml
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  ProjectConfig config;
  bool success = false;
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a modgraph.yaml file.
 *
 * Relative `build.root` is resolved against the file's directory; a missing
 * root defaults to that directory.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Same as load_project_config, from YAML text already in memory.
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find modgraph.yaml by searching upward from start_dir (or its parent when
 * start_dir is a file) to the filesystem root.
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Style configuration governing `root`: the `style` section of the nearest
 * modgraph.yaml, if that file exists, loads, and has one.
 */
[[nodiscard]] std::optional<StyleConfig> discover_style_config(const std::filesystem::path & root);

inline constexpr const char * k_project_config_file_name = "modgraph.yaml";

}  // namespace modgraph
