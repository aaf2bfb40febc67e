// modgraph/resolve/module_resolver.hpp - Specifier -> module identity
//
// The graph builder and the dependency extractor go through ModuleResolver
// only; FsModuleResolver is the filesystem implementation used by the CLI.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "modgraph/graph/module_info.hpp"

namespace modgraph
{

class ModuleResolver
{
public:
  virtual ~ModuleResolver() = default;

  /**
   * Resolve `specifier` as imported from `importer`.
   *
   * @param importer Canonical path of the importing module; empty for an
   *                 entry point
   * @throws ResolutionError when the specifier cannot be located
   */
  [[nodiscard]] virtual ModuleInfo resolve(
    const std::string & specifier, const std::string & importer) = 0;
};

// ============================================================================
// Filesystem resolver
// ============================================================================

struct FsResolverOptions
{
  std::filesystem::path root;

  /// Tried in order when a specifier has no matching file as written
  std::vector<std::string> extensions = {".ts", ".js", ".mjs", ".vue", ".json"};

  /// Bare specifiers that are external even without node_modules
  std::vector<std::string> externals;
};

/**
 * Resolves specifiers against the filesystem.
 *
 * - Relative paths (`./`, `../`) resolve against the importer's directory.
 * - Absolute paths resolve as given, then against the root (`/src/x.js`).
 * - Bare specifiers (`vue`, `@scope/pkg/sub`) are external when listed in
 *   `externals` or installed under `<root>/node_modules`.
 * - An entry point (empty importer) that does not exist still resolves, so
 *   the missing file is reported when its content is read.
 */
class FsModuleResolver : public ModuleResolver
{
public:
  explicit FsModuleResolver(FsResolverOptions options);

  [[nodiscard]] ModuleInfo resolve(
    const std::string & specifier, const std::string & importer) override;

  [[nodiscard]] const std::filesystem::path & root() const noexcept { return options_.root; }

  /**
   * Check if a specifier is a bare package import.
   *
   * Anything not starting with "./", "../" or "/" is a package import.
   */
  [[nodiscard]] static bool is_package_import(std::string_view specifier);

  /// Package part of a bare specifier (`@scope/pkg/x` -> `@scope/pkg`).
  [[nodiscard]] static std::string package_name(std::string_view specifier);

private:
  [[nodiscard]] std::optional<std::filesystem::path> find_candidate(
    const std::filesystem::path & base) const;

  [[nodiscard]] ModuleInfo resolve_package(
    const std::string & specifier, const std::string & importer) const;

  [[nodiscard]] ModuleInfo make_info(const std::filesystem::path & path) const;

  FsResolverOptions options_;
};

/**
 * Public path of `path` under `root`: "/" + root-relative path with "/"
 * separators. Paths outside the root are returned as given (generic form).
 */
[[nodiscard]] std::string public_path_of(
  const std::filesystem::path & path, const std::filesystem::path & root);

/// Absolute, lexically normalized path in generic ("/") form.
[[nodiscard]] std::string canonical_path_of(const std::filesystem::path & path);

}  // namespace modgraph
