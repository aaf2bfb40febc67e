// modgraph/resolve/module_resolver.cpp - Filesystem module resolution
//
#include <algorithm>
#include <system_error>

#include "modgraph/basic/errors.hpp"
#include "modgraph/resolve/module_resolver.hpp"

namespace modgraph
{

namespace
{

bool is_file(const std::filesystem::path & p)
{
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec);
}

bool is_dir(const std::filesystem::path & p)
{
  std::error_code ec;
  return std::filesystem::is_directory(p, ec);
}

}  // namespace

// ============================================================================
// Path helpers
// ============================================================================

std::string canonical_path_of(const std::filesystem::path & path)
{
  std::error_code ec;
  auto abs = std::filesystem::weakly_canonical(std::filesystem::absolute(path, ec), ec);
  if (ec) {
    abs = std::filesystem::absolute(path).lexically_normal();
  }
  return abs.generic_string();
}

std::string public_path_of(const std::filesystem::path & path, const std::filesystem::path & root)
{
  if (root.empty()) {
    return path.generic_string();
  }
  const auto rel = path.lexically_normal().lexically_relative(root.lexically_normal());
  const auto rel_str = rel.generic_string();
  if (rel.empty() || rel_str == ".." || rel_str.rfind("../", 0) == 0) {
    return path.generic_string();
  }
  return "/" + rel_str;
}

// ============================================================================
// FsModuleResolver
// ============================================================================

FsModuleResolver::FsModuleResolver(FsResolverOptions options) : options_(std::move(options))
{
  if (!options_.root.empty()) {
    options_.root = std::filesystem::path(canonical_path_of(options_.root));
  }
}

ModuleInfo FsModuleResolver::resolve(const std::string & specifier, const std::string & importer)
{
  if (specifier.empty()) {
    throw ResolutionError(specifier, importer);
  }

  // Entry points are plain paths, never package imports.
  if (!importer.empty() && is_package_import(specifier)) {
    return resolve_package(specifier, importer);
  }

  const std::filesystem::path spec_path(specifier);
  std::filesystem::path base_dir = options_.root;
  if (!importer.empty()) {
    base_dir = std::filesystem::path(importer).parent_path();
  } else if (base_dir.empty()) {
    base_dir = std::filesystem::current_path();
  }

  std::vector<std::filesystem::path> candidates;
  if (spec_path.is_absolute()) {
    candidates.push_back(spec_path);
    if (!options_.root.empty()) {
      candidates.push_back(options_.root / spec_path.relative_path());
    }
  } else {
    candidates.push_back(base_dir / spec_path);
  }

  for (const auto & candidate : candidates) {
    if (auto found = find_candidate(candidate)) {
      return make_info(*found);
    }
  }

  if (importer.empty()) {
    return make_info(candidates.front());
  }
  throw ResolutionError(specifier, importer);
}

bool FsModuleResolver::is_package_import(std::string_view specifier)
{
  return specifier.substr(0, 2) != "./" && specifier.substr(0, 3) != "../" &&
         specifier != "." && specifier != ".." && specifier.substr(0, 1) != "/";
}

std::string FsModuleResolver::package_name(std::string_view specifier)
{
  auto slash = specifier.find('/');
  if (!specifier.empty() && specifier.front() == '@' && slash != std::string_view::npos) {
    slash = specifier.find('/', slash + 1);
  }
  return std::string(slash == std::string_view::npos ? specifier : specifier.substr(0, slash));
}

std::optional<std::filesystem::path> FsModuleResolver::find_candidate(
  const std::filesystem::path & base) const
{
  if (is_file(base)) {
    return base;
  }
  for (const auto & ext : options_.extensions) {
    auto with_ext = base;
    with_ext += ext;
    if (is_file(with_ext)) {
      return with_ext;
    }
  }
  if (is_dir(base)) {
    for (const auto & ext : options_.extensions) {
      auto index = base / ("index" + ext);
      if (is_file(index)) {
        return index;
      }
    }
  }
  return std::nullopt;
}

ModuleInfo FsModuleResolver::resolve_package(
  const std::string & specifier, const std::string & importer) const
{
  const auto pkg = package_name(specifier);
  const bool listed =
    std::find(options_.externals.begin(), options_.externals.end(), pkg) != options_.externals.end();

  const auto pkg_dir = options_.root / "node_modules" / pkg;
  if (!listed && !is_dir(pkg_dir)) {
    throw ResolutionError(specifier, importer);
  }

  ModuleInfo info;
  info.path = canonical_path_of(options_.root / "node_modules" / specifier);
  info.name = specifier;
  info.is_external = true;
  return info;
}

ModuleInfo FsModuleResolver::make_info(const std::filesystem::path & path) const
{
  ModuleInfo info;
  info.path = canonical_path_of(path);
  info.name = public_path_of(info.path, options_.root);
  info.is_external = false;
  return info;
}

}  // namespace modgraph
