// modgraph/driver/bundler.cpp - Bundler driver implementation
//
#include "modgraph/driver/bundler.hpp"

#include <unordered_set>

#include "modgraph/basic/errors.hpp"
#include "modgraph/basic/log.hpp"

namespace modgraph
{

namespace
{

std::filesystem::path root_of(const ProjectConfig & config)
{
  if (!config.build.root.empty()) {
    return config.build.root;
  }
  if (!config.project_root.empty()) {
    return config.project_root;
  }
  return std::filesystem::current_path();
}

FsResolverOptions resolver_options(const ProjectConfig & config)
{
  FsResolverOptions options;
  options.root = root_of(config);
  options.externals = config.externals;
  return options;
}

sfc::SfcOptions sfc_options(const ProjectConfig & config)
{
  sfc::SfcOptions options;
  options.root = root_of(config);
  options.hmr_client = config.build.hmr_client;
  options.runtime_module = config.build.runtime_module;
  if (config.style) {
    options.style_config = config.style;
    options.discover_style_config = false;
  }
  return options;
}

}  // namespace

Bundler::Bundler(ProjectConfig config)
: config_(std::move(config)),
  content_(std::make_unique<FileContentSource>(), config_.cache.content_entries),
  resolver_(resolver_options(config_)),
  artifacts_(config_.cache.max_entries),
  sfc_(
    sfc::Toolchain{parser_, templates_, styles_}, transforms_, artifacts_, sources_,
    sfc_options(config_))
{
  register_builtin_transforms(transforms_);
  for (const auto & [alias, target] : config_.transform_aliases) {
    if (!transforms_.alias(alias, target)) {
      log::graph()->warn("transform alias '{}' targets unknown loader '{}'", alias, target);
    }
  }
}

std::string Bundler::canonical(const std::filesystem::path & file) const
{
  if (file.is_absolute()) {
    return canonical_path_of(file);
  }
  return canonical_path_of(resolver_.root() / file);
}

// ============================================================================
// Build
// ============================================================================

BuildResult Bundler::build(const std::filesystem::path & entry)
{
  BuildResult result;

  GraphBuilderOptions options;
  options.composite_extension = config_.build.composite_extension;
  GraphBuilder builder(
    BuildServices{resolver_, content_, transforms_, extractor_, sfc_, graph_, sources_},
    result.diagnostics, options);

  try {
    result.entry = builder.resolve(canonical(entry));
  } catch (const ResolutionError & e) {
    result.diagnostics.report_error(SourceRange{}, e.what())
      .with_code(diag_code::k_resolution)
      .with_file(e.importer());
    return result;
  }

  std::unordered_set<std::string> seen{result.entry->module.path};
  result.modules.push_back(result.entry->module);
  for (const auto & dep : unique_dependencies(*result.entry)) {
    if (seen.insert(dep.module.path).second) {
      result.modules.push_back(dep.module);
    }
  }

  result.success = !result.diagnostics.has_errors();
  return result;
}

std::vector<BuildResult> Bundler::build_project()
{
  std::vector<BuildResult> results;

  if (config_.build.entry_points.empty()) {
    BuildResult result;
    result.diagnostics.report_error(
      SourceRange{}, "no entry points defined in project configuration");
    results.push_back(std::move(result));
    return results;
  }

  for (const auto & entry : config_.build.entry_points) {
    results.push_back(build(entry));
  }
  return results;
}

// ============================================================================
// Invalidation
// ============================================================================

sfc::RefreshSummary Bundler::invalidate(const std::filesystem::path & file, DiagnosticBag & diags)
{
  const std::string path = canonical(file);

  // Every importer folded the old node into its lists.
  graph_.clear();
  content_.invalidate(path);

  if (extension_of(path) != config_.build.composite_extension) {
    return {};
  }

  std::string source;
  try {
    source = content_.read(path);
  } catch (const NotFoundError &) {
    log::cache()->debug("'{}' is gone; dropping its compiled artifacts", path);
    sfc_.invalidate(path);
    return {};
  }
  return sfc_.refresh(path, source, diags);
}

// ============================================================================
// Composite sub-requests
// ============================================================================

std::optional<std::string> Bundler::read_source(const std::string & path, DiagnosticBag & diags)
{
  try {
    return content_.read(path);
  } catch (const NotFoundError & e) {
    diags.report_error(SourceRange{}, e.what()).with_code(diag_code::k_not_found).with_file(path);
    return std::nullopt;
  }
}

std::optional<std::string> Bundler::serve_main(
  const std::filesystem::path & file, DiagnosticBag & diags)
{
  const std::string path = canonical(file);
  const auto source = read_source(path, diags);
  if (!source) {
    return std::nullopt;
  }
  return sfc_.compile_main(path, *source, diags)->main;
}

std::optional<std::string> Bundler::serve_template(
  const std::filesystem::path & file, DiagnosticBag & diags)
{
  const std::string path = canonical(file);
  const auto source = read_source(path, diags);
  if (!source) {
    return std::nullopt;
  }
  const auto artifact = sfc_.compile_template(path, *source, diags);
  if (!artifact) {
    return std::nullopt;
  }
  return artifact->code;
}

std::optional<std::string> Bundler::serve_style(
  const std::filesystem::path & file, size_t index, DiagnosticBag & diags)
{
  const std::string path = canonical(file);
  const auto source = read_source(path, diags);
  if (!source) {
    return std::nullopt;
  }
  const auto artifact = sfc_.compile_style(path, *source, index, diags);
  if (!artifact) {
    return std::nullopt;
  }
  return artifact->code;
}

}  // namespace modgraph
