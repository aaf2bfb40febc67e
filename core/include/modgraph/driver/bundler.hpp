// modgraph/driver/bundler.hpp - Bundler driver
//
// Single entry point for graph construction and the composite sub-requests.
// Used by the CLI and can be embedded into a dev server.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "modgraph/basic/diagnostic.hpp"
#include "modgraph/basic/source_manager.hpp"
#include "modgraph/extract/import_scanner.hpp"
#include "modgraph/graph/graph_builder.hpp"
#include "modgraph/graph/graph_cache.hpp"
#include "modgraph/io/content_source.hpp"
#include "modgraph/project/project_config.hpp"
#include "modgraph/resolve/module_resolver.hpp"
#include "modgraph/sfc/artifact_cache.hpp"
#include "modgraph/sfc/basic_style_processor.hpp"
#include "modgraph/sfc/block_parser.hpp"
#include "modgraph/sfc/raw_template_compiler.hpp"
#include "modgraph/sfc/sfc_compiler.hpp"
#include "modgraph/transform/transform.hpp"

namespace modgraph
{

// ============================================================================
// Build Result
// ============================================================================

struct BuildResult
{
  /// Whether the build succeeded (no errors)
  bool success = false;

  /// Collected diagnostics (errors, warnings, etc.)
  DiagnosticBag diagnostics;

  /// Root of the graph; null when the entry could not be resolved
  NodePtr entry;

  /// Entry module first, then each module it reaches once
  std::vector<ModuleInfo> modules;
};

// ============================================================================
// Bundler
// ============================================================================

/**
 * Owns the collaborators and the three cache layers for one project.
 *
 * Caches survive between build() calls; invalidate() is the only way a
 * change on disk becomes visible.
 */
class Bundler
{
public:
  explicit Bundler(ProjectConfig config);

  Bundler(const Bundler &) = delete;
  Bundler & operator=(const Bundler &) = delete;

  /**
   * Build the graph below `entry` (absolute, or relative to the root).
   *
   * A ResolutionError anywhere below the entry is reported as RES001.
   */
  [[nodiscard]] BuildResult build(const std::filesystem::path & entry);

  /// Build every entry point of the project configuration, one result each.
  [[nodiscard]] std::vector<BuildResult> build_project();

  /**
   * Forget what is known about `file` after it changed on disk.
   *
   * Clears the graph cache and the raw content of the file; for a composite
   * file only the blocks that changed are dropped from the artifact cache.
   */
  sfc::RefreshSummary invalidate(const std::filesystem::path & file, DiagnosticBag & diags);

  /// Synthetic main module of a composite file
  [[nodiscard]] std::optional<std::string> serve_main(
    const std::filesystem::path & file, DiagnosticBag & diags);

  /// Answer to `<publicPath>?type=template`
  [[nodiscard]] std::optional<std::string> serve_template(
    const std::filesystem::path & file, DiagnosticBag & diags);

  /// Answer to `<publicPath>?type=style&index=<index>`
  [[nodiscard]] std::optional<std::string> serve_style(
    const std::filesystem::path & file, size_t index, DiagnosticBag & diags);

  [[nodiscard]] const ProjectConfig & config() const noexcept { return config_; }
  [[nodiscard]] const SourceRegistry & sources() const noexcept { return sources_; }
  [[nodiscard]] const GraphCache & graph() const noexcept { return graph_; }
  [[nodiscard]] const sfc::ArtifactCache & artifacts() const noexcept { return artifacts_; }
  [[nodiscard]] const CachingContentSource & content() const noexcept { return content_; }

private:
  [[nodiscard]] std::string canonical(const std::filesystem::path & file) const;

  /// Raw text of a composite file, or nullopt after reporting IO001.
  std::optional<std::string> read_source(const std::string & path, DiagnosticBag & diags);

  ProjectConfig config_;

  SourceRegistry sources_;
  CachingContentSource content_;
  FsModuleResolver resolver_;
  TransformRegistry transforms_;
  ImportScanner extractor_;

  sfc::BlockParser parser_;
  sfc::RawTemplateCompiler templates_;
  sfc::BasicStyleProcessor styles_;
  sfc::ArtifactCache artifacts_;
  sfc::SfcCompiler sfc_;

  GraphCache graph_;
};

}  // namespace modgraph
