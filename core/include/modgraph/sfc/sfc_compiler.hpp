// modgraph/sfc/sfc_compiler.hpp - Composite-component compiler
//
// Turns one composite file into a synthetic executable module plus one
// compiled artifact per template / style block. Every step reads and fills
// the Compiled-Artifact Cache at block granularity, so recompiling a file in
// which one block changed only redoes that block.
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "modgraph/basic/diagnostic.hpp"
#include "modgraph/basic/source_manager.hpp"
#include "modgraph/graph/graph_node.hpp"
#include "modgraph/project/project_config.hpp"
#include "modgraph/sfc/artifact_cache.hpp"
#include "modgraph/sfc/toolchain.hpp"
#include "modgraph/transform/transform.hpp"

namespace modgraph::sfc
{

struct SfcOptions
{
  /// Public paths (and so scope ids) are relative to this directory
  std::filesystem::path root;

  /// Module exporting `updateStyle`
  std::string hmr_client = "/vite/hmr";

  /// Runtime module the compiled render functions import from
  std::string runtime_module = "/@modules/vue";

  /// Base options for behavior-section transforms (loader is set per block)
  TransformOptions transform;

  /// Style configuration; when unset, discovered from `root` on first use
  std::optional<StyleConfig> style_config;
  bool discover_style_config = true;
};

/// Everything one composite file compiles to.
struct SfcOutput
{
  std::shared_ptr<const Descriptor> descriptor;

  /// Synthetic module (`export default __script`)
  std::string main;

  /// Script/template/style outputs; script dependencies are left empty
  SfcResult result;

  /// One per style block, in block order
  std::vector<StyleHeader> headers;
};

/// Which parts of a file refresh() found changed (and dropped from the cache).
struct RefreshSummary
{
  /// No cache entry existed; the new source was simply parsed
  bool fresh = false;

  bool script = false;
  bool template_output = false;
  std::vector<size_t> styles;

  [[nodiscard]] bool any() const noexcept
  {
    return fresh || script || template_output || !styles.empty();
  }
};

class SfcCompiler
{
public:
  SfcCompiler(
    Toolchain toolchain, TransformRegistry & transforms, ArtifactCache & cache,
    SourceRegistry & sources, SfcOptions options);

  /**
   * Structured view of `file`.
   *
   * Returns the cached descriptor when one exists for the path, ignoring
   * `source`. Parse errors are reported (SFC001) and the recovered
   * structure is returned.
   */
  std::shared_ptr<const Descriptor> parse(
    const std::string & file, std::string_view source, DiagnosticBag & diags);

  /**
   * Compile the behavior section and wire template and styles onto it.
   *
   * Never null. A missing behavior section yields `const __script = {}`.
   */
  std::shared_ptr<const ScriptArtifact> compile_main(
    const std::string & file, std::string_view source, DiagnosticBag & diags);

  /// Answer to `<publicPath>?type=template`; nullptr without a template block.
  std::shared_ptr<const TemplateArtifact> compile_template(
    const std::string & file, std::string_view source, DiagnosticBag & diags);

  /// Answer to `<publicPath>?type=style&index=<index>`; nullptr when out of range.
  std::shared_ptr<const StyleArtifact> compile_style(
    const std::string & file, std::string_view source, size_t index, DiagnosticBag & diags);

  /// Parse, then compile the main module, the template and every style.
  SfcOutput compile(const std::string & file, std::string_view source, DiagnosticBag & diags);

  /**
   * Re-parse `file` from `new_source` and drop only the cached parts whose
   * blocks changed.
   *
   * - behavior: script block changed, or the wiring did (style count,
   *   scoped / module attributes, template presence)
   * - template: template block changed, or whether any style is scoped did
   * - style[i]: that style block changed
   */
  RefreshSummary refresh(const std::string & file, std::string_view new_source, DiagnosticBag & diags);

  /// Drop every cached part of `file`.
  bool invalidate(const std::string & file) { return cache_.erase(file); }

  /// `/` + path relative to the root
  [[nodiscard]] std::string public_path(const std::string & file) const;

  [[nodiscard]] const SfcOptions & options() const noexcept { return options_; }

private:
  [[nodiscard]] CacheEntry entry_for(const std::string & file);

  std::shared_ptr<const Descriptor> parse_uncached(
    const std::string & file, std::string_view source, DiagnosticBag & diags);

  std::string transform_script(
    const Descriptor & desc, const Block & script, const std::string & file, std::string & map,
    DiagnosticBag & diags);

  [[nodiscard]] std::string build_main(
    const Descriptor & desc, const std::string & script_code, const std::string & file) const;

  void report_style_errors(
    const Descriptor & desc, const StyleBlock & block, const std::vector<SfcError> & errors,
    const std::string & file, DiagnosticBag & diags);

  [[nodiscard]] FileId file_id(const Descriptor & desc);

  [[nodiscard]] const std::optional<StyleConfig> & style_config();

  [[nodiscard]] PreprocessorLocator preprocessor_locator() const;

  Toolchain toolchain_;
  TransformRegistry & transforms_;
  ArtifactCache & cache_;
  SourceRegistry & sources_;
  SfcOptions options_;

  std::optional<std::optional<StyleConfig>> discovered_style_;
};

/**
 * Remove the redundant `<...>/<basename>:<line>:<col>: ` prefix style
 * processors put in front of their messages.
 */
[[nodiscard]] std::string strip_filename_prefix(
  const std::string & message, const std::string & filename);

/// Style block index from a request or command line; nullopt unless `text`
/// is a non-empty run of decimal digits that fits in size_t.
[[nodiscard]] std::optional<size_t> parse_style_index(std::string_view text);

}  // namespace modgraph::sfc
