// modgraph/graph/graph_builder.hpp - Recursive module graph construction
//
// resolve() turns one module into a GraphNode: it loads and transforms the
// module, extracts its imports, resolves every non-external import the same
// way and folds their transitive results into its own.
//
#pragma once

#include <set>
#include <string>
#include <vector>

#include "modgraph/basic/diagnostic.hpp"
#include "modgraph/basic/source_manager.hpp"
#include "modgraph/extract/dependency_extractor.hpp"
#include "modgraph/graph/graph_cache.hpp"
#include "modgraph/io/content_source.hpp"
#include "modgraph/resolve/module_resolver.hpp"
#include "modgraph/sfc/sfc_compiler.hpp"
#include "modgraph/transform/transform.hpp"

namespace modgraph
{

/// Collaborators and shared caches used by GraphBuilder (not owned).
struct BuildServices
{
  ModuleResolver & resolver;
  ContentSource & content;
  TransformRegistry & transforms;
  DependencyExtractor & extractor;
  sfc::SfcCompiler & sfc;
  GraphCache & graph;
  SourceRegistry & sources;
};

struct GraphBuilderOptions
{
  /// Extension (lowercase, no dot) compiled by the composite compiler
  std::string composite_extension = "vue";

  /// Options handed to every plain-module transform
  TransformOptions transform;
};

/**
 * Builds graph nodes on the calling thread.
 *
 * Per resolved path, work happens once: the node is registered in the
 * GraphCache as a pending future before its content is loaded, and later
 * resolutions of the path reuse it. A path that is still pending in the
 * current resolution chain closes an import cycle; the edge is kept, the
 * dependency's lists are not folded and the path is listed in
 * GraphNode::cyclic. Nodes inside such a cycle, other than the one the cycle
 * closes on, are returned to their importer but dropped from the GraphCache,
 * so a later resolution starting from them sees the whole cycle.
 *
 * Error policy:
 * - missing content: IO001, node keeps empty content and no dependencies
 * - no transform for the extension: one TRN002 warning, no code, no deps
 * - transform failure: TRN001, no code, no deps
 * - ResolutionError: propagates after every sibling has been resolved
 */
class GraphBuilder
{
public:
  GraphBuilder(BuildServices services, DiagnosticBag & diags, GraphBuilderOptions options = {});

  /**
   * Resolve `file` as imported from `importer` (empty for an entry point).
   *
   * @throws ResolutionError when the file or any import below it cannot be
   *         resolved
   */
  NodePtr resolve(const std::string & file, const std::string & importer = "");

  [[nodiscard]] const GraphBuilderOptions & options() const noexcept { return options_; }

private:
  NodePtr resolve_in_chain(
    const std::string & file, const std::string & importer, std::vector<std::string> & chain,
    std::set<std::string> & open);

  void load(GraphNode & node);
  void load_composite(GraphNode & node);
  void load_plain(GraphNode & node);

  void resolve_dependencies(
    GraphNode & node, std::vector<std::string> & chain, std::set<std::string> & open);

  BuildServices services_;
  DiagnosticBag & diags_;
  GraphBuilderOptions options_;
};

/**
 * Dependencies of `node` and everything below it, first occurrence of each
 * canonical path only, in the order of `full_dependencies`.
 */
[[nodiscard]] std::vector<DependencyEdge> unique_dependencies(const GraphNode & node);

}  // namespace modgraph
