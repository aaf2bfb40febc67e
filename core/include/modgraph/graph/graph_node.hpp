// modgraph/graph/graph_node.hpp - One resolved module of the dependency graph
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "modgraph/graph/module_info.hpp"

namespace modgraph
{

/// Style sheet side artifact of a composite module.
struct StyleHeader
{
  /// `<hash>-<index>`, the id handed to updateStyle
  std::string id;

  /// `<publicPath>?type=style&index=<index>`
  std::string request;

  /// Compiled style sheet
  std::string code;
};

// ============================================================================
// Composite-Component Sub-Result
// ============================================================================

struct SfcStyleOutput
{
  std::string code;
  std::string map;
  std::optional<std::map<std::string, std::string>> modules;
};

struct SfcTemplateOutput
{
  std::string code;
  std::string map;
};

struct SfcScriptOutput
{
  /// Behavior section after its transform, before wiring
  std::string code;
  std::string map;
  std::vector<DependencyEdge> dependencies;
  std::vector<std::string> exports;
};

struct SfcResult
{
  /// `data-v-<hash>` when at least one style block is scoped
  std::optional<std::string> scope_id;

  /// One entry per style block, in block order
  std::vector<SfcStyleOutput> styles;

  SfcTemplateOutput template_output;
  SfcScriptOutput script;
};

// ============================================================================
// Graph Node
// ============================================================================

struct GraphNode
{
  std::string name;

  /// Lowercase extension without the dot
  std::string extension;

  std::string raw_content;

  /// Direct edges, in declaration order
  std::vector<DependencyEdge> dependencies;

  /// Direct edges followed by every non-external dependency's full list
  std::vector<DependencyEdge> full_dependencies;

  ModuleInfo module;

  /// Absent when the module was skipped or failed to transform
  std::optional<std::string> code;
  std::string map;

  std::vector<std::string> exports;

  /// Set for composite modules only
  std::optional<SfcResult> sfc;

  /// Style headers of this module and everything below it
  std::vector<StyleHeader> styles;

  /// Dependencies whose lists were not folded because they close a cycle
  std::vector<std::string> cyclic;
};

}  // namespace modgraph
