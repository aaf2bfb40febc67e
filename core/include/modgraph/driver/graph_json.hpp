// modgraph/driver/graph_json.hpp - JSON serialization of graph nodes
//
// Converts graph nodes and build results into nlohmann::json for tooling
// (`mgraph build --json`). Raw content and source maps are left out.
//
#pragma once

#include <nlohmann/json.hpp>

#include <string>

#include "modgraph/driver/bundler.hpp"
#include "modgraph/graph/graph_node.hpp"

namespace modgraph
{

[[nodiscard]] nlohmann::json to_json(const ModuleInfo & module);

[[nodiscard]] nlohmann::json to_json(const DependencyEdge & edge);

/**
 * One node without its transitive lists (`full_dependencies` is reduced to
 * the unique module paths it names).
 */
[[nodiscard]] nlohmann::json to_json(const GraphNode & node);

/// `{success, entry, modules, diagnostics}`
[[nodiscard]] nlohmann::json to_json(const BuildResult & result);

/// Serialize `value`; invalid UTF-8 in strings is replaced with U+FFFD.
[[nodiscard]] std::string dump_json(const nlohmann::json & value, int indent = 2);

}  // namespace modgraph
