// modgraph/driver/graph_json.cpp - JSON serialization of graph nodes
//
#include "modgraph/driver/graph_json.hpp"

namespace modgraph
{
namespace
{

using nlohmann::json;

const char * severity_name(Severity severity)
{
  switch (severity) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

json j_optional(const std::optional<std::string> & value)
{
  return value ? json(*value) : json(nullptr);
}

json j_diagnostic(const Diagnostic & diag)
{
  return json{
    {"severity", severity_name(diag.severity)},
    {"code", diag.code},
    {"message", diag.message},
    {"file", diag.file}};
}

json j_sfc(const SfcResult & sfc)
{
  json styles = json::array();
  for (const auto & style : sfc.styles) {
    json s{{"code", style.code}};
    if (style.modules) {
      s["modules"] = *style.modules;
    }
    styles.push_back(std::move(s));
  }
  return json{
    {"scopeId", j_optional(sfc.scope_id)},
    {"script", sfc.script.code},
    {"template", sfc.template_output.code},
    {"styles", std::move(styles)}};
}

}  // namespace

json to_json(const ModuleInfo & module)
{
  return json{{"path", module.path}, {"name", module.name}, {"external", module.is_external}};
}

json to_json(const DependencyEdge & edge)
{
  return json{
    {"specifier", edge.specifier},
    {"module", to_json(edge.module)},
    {"statement", edge.statement},
    {"dynamic", edge.dynamic}};
}

json to_json(const GraphNode & node)
{
  json deps = json::array();
  for (const auto & dep : node.dependencies) {
    deps.push_back(to_json(dep));
  }

  json reached = json::array();
  for (const auto & dep : unique_dependencies(node)) {
    reached.push_back(dep.module.path);
  }

  json styles = json::array();
  for (const auto & header : node.styles) {
    styles.push_back(json{{"id", header.id}, {"request", header.request}});
  }

  json out{
    {"name", node.name},
    {"extension", node.extension},
    {"module", to_json(node.module)},
    {"code", j_optional(node.code)},
    {"exports", node.exports},
    {"dependencies", std::move(deps)},
    {"fullDependencies", std::move(reached)},
    {"styles", std::move(styles)},
    {"cyclic", node.cyclic}};
  if (node.sfc) {
    out["sfc"] = j_sfc(*node.sfc);
  }
  return out;
}

json to_json(const BuildResult & result)
{
  json modules = json::array();
  for (const auto & module : result.modules) {
    modules.push_back(to_json(module));
  }

  json diagnostics = json::array();
  for (const auto & diag : result.diagnostics) {
    diagnostics.push_back(j_diagnostic(diag));
  }

  return json{
    {"success", result.success},
    {"entry", result.entry ? to_json(*result.entry) : json(nullptr)},
    {"modules", std::move(modules)},
    {"diagnostics", std::move(diagnostics)}};
}

std::string dump_json(const nlohmann::json & value, int indent)
{
  return value.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace modgraph
