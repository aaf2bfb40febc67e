// modgraph/graph/graph_builder.cpp - Recursive module graph construction
//
#include "modgraph/graph/graph_builder.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <set>
#include <unordered_set>

#include "modgraph/basic/errors.hpp"
#include "modgraph/basic/log.hpp"

namespace modgraph
{

namespace
{

using Clock = std::chrono::steady_clock;

long long elapsed_ms(Clock::time_point start)
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

std::string basename_of(const std::string & name)
{
  const auto slash = name.find_last_of('/');
  return slash == std::string::npos ? name : name.substr(slash + 1);
}

}  // namespace

GraphBuilder::GraphBuilder(BuildServices services, DiagnosticBag & diags, GraphBuilderOptions options)
: services_(services), diags_(diags), options_(std::move(options))
{
}

NodePtr GraphBuilder::resolve(const std::string & file, const std::string & importer)
{
  std::vector<std::string> chain;
  if (!importer.empty()) {
    chain.push_back(importer);
  }
  std::set<std::string> open;
  return resolve_in_chain(file, importer, chain, open);
}

// ============================================================================
// Node construction
// ============================================================================

// `open` collects the chain members that a finished subtree closed a cycle
// through. A node whose subtree still reaches an unfinished ancestor saw only
// part of that ancestor's dependencies, so it is handed back but not cached.
NodePtr GraphBuilder::resolve_in_chain(
  const std::string & file, const std::string & importer, std::vector<std::string> & chain,
  std::set<std::string> & open)
{
  const ModuleInfo info = services_.resolver.resolve(file, importer);

  if (const auto existing = services_.graph.find(info.path)) {
    if (GraphCache::is_ready(*existing)) {
      log::graph()->debug("serving cached '{}'", info.path);
      return existing->get();
    }
    if (std::find(chain.begin(), chain.end(), info.path) != chain.end()) {
      log::graph()->debug("import cycle through '{}'", info.path);
      open.insert(info.path);
      return nullptr;
    }
    // Pending in another resolution chain: wait for its owner.
    return existing->get();
  }

  std::promise<NodePtr> promise;
  services_.graph.try_insert(info.path, promise.get_future().share());

  auto node = std::make_shared<GraphNode>();
  node->module = info;
  node->name = basename_of(info.name);
  node->extension = extension_of(info.path);

  std::set<std::string> below;
  chain.push_back(info.path);
  try {
    load(*node);
    node->full_dependencies = node->dependencies;
    resolve_dependencies(*node, chain, below);
  } catch (...) {
    chain.pop_back();
    services_.graph.erase(info.path);
    promise.set_exception(std::current_exception());
    throw;
  }
  chain.pop_back();

  NodePtr done = node;
  promise.set_value(done);

  below.erase(info.path);
  if (!below.empty()) {
    log::graph()->debug("'{}' is part of an unfinished cycle, not cached", info.path);
    services_.graph.erase(info.path);
    open.insert(below.begin(), below.end());
  }
  return done;
}

void GraphBuilder::load(GraphNode & node)
{
  const std::string & path = node.module.path;
  try {
    node.raw_content = services_.content.read(path);
  } catch (const NotFoundError & e) {
    diags_.report_error(SourceRange{}, e.what())
      .with_code(diag_code::k_not_found)
      .with_file(path);
    return;
  }

  if (node.extension == options_.composite_extension) {
    load_composite(node);
  } else {
    load_plain(node);
  }
}

void GraphBuilder::load_composite(GraphNode & node)
{
  const std::string & path = node.module.path;

  auto out = services_.sfc.compile(path, node.raw_content, diags_);
  auto extracted = services_.extractor.extract(out.result.script.code, path, services_.resolver);

  out.result.script.dependencies = extracted.dependencies;
  out.result.script.exports = extracted.exports;

  node.code = std::move(out.main);
  node.map = out.result.script.map;
  node.dependencies = std::move(extracted.dependencies);
  node.exports = std::move(extracted.exports);
  node.styles = std::move(out.headers);
  node.sfc = std::move(out.result);
}

void GraphBuilder::load_plain(GraphNode & node)
{
  const std::string & path = node.module.path;

  ScriptTransform * transform = services_.transforms.find(node.extension);
  if (transform == nullptr) {
    diags_
      .report_warning(SourceRange{}, fmt::format("no transform found for '{}'", node.module.name))
      .with_code(diag_code::k_unsupported_extension)
      .with_file(path);
    return;
  }

  const auto start = Clock::now();
  TransformOutput out;
  try {
    out = transform->transform(node.raw_content, path, options_.transform);
  } catch (const TransformError & e) {
    const FileId id = services_.sources.register_or_update(path, node.raw_content);
    SourceRange range;
    if (e.offset()) {
      range = SourceRange(id, *e.offset(), *e.offset() + 1);
    }
    diags_.report_error(range, e.what())
      .with_code(diag_code::k_transform_failed)
      .with_file(path);
    return;
  }
  log::graph()->debug("{} transformed in {}ms.", path, elapsed_ms(start));

  node.code = std::move(out.code);
  node.map = std::move(out.map);

  auto extracted = services_.extractor.extract(*node.code, path, services_.resolver);
  node.dependencies = std::move(extracted.dependencies);
  node.exports = std::move(extracted.exports);

  log::graph()->debug("{} imports parsed in {}ms.", path, elapsed_ms(start));
}

// Children are resolved in declaration order. Every child is attempted even
// when an earlier one throws; the first error is rethrown afterwards.
void GraphBuilder::resolve_dependencies(
  GraphNode & node, std::vector<std::string> & chain, std::set<std::string> & open)
{
  std::exception_ptr first_error;

  for (const auto & dep : node.dependencies) {
    if (dep.module.is_external) {
      continue;
    }

    NodePtr child;
    try {
      child = resolve_in_chain(dep.module.path, node.module.path, chain, open);
    } catch (...) {
      if (!first_error) {
        first_error = std::current_exception();
      }
      continue;
    }

    if (!child) {
      if (std::find(node.cyclic.begin(), node.cyclic.end(), dep.module.path) == node.cyclic.end()) {
        node.cyclic.push_back(dep.module.path);
      }
      continue;
    }

    node.styles.insert(node.styles.end(), child->styles.begin(), child->styles.end());
    node.full_dependencies.insert(
      node.full_dependencies.end(), child->full_dependencies.begin(),
      child->full_dependencies.end());
  }

  if (first_error) {
    std::rethrow_exception(first_error);
  }
}

std::vector<DependencyEdge> unique_dependencies(const GraphNode & node)
{
  std::vector<DependencyEdge> out;
  std::unordered_set<std::string> seen;
  for (const auto & dep : node.full_dependencies) {
    if (seen.insert(dep.module.path).second) {
      out.push_back(dep);
    }
  }
  return out;
}

}  // namespace modgraph
