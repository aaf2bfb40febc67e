// tests/unit/support/fakes.hpp - In-memory collaborators for unit tests
//
// Every fake counts its invocations so tests can assert how often the
// builder and the composite compiler reached past their caches.
//
#pragma once

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <string_view>

#include "modgraph/basic/errors.hpp"
#include "modgraph/io/content_source.hpp"
#include "modgraph/resolve/module_resolver.hpp"
#include "modgraph/sfc/basic_style_processor.hpp"
#include "modgraph/sfc/block_parser.hpp"
#include "modgraph/sfc/raw_template_compiler.hpp"
#include "modgraph/sfc/toolchain.hpp"
#include "modgraph/transform/transform.hpp"

namespace modgraph::test_support
{

/// Files held in memory, keyed by absolute path.
class MemoryContentSource : public ContentSource
{
public:
  void put(const std::string & path, std::string content) { files[path] = std::move(content); }

  std::string read(const std::string & path) override
  {
    ++reads[path];
    const auto it = files.find(path);
    if (it == files.end()) {
      throw NotFoundError(path);
    }
    return it->second;
  }

  [[nodiscard]] bool has(const std::string & path) const { return files.count(path) > 0; }

  std::map<std::string, std::string> files;
  std::map<std::string, int> reads;
};

/**
 * Resolves `./x` and `../x` against the importer's directory and `/x`
 * as written. Bare names listed in `externals` are external; other bare
 * names and relative paths to unknown files are ResolutionErrors. Entries
 * (empty importer) always resolve.
 */
class MemoryResolver : public ModuleResolver
{
public:
  explicit MemoryResolver(const MemoryContentSource & files) : files_(files) {}

  ModuleInfo resolve(const std::string & specifier, const std::string & importer) override
  {
    ++calls;

    ModuleInfo info;
    if (FsModuleResolver::is_package_import(specifier)) {
      if (importer.empty() || externals.count(FsModuleResolver::package_name(specifier)) == 0) {
        throw ResolutionError(specifier, importer);
      }
      info.path = specifier;
      info.name = specifier;
      info.is_external = true;
      return info;
    }

    std::filesystem::path path(specifier);
    if (!path.is_absolute()) {
      path = std::filesystem::path(importer).parent_path() / path;
    }
    info.path = path.lexically_normal().generic_string();
    info.name = info.path;

    if (!importer.empty() && !files_.has(info.path)) {
      throw ResolutionError(specifier, importer);
    }
    return info;
  }

  std::set<std::string> externals;
  int calls = 0;

private:
  const MemoryContentSource & files_;
};

/**
 * Pass-through transform. Input containing `@@error` is rejected with a
 * TransformError located at the marker.
 */
class CountingTransform : public ScriptTransform
{
public:
  TransformOutput transform(
    std::string_view source, const std::string & path, const TransformOptions & options) override
  {
    ++calls;
    last_loader = options.loader;
    if (const auto at = source.find("@@error"); at != std::string_view::npos) {
      throw TransformError(path + ": unexpected token", static_cast<uint32_t>(at));
    }
    TransformOutput out;
    out.code = std::string(source);
    return out;
  }

  int calls = 0;
  std::string last_loader;
};

class CountingParser : public sfc::Parser
{
public:
  sfc::ParseResult parse(std::string_view source, const std::string & filename) override
  {
    ++calls;
    return inner_.parse(source, filename);
  }

  int calls = 0;

private:
  sfc::BlockParser inner_;
};

class CountingTemplateCompiler : public sfc::TemplateCompiler
{
public:
  sfc::TemplateResult compile(const sfc::TemplateRequest & request) override
  {
    ++calls;
    last_request = request;
    return inner_.compile(request);
  }

  int calls = 0;
  sfc::TemplateRequest last_request;

private:
  sfc::RawTemplateCompiler inner_;
};

class CountingStyleProcessor : public sfc::StyleProcessor
{
public:
  sfc::StyleResult compile(const sfc::StyleRequest & request) override
  {
    ++calls;
    last_request = request;
    return inner_.compile(request);
  }

  int calls = 0;
  sfc::StyleRequest last_request;

private:
  sfc::BasicStyleProcessor inner_;
};

/// Toolchain made of the counting wrappers above.
struct CountingToolchain
{
  CountingParser parser;
  CountingTemplateCompiler templates;
  CountingStyleProcessor styles;

  sfc::Toolchain toolchain() { return sfc::Toolchain{parser, templates, styles}; }
};

}  // namespace modgraph::test_support
