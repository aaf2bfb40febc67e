// modgraph/sfc/toolchain.hpp - Composite-file parser / template compiler / style processor
//
// The three collaborators are pure functions over one file (parser) or one
// block (template compiler, style processor). Each returns its result plus a
// list of errors; none of them throws on malformed input.
//
#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "modgraph/project/project_config.hpp"
#include "modgraph/sfc/descriptor.hpp"

namespace modgraph::sfc
{

/// Locates the package implementing a preprocessing language (e.g. "pug").
using PreprocessorLocator =
  std::function<std::optional<std::filesystem::path>(std::string_view package)>;

// ============================================================================
// Parser
// ============================================================================

struct ParseResult
{
  Descriptor descriptor;

  /// Positions are relative to the whole file
  std::vector<SfcError> errors;
};

class Parser
{
public:
  virtual ~Parser() = default;

  [[nodiscard]] virtual ParseResult parse(std::string_view source, const std::string & filename) = 0;
};

// ============================================================================
// Template compiler
// ============================================================================

struct TemplateRequest
{
  std::string source;
  std::string filename;
  std::string in_map;

  /// Base prepended to relative asset URLs (directory of the public path)
  std::string asset_base;

  std::optional<std::string> scope_id;
  std::string runtime_module;

  std::string preprocess_lang;
  PreprocessorLocator preprocessor;
};

struct TemplateResult
{
  std::string code;
  std::string map;

  /// Positions are relative to the template block content
  std::vector<SfcError> errors;
};

class TemplateCompiler
{
public:
  virtual ~TemplateCompiler() = default;

  [[nodiscard]] virtual TemplateResult compile(const TemplateRequest & request) = 0;
};

// ============================================================================
// Style processor
// ============================================================================

struct StyleRequest
{
  std::string source;
  std::string filename;

  /// `data-v-<hash>`
  std::string id;
  bool scoped = false;
  bool modules = false;

  std::string preprocess_lang;
  PreprocessorLocator preprocessor;

  /// Style-processing configuration discovered for the project root
  std::optional<StyleConfig> config;
};

struct StyleResult
{
  std::string code;
  std::string map;

  /// Class mapping, present when CSS-module semantics were requested
  std::optional<std::map<std::string, std::string>> modules;

  /// Lines are relative to the style block content
  std::vector<SfcError> errors;
};

class StyleProcessor
{
public:
  virtual ~StyleProcessor() = default;

  [[nodiscard]] virtual StyleResult compile(const StyleRequest & request) = 0;
};

/// The three collaborators used by SfcCompiler (not owned).
struct Toolchain
{
  Parser & parser;
  TemplateCompiler & templates;
  StyleProcessor & styles;
};

}  // namespace modgraph::sfc
