// modgraph/sfc/sfc_compiler.cpp - Composite-component compiler
#include "modgraph/sfc/sfc_compiler.hpp"

#include <fmt/core.h>

#include <cctype>
#include <charconv>
#include <chrono>
#include <system_error>

#include "modgraph/basic/codegen_util.hpp"
#include "modgraph/basic/errors.hpp"
#include "modgraph/basic/hash.hpp"
#include "modgraph/basic/log.hpp"
#include "modgraph/resolve/module_resolver.hpp"

namespace modgraph::sfc
{

namespace
{

using Clock = std::chrono::steady_clock;

long long elapsed_ms(Clock::time_point start)
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
}

SourceRange range_at(FileId id, uint32_t begin, uint32_t end)
{
  return SourceRange(id, begin, end > begin ? end : begin + 1);
}

bool same_wiring(const Descriptor & a, const Descriptor & b)
{
  if (a.styles.size() != b.styles.size() ||
      a.template_block.has_value() != b.template_block.has_value()) {
    return false;
  }
  for (size_t i = 0; i < a.styles.size(); ++i) {
    const auto & x = a.styles[i];
    const auto & y = b.styles[i];
    if (x.scoped != y.scoped || x.is_module != y.is_module || x.module_name != y.module_name) {
      return false;
    }
  }
  return true;
}

bool same_style(const StyleBlock & a, const StyleBlock & b)
{
  return static_cast<const Block &>(a) == static_cast<const Block &>(b) && a.scoped == b.scoped &&
         a.is_module == b.is_module && a.module_name == b.module_name;
}

}  // namespace

std::string strip_filename_prefix(const std::string & message, const std::string & filename)
{
  const std::string base = std::filesystem::path(filename).filename().string();
  if (base.empty()) {
    return message;
  }

  const size_t first = message.find(base);
  if (first == std::string::npos) {
    return message;
  }

  // Only the first line holding the name is touched; on that line everything
  // up to the last occurrence goes.
  const size_t nl_before = message.rfind('\n', first);
  const size_t line_begin = nl_before == std::string::npos ? 0 : nl_before + 1;
  const size_t nl_after = message.find('\n', first);
  const size_t line_end = nl_after == std::string::npos ? message.size() : nl_after;
  const size_t last = message.rfind(base, line_end - base.size());

  size_t cut = last + base.size();

  // Optional `:<line>:<column>:` plus following whitespace.
  size_t at = cut;
  bool matched = true;
  for (int field = 0; field < 2 && matched; ++field) {
    if (at >= message.size() || message[at] != ':') {
      matched = false;
      break;
    }
    ++at;
    const size_t digits = at;
    while (at < message.size() && std::isdigit(static_cast<unsigned char>(message[at])) != 0) {
      ++at;
    }
    matched = at > digits;
  }
  if (matched && at < message.size() && message[at] == ':') {
    ++at;
    while (at < message.size() && std::isspace(static_cast<unsigned char>(message[at])) != 0) {
      ++at;
    }
    cut = at;
  }

  return message.substr(0, line_begin) + message.substr(cut);
}

// ============================================================================
// SfcCompiler
// ============================================================================

SfcCompiler::SfcCompiler(
  Toolchain toolchain, TransformRegistry & transforms, ArtifactCache & cache,
  SourceRegistry & sources, SfcOptions options)
: toolchain_(toolchain),
  transforms_(transforms),
  cache_(cache),
  sources_(sources),
  options_(std::move(options))
{
}

std::string SfcCompiler::public_path(const std::string & file) const
{
  return public_path_of(file, options_.root);
}

CacheEntry SfcCompiler::entry_for(const std::string & file)
{
  return cache_.get(file).value_or(CacheEntry{});
}

FileId SfcCompiler::file_id(const Descriptor & desc)
{
  return sources_.register_or_update(desc.filename, desc.source);
}

// ----------------------------------------------------------------------------
// Parse
// ----------------------------------------------------------------------------

std::shared_ptr<const Descriptor> SfcCompiler::parse(
  const std::string & file, std::string_view source, DiagnosticBag & diags)
{
  auto entry = entry_for(file);
  if (entry.descriptor) {
    log::sfc()->debug("{} parse cache hit", file);
    return entry.descriptor;
  }

  auto descriptor = parse_uncached(file, source, diags);
  entry.descriptor = descriptor;
  cache_.set(file, std::move(entry));
  return descriptor;
}

std::shared_ptr<const Descriptor> SfcCompiler::parse_uncached(
  const std::string & file, std::string_view source, DiagnosticBag & diags)
{
  const auto start = Clock::now();
  auto parsed = toolchain_.parser.parse(source, file);
  parsed.descriptor.filename = file;
  parsed.descriptor.source = std::string(source);

  if (!parsed.errors.empty()) {
    const FileId id = file_id(parsed.descriptor);
    for (const auto & e : parsed.errors) {
      SourceRange range;
      if (e.start) {
        range = range_at(id, e.start->offset, e.end ? e.end->offset : e.start->offset);
      }
      diags.report_error(range, "SFC parse error: " + e.message)
        .with_code(diag_code::k_sfc_parse)
        .with_file(file);
    }
  }

  log::sfc()->debug("{} parsed in {}ms.", file, elapsed_ms(start));
  return std::make_shared<const Descriptor>(std::move(parsed.descriptor));
}

// ----------------------------------------------------------------------------
// Behavior section and wiring
// ----------------------------------------------------------------------------

std::shared_ptr<const ScriptArtifact> SfcCompiler::compile_main(
  const std::string & file, std::string_view source, DiagnosticBag & diags)
{
  const auto descriptor = parse(file, source, diags);

  auto entry = entry_for(file);
  if (entry.script) {
    log::sfc()->debug("{} script cache hit", file);
    return entry.script;
  }

  auto artifact = std::make_shared<ScriptArtifact>();
  std::string rewritten;
  if (descriptor->script) {
    artifact->code = transform_script(*descriptor, *descriptor->script, file, artifact->map, diags);

    rewritten = artifact->code;
    if (const auto at = rewritten.find("export default"); at != std::string::npos) {
      rewritten.replace(at, std::string_view("export default").size(), "const __script =");
    }
  } else {
    rewritten = "const __script = {}";
  }
  artifact->main = build_main(*descriptor, rewritten, file);

  entry = entry_for(file);
  entry.descriptor = descriptor;
  entry.script = artifact;
  cache_.set(file, std::move(entry));
  return artifact;
}

std::string SfcCompiler::transform_script(
  const Descriptor & desc, const Block & script, const std::string & file, std::string & map,
  DiagnosticBag & diags)
{
  map = script.map;
  if (script.lang.empty()) {
    return script.content;
  }

  ScriptTransform * transform = transforms_.find(script.lang);
  if (transform == nullptr) {
    diags
      .report_error(
        range_at(file_id(desc), script.content_offset, script.content_offset),
        fmt::format("no transform registered for <script lang=\"{}\">", script.lang))
      .with_code(diag_code::k_sfc_script_lang)
      .with_file(file);
    return script.content;
  }

  TransformOptions options = options_.transform;
  options.loader = script.lang;
  try {
    auto out = transform->transform(script.content, public_path(file), options);
    if (!out.map.empty()) {
      map = std::move(out.map);
    }
    return std::move(out.code);
  } catch (const TransformError & e) {
    const uint32_t at = script.content_offset + e.offset().value_or(0);
    diags.report_error(range_at(file_id(desc), at, at), e.what())
      .with_code(diag_code::k_transform_failed)
      .with_file(file);
    return script.content;
  }
}

std::string SfcCompiler::build_main(
  const Descriptor & desc, const std::string & script_code, const std::string & file) const
{
  const std::string public_path = this->public_path(file);
  const std::string id = hash_sum(public_path);

  std::string code = script_code;

  if (!desc.styles.empty()) {
    code += "\nimport { updateStyle } from " + json_quote(options_.hmr_client) + "\n";

    bool has_css_modules = false;
    for (size_t i = 0; i < desc.styles.size(); ++i) {
      const auto & style = desc.styles[i];
      const std::string request = public_path + "?type=style&index=" + std::to_string(i);

      if (style.is_module) {
        if (!has_css_modules) {
          code += "\nconst __cssModules = __script.__cssModules = {}";
          has_css_modules = true;
        }
        const std::string style_var = "__style" + std::to_string(i);
        code += "\nimport " + style_var + " from " + json_quote(request + "&module");
        code += "\n__cssModules[" + json_quote(style.effective_module_name()) + "] = " + style_var;
      }
      code += "\nupdateStyle(\"" + id + "-" + std::to_string(i) + "\", " + json_quote(request) + ")";
    }

    if (desc.has_scoped_style()) {
      code += "\n__script.__scopeId = \"data-v-" + id + "\"";
    }
  }

  if (desc.template_block) {
    code += "\nimport { render as __render } from " + json_quote(public_path + "?type=template");
    code += "\n__script.render = __render";
  }

  code += "\n__script.__hmrId = " + json_quote(public_path);
  code += "\n__script.__file = " + json_quote(file);
  code += "\nexport default __script";

  if (desc.script) {
    code += inline_source_map(desc.script->map);
  }
  return code;
}

// ----------------------------------------------------------------------------
// Template
// ----------------------------------------------------------------------------

std::shared_ptr<const TemplateArtifact> SfcCompiler::compile_template(
  const std::string & file, std::string_view source, DiagnosticBag & diags)
{
  const auto descriptor = parse(file, source, diags);
  if (!descriptor->template_block) {
    return nullptr;
  }

  auto entry = entry_for(file);
  const std::string public_path = this->public_path(file);
  if (entry.template_artifact) {
    log::sfc()->debug("{} template cache hit", public_path);
    return entry.template_artifact;
  }

  const auto start = Clock::now();
  const Block & block = *descriptor->template_block;

  TemplateRequest request;
  request.source = block.content;
  request.filename = file;
  request.in_map = block.map;
  request.asset_base = std::filesystem::path(public_path).parent_path().generic_string();
  if (descriptor->has_scoped_style()) {
    request.scope_id = scope_id_for(public_path);
  }
  request.runtime_module = options_.runtime_module;
  request.preprocess_lang = block.lang;
  request.preprocessor = preprocessor_locator();

  auto result = toolchain_.templates.compile(request);

  if (!result.errors.empty()) {
    const FileId id = file_id(*descriptor);
    for (const auto & e : result.errors) {
      SourceRange range;
      if (e.start) {
        range = range_at(
          id, block.content_offset + e.start->offset,
          block.content_offset + (e.end ? e.end->offset : e.start->offset));
      }
      diags.report_error(range, "SFC template compilation error: " + e.message)
        .with_code(diag_code::k_sfc_template)
        .with_file(file);
    }
  }

  auto artifact = std::make_shared<TemplateArtifact>();
  artifact->code = result.code + inline_source_map(result.map);
  artifact->map = std::move(result.map);

  entry = entry_for(file);
  entry.descriptor = descriptor;
  entry.template_artifact = artifact;
  cache_.set(file, std::move(entry));

  log::sfc()->debug("{} template compiled in {}ms.", public_path, elapsed_ms(start));
  return artifact;
}

// ----------------------------------------------------------------------------
// Styles
// ----------------------------------------------------------------------------

std::shared_ptr<const StyleArtifact> SfcCompiler::compile_style(
  const std::string & file, std::string_view source, size_t index, DiagnosticBag & diags)
{
  const auto descriptor = parse(file, source, diags);
  if (index >= descriptor->styles.size()) {
    return nullptr;
  }

  auto entry = entry_for(file);
  const std::string public_path = this->public_path(file);
  if (index < entry.styles.size() && entry.styles[index]) {
    log::sfc()->debug("{} style cache hit", public_path);
    return entry.styles[index];
  }

  const auto start = Clock::now();
  const StyleBlock & block = descriptor->styles[index];

  StyleRequest request;
  request.source = block.content;
  request.filename = file;
  request.id = scope_id_for(public_path);
  request.scoped = block.scoped;
  request.modules = block.is_module;
  request.preprocess_lang = block.lang;
  request.preprocessor = preprocessor_locator();
  request.config = style_config();

  auto result = toolchain_.styles.compile(request);
  if (!result.errors.empty()) {
    report_style_errors(*descriptor, block, result.errors, file, diags);
  }

  auto artifact = std::make_shared<StyleArtifact>();
  artifact->code = std::move(result.code);
  artifact->map = std::move(result.map);
  artifact->modules = std::move(result.modules);
  artifact->has_errors = !result.errors.empty();

  entry = entry_for(file);
  entry.descriptor = descriptor;
  if (entry.styles.size() < descriptor->styles.size()) {
    entry.styles.resize(descriptor->styles.size());
  }
  entry.styles[index] = artifact;
  cache_.set(file, std::move(entry));

  log::sfc()->debug("{} style compiled in {}ms", public_path, elapsed_ms(start));
  return artifact;
}

void SfcCompiler::report_style_errors(
  const Descriptor & desc, const StyleBlock & block, const std::vector<SfcError> & errors,
  const std::string & file, DiagnosticBag & diags)
{
  const FileId id = file_id(desc);
  const SourceFile * source_file = sources_.get_file(id);
  const uint32_t line_offset = block.start_line - 1;

  for (const auto & e : errors) {
    const std::string message = strip_filename_prefix(e.message, file);
    const bool located = e.start && e.start->line > 0 && e.start->column > 0;

    SourceRange range;
    if (located && message.find('\n') == std::string::npos && source_file != nullptr) {
      const uint32_t at = source_file->offset_of(e.start->line + line_offset, e.start->column);
      range = range_at(id, at, at);
    }

    auto builder = diags.report_error(range, "SFC style compilation error: " + message);
    builder.with_code(diag_code::k_sfc_style).with_file(file);
    if (located && !range.is_valid()) {
      builder.with_note(
        fmt::format("at {}:{}:{}", file, e.start->line + line_offset, e.start->column));
    }
  }
}

// ----------------------------------------------------------------------------
// Whole file
// ----------------------------------------------------------------------------

SfcOutput SfcCompiler::compile(
  const std::string & file, std::string_view source, DiagnosticBag & diags)
{
  SfcOutput out;
  out.descriptor = parse(file, source, diags);

  const auto script = compile_main(file, source, diags);
  out.main = script->main;
  out.result.script.code = script->code;
  out.result.script.map = script->map;

  const std::string public_path = this->public_path(file);
  if (out.descriptor->has_scoped_style()) {
    out.result.scope_id = scope_id_for(public_path);
  }

  if (const auto tmpl = compile_template(file, source, diags)) {
    out.result.template_output = SfcTemplateOutput{tmpl->code, tmpl->map};
  }

  const std::string id = hash_sum(public_path);
  for (size_t i = 0; i < out.descriptor->styles.size(); ++i) {
    const auto style = compile_style(file, source, i, diags);
    out.result.styles.push_back(SfcStyleOutput{style->code, style->map, style->modules});

    StyleHeader header;
    header.id = id + "-" + std::to_string(i);
    header.request = public_path + "?type=style&index=" + std::to_string(i);
    header.code = style->code;
    out.headers.push_back(std::move(header));
  }
  return out;
}

// ----------------------------------------------------------------------------
// Invalidation
// ----------------------------------------------------------------------------

RefreshSummary SfcCompiler::refresh(
  const std::string & file, std::string_view new_source, DiagnosticBag & diags)
{
  RefreshSummary summary;

  auto entry = entry_for(file);
  if (!entry.descriptor) {
    entry = CacheEntry{};
    entry.descriptor = parse_uncached(file, new_source, diags);
    cache_.set(file, std::move(entry));
    summary.fresh = true;
    return summary;
  }

  const auto old_desc = entry.descriptor;
  const auto new_desc = parse_uncached(file, new_source, diags);

  const bool wiring_changed = !same_wiring(*old_desc, *new_desc);
  if (old_desc->script != new_desc->script || wiring_changed) {
    summary.script = true;
    entry.script.reset();
  }
  if (old_desc->template_block != new_desc->template_block ||
      old_desc->has_scoped_style() != new_desc->has_scoped_style()) {
    summary.template_output = true;
    entry.template_artifact.reset();
  }

  entry.styles.resize(new_desc->styles.size());
  for (size_t i = 0; i < new_desc->styles.size(); ++i) {
    if (i >= old_desc->styles.size() || !same_style(old_desc->styles[i], new_desc->styles[i])) {
      summary.styles.push_back(i);
      entry.styles[i].reset();
    }
  }

  entry.descriptor = new_desc;
  cache_.set(file, std::move(entry));

  log::sfc()->debug(
    "{} refreshed (script: {}, template: {}, styles: {})", file, summary.script,
    summary.template_output, summary.styles.size());
  return summary;
}

// ----------------------------------------------------------------------------
// Collaborator hooks
// ----------------------------------------------------------------------------

const std::optional<StyleConfig> & SfcCompiler::style_config()
{
  if (options_.style_config || !options_.discover_style_config) {
    return options_.style_config;
  }
  if (!discovered_style_) {
    discovered_style_ = discover_style_config(options_.root);
  }
  return *discovered_style_;
}

PreprocessorLocator SfcCompiler::preprocessor_locator() const
{
  const auto node_modules = options_.root / "node_modules";
  return [node_modules](std::string_view package) -> std::optional<std::filesystem::path> {
    std::error_code ec;
    auto dir = node_modules / std::string(package);
    if (std::filesystem::is_directory(dir, ec)) {
      return dir;
    }
    return std::nullopt;
  };
}

std::optional<size_t> parse_style_index(std::string_view text)
{
  if (text.empty() || text.find_first_not_of("0123456789") != std::string_view::npos) {
    return std::nullopt;
  }
  size_t value = 0;
  const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace modgraph::sfc
