// tests/unit/sfc/test_sfc_compiler.cpp - Unit tests for the composite-component compiler
//

#include <gtest/gtest.h>

#include <memory>

#include "modgraph/basic/diagnostic.hpp"
#include "modgraph/sfc/sfc_compiler.hpp"
#include "support/fakes.hpp"

using namespace modgraph;
using namespace modgraph::sfc;
using modgraph::test_support::CountingToolchain;
using modgraph::test_support::CountingTransform;

namespace
{

const std::string k_file = "/proj/src/App.vue";

const std::string k_app =
  "<template>\n"
  "  <div class=\"app\"><img src=\"./logo.png\"></div>\n"
  "</template>\n"
  "<script>\n"
  "export default { name: 'App' }\n"
  "</script>\n"
  "<style scoped>\n"
  ".app { color: red }\n"
  "</style>\n";

class SfcCompilerTest : public ::testing::Test
{
protected:
  SfcCompilerTest() : compiler(tools.toolchain(), transforms, artifacts, sources, options()) {}

  static SfcOptions options()
  {
    SfcOptions opts;
    opts.root = "/proj";
    opts.discover_style_config = false;
    return opts;
  }

  CountingToolchain tools;
  TransformRegistry transforms;
  ArtifactCache artifacts;
  SourceRegistry sources;
  SfcCompiler compiler;
  DiagnosticBag diags;
};

}  // namespace

TEST_F(SfcCompilerTest, PublicPathIsRootRelative)
{
  EXPECT_EQ(compiler.public_path(k_file), "/src/App.vue");
}

TEST_F(SfcCompilerTest, CompilesScriptTemplateAndScopedStyle)
{
  const auto out = compiler.compile(k_file, k_app, diags);
  ASSERT_TRUE(diags.empty());

  EXPECT_EQ(out.result.script.code, "\nexport default { name: 'App' }\n");
  EXPECT_EQ(out.main.rfind("\nconst __script = { name: 'App' }\n", 0), 0U);
  EXPECT_NE(out.main.find("\nimport { updateStyle } from \"/vite/hmr\"\n"), std::string::npos);
  EXPECT_NE(
    out.main.find("\nupdateStyle(\"7ac74a55-0\", \"/src/App.vue?type=style&index=0\")"),
    std::string::npos);
  EXPECT_NE(out.main.find("\n__script.__scopeId = \"data-v-7ac74a55\""), std::string::npos);
  EXPECT_NE(
    out.main.find("\nimport { render as __render } from \"/src/App.vue?type=template\"\n"
                  "__script.render = __render"),
    std::string::npos);
  EXPECT_NE(out.main.find("\n__script.__hmrId = \"/src/App.vue\""), std::string::npos);
  EXPECT_NE(
    out.main.find("\n__script.__file = \"/proj/src/App.vue\"\nexport default __script\n"
                  "//# sourceMappingURL=data:application/json;base64,"),
    std::string::npos);
  EXPECT_EQ(out.main.find("__cssModules"), std::string::npos);

  ASSERT_TRUE(out.result.scope_id.has_value());
  EXPECT_EQ(*out.result.scope_id, "data-v-7ac74a55");

  EXPECT_EQ(tools.templates.last_request.scope_id, std::optional<std::string>("data-v-7ac74a55"));
  EXPECT_EQ(tools.templates.last_request.asset_base, "/src");
  EXPECT_NE(out.result.template_output.code.find("data-v-7ac74a55"), std::string::npos);
  EXPECT_NE(out.result.template_output.code.find("/src/logo.png"), std::string::npos);

  ASSERT_EQ(out.result.styles.size(), 1U);
  EXPECT_EQ(out.result.styles[0].code, "\n.app[data-v-7ac74a55] { color: red }\n");
  ASSERT_EQ(out.headers.size(), 1U);
  EXPECT_EQ(out.headers[0].id, "7ac74a55-0");
  EXPECT_EQ(out.headers[0].request, "/src/App.vue?type=style&index=0");
  EXPECT_EQ(out.headers[0].code, out.result.styles[0].code);
}

TEST_F(SfcCompilerTest, ModuleStyleWithoutScript)
{
  const std::string source = "<style module=\"theme\">\n.a {}\n</style>\n";

  const auto main = compiler.compile_main(k_file, source, diags);
  ASSERT_TRUE(diags.empty());
  EXPECT_EQ(
    main->main,
    "const __script = {}\n"
    "import { updateStyle } from \"/vite/hmr\"\n"
    "\n"
    "const __cssModules = __script.__cssModules = {}\n"
    "import __style0 from \"/src/App.vue?type=style&index=0&module\"\n"
    "__cssModules[\"theme\"] = __style0\n"
    "updateStyle(\"7ac74a55-0\", \"/src/App.vue?type=style&index=0\")\n"
    "__script.__hmrId = \"/src/App.vue\"\n"
    "__script.__file = \"/proj/src/App.vue\"\n"
    "export default __script");

  const auto style = compiler.compile_style(k_file, source, 0, diags);
  ASSERT_NE(style, nullptr);
  ASSERT_TRUE(style->modules.has_value());
  EXPECT_EQ(style->modules->at("a"), "a_7ac74a55");
  EXPECT_FALSE(style->has_errors);
}

TEST_F(SfcCompilerTest, MissingBlocksAndOutOfRangeStyles)
{
  const std::string source = "<script>export default {}</script>";
  EXPECT_EQ(compiler.compile_template(k_file, source, diags), nullptr);
  EXPECT_EQ(compiler.compile_style(k_file, source, 0, diags), nullptr);
  EXPECT_EQ(tools.templates.calls, 0);
  EXPECT_EQ(tools.styles.calls, 0);
  EXPECT_TRUE(diags.empty());
}

TEST_F(SfcCompilerTest, RepeatedCompileHitsCache)
{
  const auto first = compiler.compile(k_file, k_app, diags);
  const auto second = compiler.compile(k_file, k_app, diags);

  EXPECT_EQ(tools.parser.calls, 1);
  EXPECT_EQ(tools.templates.calls, 1);
  EXPECT_EQ(tools.styles.calls, 1);
  EXPECT_EQ(first.main, second.main);
  EXPECT_EQ(first.descriptor, second.descriptor);
  EXPECT_EQ(artifacts.size(), 1U);
}

TEST_F(SfcCompilerTest, RefreshOfUnknownFileIsFresh)
{
  const auto summary = compiler.refresh(k_file, k_app, diags);
  EXPECT_TRUE(summary.fresh);
  EXPECT_TRUE(summary.any());
  EXPECT_EQ(tools.parser.calls, 1);

  // The refreshed descriptor is reused by the next compile.
  (void)compiler.compile(k_file, k_app, diags);
  EXPECT_EQ(tools.parser.calls, 1);
}

TEST_F(SfcCompilerTest, StyleOnlyChangeKeepsScriptAndTemplate)
{
  (void)compiler.compile(k_file, k_app, diags);
  const auto script_before = compiler.compile_main(k_file, k_app, diags);
  const auto template_before = compiler.compile_template(k_file, k_app, diags);

  std::string edited = k_app;
  edited.replace(edited.find("color: red"), 10, "color: blue");

  const auto summary = compiler.refresh(k_file, edited, diags);
  EXPECT_FALSE(summary.fresh);
  EXPECT_FALSE(summary.script);
  EXPECT_FALSE(summary.template_output);
  EXPECT_EQ(summary.styles, std::vector<size_t>{0});

  const auto out = compiler.compile(k_file, edited, diags);
  EXPECT_EQ(compiler.compile_main(k_file, edited, diags), script_before);
  EXPECT_EQ(compiler.compile_template(k_file, edited, diags), template_before);
  EXPECT_EQ(tools.templates.calls, 1);
  EXPECT_EQ(tools.styles.calls, 2);
  EXPECT_EQ(out.result.styles[0].code, "\n.app[data-v-7ac74a55] { color: blue }\n");
  EXPECT_TRUE(diags.empty());
}

TEST_F(SfcCompilerTest, ScriptChangeDropsOnlyScript)
{
  (void)compiler.compile(k_file, k_app, diags);

  std::string edited = k_app;
  edited.replace(edited.find("'App'"), 5, "'Root'");

  const auto summary = compiler.refresh(k_file, edited, diags);
  EXPECT_TRUE(summary.script);
  EXPECT_FALSE(summary.template_output);
  EXPECT_TRUE(summary.styles.empty());

  const auto main = compiler.compile_main(k_file, edited, diags);
  EXPECT_NE(main->main.find("{ name: 'Root' }"), std::string::npos);
}

TEST_F(SfcCompilerTest, ScopedToggleRewiresScriptAndTemplate)
{
  (void)compiler.compile(k_file, k_app, diags);

  std::string edited = k_app;
  edited.replace(edited.find("<style scoped>"), 14, "<style>");

  const auto summary = compiler.refresh(k_file, edited, diags);
  EXPECT_TRUE(summary.script);
  EXPECT_TRUE(summary.template_output);
  EXPECT_EQ(summary.styles, std::vector<size_t>{0});

  const auto out = compiler.compile(k_file, edited, diags);
  EXPECT_FALSE(out.result.scope_id.has_value());
  EXPECT_EQ(out.main.find("__scopeId"), std::string::npos);
  EXPECT_FALSE(tools.templates.last_request.scope_id.has_value());
}

TEST_F(SfcCompilerTest, InvalidateDropsEverything)
{
  (void)compiler.compile(k_file, k_app, diags);
  EXPECT_TRUE(compiler.invalidate(k_file));
  EXPECT_FALSE(compiler.invalidate(k_file));

  (void)compiler.compile(k_file, k_app, diags);
  EXPECT_EQ(tools.parser.calls, 2);
  EXPECT_EQ(tools.templates.calls, 2);
}

TEST_F(SfcCompilerTest, StyleErrorIsRemappedIntoFile)
{
  const std::string source = "<template><p></p></template>\n<style>\n.a {\n</style>\n";

  const auto style = compiler.compile_style(k_file, source, 0, diags);
  ASSERT_NE(style, nullptr);
  EXPECT_TRUE(style->has_errors);

  ASSERT_EQ(diags.size(), 1U);
  const auto & d = diags.all()[0];
  EXPECT_EQ(d.code, diag_code::k_sfc_style);
  EXPECT_EQ(d.message, "SFC style compilation error: Unclosed block");
  EXPECT_EQ(d.file, k_file);

  const SourceRange range = d.primary_range();
  ASSERT_TRUE(range.is_valid());
  EXPECT_EQ(range.get_begin().offset(), source.find(".a {") + 3);
  const auto lc = sources.get_line_column(range.get_begin());
  EXPECT_EQ(lc.line, 3U);
  EXPECT_EQ(lc.column, 4U);
}

TEST_F(SfcCompilerTest, TemplateErrorIsRemappedIntoFile)
{
  const std::string source = "<template>\n  <div>\n</template>";

  const auto tmpl = compiler.compile_template(k_file, source, diags);
  ASSERT_NE(tmpl, nullptr);

  ASSERT_EQ(diags.size(), 1U);
  const auto & d = diags.all()[0];
  EXPECT_EQ(d.code, diag_code::k_sfc_template);
  EXPECT_EQ(d.message, "SFC template compilation error: Element is missing end tag.");
  EXPECT_EQ(d.file, k_file);

  const SourceRange range = d.primary_range();
  ASSERT_TRUE(range.is_valid());
  EXPECT_EQ(range.get_begin().offset(), source.find("<div>"));
  EXPECT_EQ(range.get_end().offset(), source.find("<div>") + 4);
  const auto lc = sources.get_line_column(range.get_begin());
  EXPECT_EQ(lc.line, 2U);
  EXPECT_EQ(lc.column, 3U);
}

TEST_F(SfcCompilerTest, ParseErrorsAreReported)
{
  const std::string source = "</div>\n<script>export default {}</script>\n";
  const auto main = compiler.compile_main(k_file, source, diags);

  ASSERT_EQ(diags.count_code(diag_code::k_sfc_parse), 1U);
  EXPECT_EQ(diags.all()[0].message, "SFC parse error: Invalid end tag.");
  EXPECT_NE(main->main.find("const __script = {}"), std::string::npos);
}

TEST_F(SfcCompilerTest, UnknownScriptLangIsReported)
{
  const std::string source = "<script lang=\"coffee\">export default {}</script>";
  const auto main = compiler.compile_main(k_file, source, diags);

  ASSERT_EQ(diags.count_code(diag_code::k_sfc_script_lang), 1U);
  EXPECT_EQ(diags.all()[0].message, "no transform registered for <script lang=\"coffee\">");
  EXPECT_EQ(main->code, "export default {}");
}

TEST_F(SfcCompilerTest, ScriptTransformReceivesLangAsLoader)
{
  auto ts = std::make_shared<CountingTransform>();
  transforms.add("ts", ts);

  const std::string source = "<script lang=\"ts\">export default {}</script>";
  (void)compiler.compile_main(k_file, source, diags);

  EXPECT_TRUE(diags.empty());
  EXPECT_EQ(ts->calls, 1);
  EXPECT_EQ(ts->last_loader, "ts");
}

TEST_F(SfcCompilerTest, ScriptTransformErrorPointsIntoFile)
{
  transforms.add("ts", std::make_shared<CountingTransform>());

  const std::string source = "<script lang=\"ts\">\nconst a = @@error\n</script>";
  (void)compiler.compile_main(k_file, source, diags);

  ASSERT_EQ(diags.count_code(diag_code::k_transform_failed), 1U);
  const SourceRange range = diags.all()[0].primary_range();
  ASSERT_TRUE(range.is_valid());
  EXPECT_EQ(range.get_begin().offset(), source.find("@@error"));
}

TEST(StripFilenamePrefix, RemovesLocationPrefix)
{
  EXPECT_EQ(
    strip_filename_prefix("/proj/src/App.vue:3:4: Unclosed block", "/proj/src/App.vue"),
    "Unclosed block");
  EXPECT_EQ(
    strip_filename_prefix("Error\n/x/App.vue:1:2: bad\nmore", "/proj/src/App.vue"),
    "Error\nbad\nmore");
  EXPECT_EQ(strip_filename_prefix("plain message", "/proj/src/App.vue"), "plain message");
}

TEST(StyleIndex, ParsesDecimalIndices)
{
  EXPECT_EQ(parse_style_index("0"), std::optional<size_t>(0));
  EXPECT_EQ(parse_style_index("12"), std::optional<size_t>(12));
}

TEST(StyleIndex, RejectsMalformedAndOversizedValues)
{
  EXPECT_EQ(parse_style_index(""), std::nullopt);
  EXPECT_EQ(parse_style_index("1a"), std::nullopt);
  EXPECT_EQ(parse_style_index("-1"), std::nullopt);
  EXPECT_EQ(parse_style_index("+1"), std::nullopt);
  EXPECT_EQ(parse_style_index("99999999999999999999999"), std::nullopt);
}
