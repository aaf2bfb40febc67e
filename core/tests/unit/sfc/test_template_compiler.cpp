// tests/unit/sfc/test_template_compiler.cpp - Unit tests for the static-markup template compiler
//

#include <gtest/gtest.h>

#include "modgraph/sfc/raw_template_compiler.hpp"

using namespace modgraph;
using namespace modgraph::sfc;

namespace
{

TemplateRequest request_for(std::string source)
{
  TemplateRequest req;
  req.source = std::move(source);
  req.filename = "/proj/src/App.vue";
  req.asset_base = "/src";
  req.runtime_module = "/@modules/vue";
  return req;
}

}  // namespace

TEST(RawTemplateCompiler, ScopesElementsAndRebasesAssets)
{
  auto req = request_for("\n  <div class=\"a\"><img src=\"./logo.png\"></div>\n");
  req.scope_id = "data-v-x";

  RawTemplateCompiler compiler;
  const auto result = compiler.compile(req);

  ASSERT_TRUE(result.errors.empty());
  EXPECT_EQ(
    result.code,
    "import { createStaticVNode as _createStaticVNode } from \"/@modules/vue\"\n"
    "\n"
    "export function render(_ctx, _cache) {\n"
    "  return _createStaticVNode(\"<div data-v-x class=\\\"a\\\"><img data-v-x "
    "src=\\\"/src/logo.png\\\"></div>\", 1)\n"
    "}\n");
}

TEST(RawTemplateCompiler, UnscopedMarkupKeepsAttributes)
{
  auto req = request_for("<p>a</p><a href=\"https://x.dev/\">b</a>");

  RawTemplateCompiler compiler;
  const auto result = compiler.compile(req);

  ASSERT_TRUE(result.errors.empty());
  EXPECT_NE(
    result.code.find("_createStaticVNode(\"<p>a</p><a href=\\\"https://x.dev/\\\">b</a>\", 2)"),
    std::string::npos);
}

TEST(RawTemplateCompiler, PassesInputMapThrough)
{
  auto req = request_for("<p></p>");
  req.in_map = "{\"version\":3}";

  RawTemplateCompiler compiler;
  EXPECT_EQ(compiler.compile(req).map, "{\"version\":3}");
}

TEST(RawTemplateCompiler, ReportsUnbalancedElements)
{
  RawTemplateCompiler compiler;

  const auto unclosed = compiler.compile(request_for("<div><span></div>"));
  ASSERT_EQ(unclosed.errors.size(), 1U);
  EXPECT_EQ(unclosed.errors[0].message, "Element is missing end tag.");
  ASSERT_TRUE(unclosed.errors[0].start.has_value());
  EXPECT_EQ(unclosed.errors[0].start->offset, 5U);
  EXPECT_EQ(unclosed.errors[0].start->column, 6U);

  const auto stray = compiler.compile(request_for("<p></p>\n</p>"));
  ASSERT_EQ(stray.errors.size(), 1U);
  EXPECT_EQ(stray.errors[0].message, "Invalid end tag.");
  EXPECT_EQ(stray.errors[0].start->line, 2U);

  const auto eof = compiler.compile(request_for("<div"));
  ASSERT_EQ(eof.errors.size(), 1U);
  EXPECT_EQ(eof.errors[0].message, "Unexpected EOF in tag.");
}

TEST(RawTemplateCompiler, ReportsMissingPreprocessor)
{
  auto req = request_for("div hello");
  req.preprocess_lang = "pug";

  RawTemplateCompiler compiler;
  const auto result = compiler.compile(req);

  ASSERT_EQ(result.errors.size(), 1U);
  EXPECT_EQ(
    result.errors[0].message,
    "Component template requires preprocessor \"pug\", which is not installed.");
  EXPECT_FALSE(result.errors[0].start.has_value());
  EXPECT_FALSE(result.code.empty());
}

TEST(RawTemplateCompiler, LocatedPreprocessorIsStillUnsupported)
{
  auto req = request_for("<p></p>");
  req.preprocess_lang = "pug";
  req.preprocessor = [](std::string_view package) -> std::optional<std::filesystem::path> {
    return std::filesystem::path("/proj/node_modules") / std::string(package);
  };

  RawTemplateCompiler compiler;
  const auto result = compiler.compile(req);

  ASSERT_EQ(result.errors.size(), 1U);
  EXPECT_EQ(
    result.errors[0].message,
    "template preprocessor \"pug\" (/proj/node_modules/pug) is not supported; compiling as "
    "plain markup");
}
