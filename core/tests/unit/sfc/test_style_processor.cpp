// tests/unit/sfc/test_style_processor.cpp - Unit tests for selector scoping and CSS modules
//

#include <gtest/gtest.h>

#include "modgraph/sfc/basic_style_processor.hpp"

using namespace modgraph;
using namespace modgraph::sfc;

namespace
{

StyleRequest request_for(std::string source, std::string id)
{
  StyleRequest req;
  req.source = std::move(source);
  req.filename = "/src/App.vue";
  req.id = std::move(id);
  return req;
}

}  // namespace

TEST(BasicStyleProcessor, ScopesLastCompoundSelector)
{
  auto req = request_for(".a { color: red }\n.b:hover, .c > .d { x: y }\n", "data-v-123");
  req.scoped = true;

  BasicStyleProcessor processor;
  const auto result = processor.compile(req);

  ASSERT_TRUE(result.errors.empty());
  EXPECT_EQ(
    result.code,
    ".a[data-v-123] { color: red }\n.b[data-v-123]:hover, .c > .d[data-v-123] { x: y }\n");
  EXPECT_FALSE(result.modules.has_value());
}

TEST(BasicStyleProcessor, ScopesInsideMediaButNotKeyframes)
{
  const std::string css =
    "@media (min-width: 1px) {\n  .a { x: y }\n}\n@keyframes spin {\n  from { a: b }\n}\n";
  auto req = request_for(css, "data-v-1");
  req.scoped = true;

  BasicStyleProcessor processor;
  const auto result = processor.compile(req);

  ASSERT_TRUE(result.errors.empty());
  EXPECT_EQ(
    result.code,
    "@media (min-width: 1px) {\n  .a[data-v-1] { x: y }\n}\n@keyframes spin {\n  from { a: b }\n}\n");
}

TEST(BasicStyleProcessor, LeadingCommentStaysOutOfSelector)
{
  auto req = request_for("/* c */ .a {}", "data-v-1");
  req.scoped = true;

  BasicStyleProcessor processor;
  EXPECT_EQ(processor.compile(req).code, "/* c */ .a[data-v-1] {}");
}

TEST(BasicStyleProcessor, RenamesModuleClasses)
{
  auto req = request_for(".title { a: b }\n.title .sub {}", "data-v-abc");
  req.modules = true;

  BasicStyleProcessor processor;
  const auto result = processor.compile(req);

  ASSERT_TRUE(result.errors.empty());
  EXPECT_EQ(result.code, ".title_abc { a: b }\n.title_abc .sub_abc {}");
  ASSERT_TRUE(result.modules.has_value());
  EXPECT_EQ(result.modules->size(), 2U);
  EXPECT_EQ(result.modules->at("title"), "title_abc");
  EXPECT_EQ(result.modules->at("sub"), "sub_abc");
}

TEST(BasicStyleProcessor, ScopedNamePatternFromConfig)
{
  auto req = request_for(".btn {}", "data-v-abc");
  req.modules = true;
  StyleConfig config;
  config.options["generate_scoped_name"] = "[hash]__[local]";
  req.config = config;

  BasicStyleProcessor processor;
  const auto result = processor.compile(req);

  EXPECT_EQ(result.code, ".abc__btn {}");
  EXPECT_EQ(result.modules->at("btn"), "abc__btn");
}

TEST(BasicStyleProcessor, ReportsSyntaxErrorsWithFilenamePrefix)
{
  BasicStyleProcessor processor;

  const auto unclosed = processor.compile(request_for(".a {\n  x: y\n", "data-v-1"));
  ASSERT_EQ(unclosed.errors.size(), 1U);
  EXPECT_EQ(unclosed.errors[0].message, "/src/App.vue:1:4: Unclosed block");
  ASSERT_TRUE(unclosed.errors[0].start.has_value());
  EXPECT_EQ(unclosed.errors[0].start->line, 1U);
  EXPECT_EQ(unclosed.errors[0].start->column, 4U);

  const auto stray = processor.compile(request_for("}", "data-v-1"));
  ASSERT_EQ(stray.errors.size(), 1U);
  EXPECT_EQ(stray.errors[0].message, "/src/App.vue:1:1: Unexpected }");

  const auto comment = processor.compile(request_for(".a {}\n/* x", "data-v-1"));
  ASSERT_EQ(comment.errors.size(), 1U);
  EXPECT_EQ(comment.errors[0].message, "/src/App.vue:2:1: Unclosed comment");
}

TEST(BasicStyleProcessor, ReportsMissingPreprocessorPackage)
{
  auto req = request_for(".a {}", "data-v-1");
  req.preprocess_lang = "scss";

  BasicStyleProcessor processor;
  const auto result = processor.compile(req);

  ASSERT_EQ(result.errors.size(), 1U);
  EXPECT_EQ(
    result.errors[0].message, "Preprocessor dependency \"sass\" not found. Did you install it?");
  EXPECT_EQ(result.code, ".a {}");
}
