// tests/unit/sfc/test_block_parser.cpp - Unit tests for the composite-file block splitter
//

#include <gtest/gtest.h>

#include "modgraph/sfc/block_parser.hpp"

using namespace modgraph;
using namespace modgraph::sfc;

namespace
{

const std::string k_app =
  "<template>\n"
  "  <div>hi</div>\n"
  "</template>\n"
  "\n"
  "<script>\n"
  "export default { name: 'App' }\n"
  "</script>\n"
  "\n"
  "<style scoped>\n"
  ".a { color: red }\n"
  "</style>\n"
  "<style module=\"theme\" lang=\"css\">\n"
  ".b {}\n"
  "</style>\n"
  "<docs>ignored</docs>\n";

}  // namespace

TEST(BlockParser, SplitsTopLevelBlocks)
{
  BlockParser parser;
  const auto result = parser.parse(k_app, "/src/App.vue");
  ASSERT_TRUE(result.errors.empty());

  const auto & desc = result.descriptor;
  ASSERT_TRUE(desc.template_block.has_value());
  EXPECT_EQ(desc.template_block->content, "\n  <div>hi</div>\n");

  ASSERT_TRUE(desc.script.has_value());
  EXPECT_EQ(desc.script->content, "\nexport default { name: 'App' }\n");
  EXPECT_EQ(desc.script->content_offset, k_app.find("\nexport default"));
  EXPECT_EQ(desc.script->start_line, 5U);
  EXPECT_TRUE(desc.script->lang.empty());
  EXPECT_FALSE(desc.script->map.empty());

  ASSERT_EQ(desc.styles.size(), 2U);
  EXPECT_TRUE(desc.styles[0].scoped);
  EXPECT_FALSE(desc.styles[0].is_module);
  EXPECT_EQ(desc.styles[0].content, "\n.a { color: red }\n");
  EXPECT_TRUE(desc.styles[0].map.empty());

  EXPECT_FALSE(desc.styles[1].scoped);
  EXPECT_TRUE(desc.styles[1].is_module);
  EXPECT_EQ(desc.styles[1].effective_module_name(), "theme");
  EXPECT_EQ(desc.styles[1].lang, "css");
  EXPECT_TRUE(desc.has_scoped_style());
}

TEST(BlockParser, BareModuleAttributeUsesDefaultName)
{
  BlockParser parser;
  const auto result = parser.parse("<style module>.x {}</style>", "/a.vue");
  ASSERT_EQ(result.descriptor.styles.size(), 1U);
  EXPECT_TRUE(result.descriptor.styles[0].is_module);
  EXPECT_EQ(result.descriptor.styles[0].effective_module_name(), "$style");
}

TEST(BlockParser, NestedTemplateElements)
{
  BlockParser parser;
  const auto result =
    parser.parse("<template><template v-if=\"x\">a</template><b/></template>", "/a.vue");
  ASSERT_TRUE(result.errors.empty());
  ASSERT_TRUE(result.descriptor.template_block.has_value());
  EXPECT_EQ(result.descriptor.template_block->content, "<template v-if=\"x\">a</template><b/>");
}

TEST(BlockParser, DuplicateScriptKeepsFirst)
{
  BlockParser parser;
  const auto result =
    parser.parse("<script>const a = 1</script>\n<script>const b = 2</script>\n", "/a.vue");

  ASSERT_EQ(result.errors.size(), 1U);
  EXPECT_EQ(
    result.errors[0].message, "Single file component can contain only one <script> element");
  ASSERT_TRUE(result.errors[0].start.has_value());
  EXPECT_EQ(result.errors[0].start->line, 2U);
  ASSERT_TRUE(result.descriptor.script.has_value());
  EXPECT_EQ(result.descriptor.script->content, "const a = 1");
}

TEST(BlockParser, MissingEndTagDropsBlock)
{
  BlockParser parser;
  const auto result = parser.parse("<style>.a {}</style>\n<template><div></div>\n", "/a.vue");

  ASSERT_EQ(result.errors.size(), 1U);
  EXPECT_EQ(result.errors[0].message, "Element is missing end tag.");
  EXPECT_FALSE(result.descriptor.template_block.has_value());
  EXPECT_EQ(result.descriptor.styles.size(), 1U);
}

TEST(BlockParser, StrayEndTagAndEofInTag)
{
  BlockParser parser;

  const auto stray = parser.parse("</div>\n<script>x</script>", "/a.vue");
  ASSERT_EQ(stray.errors.size(), 1U);
  EXPECT_EQ(stray.errors[0].message, "Invalid end tag.");
  EXPECT_TRUE(stray.descriptor.script.has_value());

  const auto eof = parser.parse("<script lang=\"ts\"", "/a.vue");
  ASSERT_EQ(eof.errors.size(), 1U);
  EXPECT_EQ(eof.errors[0].message, "Unexpected EOF in tag.");
}
