// tests/unit/driver/test_bundler.cpp - End-to-end tests of the bundler driver on a real tree
//

#include <gtest/gtest.h>

#include <filesystem>

#include "modgraph/driver/bundler.hpp"
#include "modgraph/driver/graph_json.hpp"
#include "support/temp_dir.hpp"

using namespace modgraph;
using modgraph::test_support::TempDir;

namespace
{

const std::string k_app =
  "<template>\n  <div class=\"app\"></div>\n</template>\n"
  "<script>\nexport default { name: 'App' }\n</script>\n"
  "<style scoped>\n.app {}\n</style>\n";

class BundlerTest : public ::testing::Test
{
protected:
  BundlerTest() : dir("modgraph_bundler")
  {
    main_js = dir.write("src/main.js", "import App from './App.vue'\nimport { h } from 'vue'\n");
    app_vue = dir.write("src/App.vue", k_app);
  }

  ProjectConfig config() const
  {
    ProjectConfig cfg;
    cfg.project_root = dir.path;
    cfg.externals = {"vue"};
    cfg.style = StyleConfig{};
    return cfg;
  }

  TempDir dir;
  std::string main_js;
  std::string app_vue;
};

}  // namespace

TEST_F(BundlerTest, BuildsGraphFromRelativeEntry)
{
  Bundler bundler(config());
  const auto result = bundler.build("src/main.js");

  ASSERT_TRUE(result.success);
  ASSERT_NE(result.entry, nullptr);
  EXPECT_TRUE(result.diagnostics.empty());

  ASSERT_EQ(result.modules.size(), 3U);
  EXPECT_EQ(result.modules[0].path, main_js);
  EXPECT_EQ(result.modules[0].name, "/src/main.js");
  EXPECT_EQ(result.modules[1].path, app_vue);
  EXPECT_EQ(result.modules[1].name, "/src/App.vue");
  EXPECT_TRUE(result.modules[2].is_external);
  EXPECT_EQ(result.modules[2].name, "vue");

  ASSERT_EQ(result.entry->styles.size(), 1U);
  EXPECT_EQ(result.entry->styles[0].id, "7ac74a55-0");
  EXPECT_EQ(bundler.graph().size(), 2U);
}

TEST_F(BundlerTest, ServesCompositeSubRequests)
{
  Bundler bundler(config());
  DiagnosticBag diags;

  const auto main = bundler.serve_main(app_vue, diags);
  ASSERT_TRUE(main.has_value());
  EXPECT_NE(main->find("const __script = { name: 'App' }"), std::string::npos);
  EXPECT_NE(main->find("__script.__scopeId = \"data-v-7ac74a55\""), std::string::npos);

  const auto tmpl = bundler.serve_template("src/App.vue", diags);
  ASSERT_TRUE(tmpl.has_value());
  EXPECT_NE(tmpl->find("<div data-v-7ac74a55 class=\\\"app\\\"></div>"), std::string::npos);

  const auto style = bundler.serve_style(app_vue, 0, diags);
  ASSERT_TRUE(style.has_value());
  EXPECT_EQ(*style, "\n.app[data-v-7ac74a55] {}\n");

  EXPECT_FALSE(bundler.serve_style(app_vue, 3, diags).has_value());
  EXPECT_TRUE(diags.empty());
  EXPECT_EQ(bundler.artifacts().size(), 1U);
}

TEST_F(BundlerTest, MissingCompositeFileReportsNotFound)
{
  Bundler bundler(config());
  DiagnosticBag diags;

  EXPECT_FALSE(bundler.serve_main("src/Gone.vue", diags).has_value());
  ASSERT_EQ(diags.count_code(diag_code::k_not_found), 1U);
  EXPECT_EQ(diags.all()[0].file, (dir.path / "src/Gone.vue").generic_string());
}

TEST_F(BundlerTest, ChangesAreInvisibleUntilInvalidated)
{
  Bundler bundler(config());
  DiagnosticBag diags;
  ASSERT_TRUE(bundler.build(main_js).success);

  std::string edited = k_app;
  edited.replace(edited.find(".app {}"), 7, ".app { color: red }");
  dir.write("src/App.vue", edited);

  EXPECT_EQ(*bundler.serve_style(app_vue, 0, diags), "\n.app[data-v-7ac74a55] {}\n");

  const auto summary = bundler.invalidate(app_vue, diags);
  EXPECT_FALSE(summary.fresh);
  EXPECT_FALSE(summary.script);
  EXPECT_FALSE(summary.template_output);
  EXPECT_EQ(summary.styles, std::vector<size_t>{0});
  EXPECT_EQ(bundler.graph().size(), 0U);

  EXPECT_EQ(
    *bundler.serve_style(app_vue, 0, diags), "\n.app[data-v-7ac74a55] { color: red }\n");

  const auto rebuilt = bundler.build(main_js);
  ASSERT_TRUE(rebuilt.success);
  EXPECT_EQ(rebuilt.entry->styles[0].code, "\n.app[data-v-7ac74a55] { color: red }\n");
  EXPECT_TRUE(diags.empty());
}

TEST_F(BundlerTest, InvalidatingPlainOrDeletedFiles)
{
  Bundler bundler(config());
  DiagnosticBag diags;
  ASSERT_TRUE(bundler.build(main_js).success);
  ASSERT_EQ(bundler.artifacts().size(), 1U);

  EXPECT_FALSE(bundler.invalidate(main_js, diags).any());
  EXPECT_EQ(bundler.graph().size(), 0U);
  EXPECT_EQ(bundler.artifacts().size(), 1U);

  std::filesystem::remove(app_vue);
  EXPECT_FALSE(bundler.invalidate(app_vue, diags).any());
  EXPECT_EQ(bundler.artifacts().size(), 0U);
  EXPECT_TRUE(diags.empty());
}

TEST_F(BundlerTest, UnresolvableImportIsReported)
{
  const std::string broken = dir.write("src/broken.js", "import './nope.js'\n");

  Bundler bundler(config());
  const auto result = bundler.build(broken);

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.entry, nullptr);
  ASSERT_EQ(result.diagnostics.count_code(diag_code::k_resolution), 1U);
  EXPECT_EQ(result.diagnostics.all()[0].file, broken);
  EXPECT_EQ(result.diagnostics.all()[0].message, "cannot resolve './nope.js' from '" + broken + "'");
}

TEST_F(BundlerTest, BuildProjectUsesEntryPoints)
{
  {
    Bundler bundler(config());
    const auto results = bundler.build_project();
    ASSERT_EQ(results.size(), 1U);
    EXPECT_FALSE(results[0].success);
    EXPECT_TRUE(results[0].diagnostics.has_errors());
  }

  auto cfg = config();
  cfg.build.entry_points = {"src/main.js"};
  Bundler bundler(cfg);
  const auto results = bundler.build_project();
  ASSERT_EQ(results.size(), 1U);
  EXPECT_TRUE(results[0].success);
}

TEST_F(BundlerTest, TransformAliasesFromConfig)
{
  const std::string cjs = dir.write("src/legacy.cjs", "export const x = 1\n");

  auto cfg = config();
  cfg.transform_aliases = {{"cjs", "js"}};
  Bundler bundler(cfg);

  const auto result = bundler.build(cjs);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.entry->code, std::optional<std::string>("export const x = 1\n"));
}

TEST_F(BundlerTest, BuildResultJson)
{
  Bundler bundler(config());
  const auto result = bundler.build(main_js);
  const auto j = to_json(result);

  EXPECT_TRUE(j["success"].get<bool>());
  EXPECT_TRUE(j["diagnostics"].empty());
  ASSERT_EQ(j["modules"].size(), 3U);
  EXPECT_EQ(j["modules"][2]["external"], true);

  const auto & entry = j["entry"];
  EXPECT_EQ(entry["name"], "main.js");
  EXPECT_EQ(entry["extension"], "js");
  EXPECT_EQ(entry["module"]["path"], main_js);
  EXPECT_FALSE(entry.contains("sfc"));
  ASSERT_EQ(entry["dependencies"].size(), 2U);
  EXPECT_EQ(entry["dependencies"][0]["specifier"], "./App.vue");
  EXPECT_EQ(entry["fullDependencies"].size(), 2U);
  EXPECT_EQ(entry["styles"][0]["id"], "7ac74a55-0");
  EXPECT_TRUE(entry["cyclic"].empty());

  const auto app = to_json(*bundler.graph().get(app_vue));
  EXPECT_EQ(app["sfc"]["scopeId"], "data-v-7ac74a55");
  EXPECT_EQ(app["sfc"]["styles"].size(), 1U);
}
