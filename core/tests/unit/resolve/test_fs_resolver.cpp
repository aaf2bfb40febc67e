// tests/unit/resolve/test_fs_resolver.cpp - Unit tests for the filesystem resolver
//

#include <gtest/gtest.h>

#include <filesystem>

#include "modgraph/basic/errors.hpp"
#include "modgraph/resolve/module_resolver.hpp"
#include "support/temp_dir.hpp"

using namespace modgraph;
using modgraph::test_support::TempDir;

namespace
{

FsModuleResolver make_resolver(const TempDir & dir, std::vector<std::string> externals = {})
{
  FsResolverOptions options;
  options.root = dir.path;
  options.externals = std::move(externals);
  return FsModuleResolver(options);
}

}  // namespace

TEST(FsResolver, RelativeSpecifierTriesExtensions)
{
  TempDir dir("modgraph_resolver");
  const auto main = dir.write("src/main.js", "");
  const auto util = dir.write("src/util.ts", "");
  const auto comp = dir.write("src/components/Button.vue", "");

  auto resolver = make_resolver(dir);

  const auto a = resolver.resolve("./util", main);
  EXPECT_EQ(a.path, util);
  EXPECT_EQ(a.name, "/src/util.ts");
  EXPECT_FALSE(a.is_external);

  const auto b = resolver.resolve("./components/Button.vue", main);
  EXPECT_EQ(b.path, comp);
  EXPECT_EQ(b.name, "/src/components/Button.vue");
}

TEST(FsResolver, DirectoryIndexAndParentPaths)
{
  TempDir dir("modgraph_resolver");
  const auto index = dir.write("src/lib/index.js", "");
  const auto deep = dir.write("src/pages/home/Home.vue", "");

  auto resolver = make_resolver(dir);
  EXPECT_EQ(resolver.resolve("../../lib", deep).path, index);
}

TEST(FsResolver, AbsoluteSpecifierFallsBackToRoot)
{
  TempDir dir("modgraph_resolver");
  const auto main = dir.write("src/main.js", "");
  const auto app = dir.write("src/App.vue", "");

  auto resolver = make_resolver(dir);
  EXPECT_EQ(resolver.resolve("/src/App.vue", main).path, app);
  EXPECT_EQ(resolver.resolve(app, main).path, app);
}

TEST(FsResolver, BarePackages)
{
  TempDir dir("modgraph_resolver");
  const auto main = dir.write("src/main.js", "");
  dir.write("node_modules/lodash/package.json", "{}");
  dir.write("node_modules/@scope/pkg/package.json", "{}");

  auto resolver = make_resolver(dir, {"vue"});

  const auto vue = resolver.resolve("vue", main);
  EXPECT_TRUE(vue.is_external);
  EXPECT_EQ(vue.name, "vue");

  EXPECT_TRUE(resolver.resolve("lodash/merge", main).is_external);
  EXPECT_TRUE(resolver.resolve("@scope/pkg/sub", main).is_external);
  EXPECT_THROW((void)resolver.resolve("react", main), ResolutionError);
}

TEST(FsResolver, MissingImportThrowsButMissingEntryResolves)
{
  TempDir dir("modgraph_resolver");
  const auto main = dir.write("src/main.js", "");
  auto resolver = make_resolver(dir);

  try {
    (void)resolver.resolve("./nope", main);
    FAIL() << "expected ResolutionError";
  } catch (const ResolutionError & e) {
    EXPECT_EQ(e.specifier(), "./nope");
    EXPECT_EQ(e.importer(), main);
  }

  const auto entry = resolver.resolve("src/missing.js", "");
  EXPECT_EQ(entry.name, "/src/missing.js");
  EXPECT_FALSE(entry.is_external);
}

TEST(FsResolver, PackageHelpers)
{
  EXPECT_TRUE(FsModuleResolver::is_package_import("vue"));
  EXPECT_TRUE(FsModuleResolver::is_package_import("@scope/pkg"));
  EXPECT_FALSE(FsModuleResolver::is_package_import("./a"));
  EXPECT_FALSE(FsModuleResolver::is_package_import("../a"));
  EXPECT_FALSE(FsModuleResolver::is_package_import("/a"));

  EXPECT_EQ(FsModuleResolver::package_name("lodash/merge"), "lodash");
  EXPECT_EQ(FsModuleResolver::package_name("@scope/pkg/sub"), "@scope/pkg");
}

TEST(FsResolver, PublicPath)
{
  EXPECT_EQ(public_path_of("/proj/src/App.vue", "/proj"), "/src/App.vue");
  EXPECT_EQ(public_path_of("/elsewhere/x.js", "/proj"), "/elsewhere/x.js");
  EXPECT_EQ(public_path_of("/a/b.js", ""), "/a/b.js");
}
