// tests/unit/support/temp_dir.hpp - Scoped temporary directory for filesystem tests
#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "modgraph/resolve/module_resolver.hpp"

namespace modgraph::test_support
{

struct TempDir
{
  std::filesystem::path path;

  explicit TempDir(const std::string & name)
  {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path = std::filesystem::temp_directory_path() / (name + "_" + std::to_string(stamp));
    std::filesystem::create_directories(path);
    path = std::filesystem::path(canonical_path_of(path));
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;

  /// Write `text` to `relative` (creating directories); returns its canonical path.
  std::string write(const std::string & relative, const std::string & text) const
  {
    const auto file = path / relative;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary);
    out << text;
    return canonical_path_of(file);
  }
};

}  // namespace modgraph::test_support
