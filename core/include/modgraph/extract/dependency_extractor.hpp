// modgraph/extract/dependency_extractor.hpp - Import/export extraction
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "modgraph/graph/module_info.hpp"
#include "modgraph/resolve/module_resolver.hpp"

namespace modgraph
{

struct ExtractResult
{
  /// Edges in source order
  std::vector<DependencyEdge> dependencies;
  std::vector<std::string> exports;
};

class DependencyExtractor
{
public:
  virtual ~DependencyExtractor() = default;

  /**
   * Extract the imports and exported names of compiled module code.
   *
   * Every specifier is resolved through `resolver` with `importer` (the
   * canonical path of the module) as the importing file.
   *
   * @throws ResolutionError when a specifier cannot be resolved
   */
  [[nodiscard]] virtual ExtractResult extract(
    std::string_view code, const std::string & importer, ModuleResolver & resolver) = 0;
};

}  // namespace modgraph
