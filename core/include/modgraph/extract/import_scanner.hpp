// modgraph/extract/import_scanner.hpp - Lexical ES-module import scanner
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "modgraph/extract/dependency_extractor.hpp"

namespace modgraph
{

/// One import found in module code, before resolution.
struct ImportRecord
{
  std::string specifier;

  /// Statement text, including a trailing ';' when present
  std::string statement;

  bool dynamic = false;

  /// Byte offset of the statement in the scanned code
  uint32_t offset = 0;
};

struct ScanResult
{
  std::vector<ImportRecord> imports;
  std::vector<std::string> exports;
};

/**
 * DependencyExtractor that scans module code lexically.
 *
 * Comments, string, template and regex literals are skipped, so import-like
 * text inside them is ignored. Recognised forms:
 *
 *   import x, { a as b } from "m"      import "m"       import("m")
 *   export { a, b as c } from "m"      export * from "m"
 *   export * as ns from "m"            export default ...
 *   export const|let|var|function|class <name>
 *
 * Dynamic imports whose argument is not a plain string literal are ignored.
 */
class ImportScanner : public DependencyExtractor
{
public:
  [[nodiscard]] static ScanResult scan(std::string_view code);

  [[nodiscard]] ExtractResult extract(
    std::string_view code, const std::string & importer, ModuleResolver & resolver) override;
};

}  // namespace modgraph
