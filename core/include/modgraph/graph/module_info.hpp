// modgraph/graph/module_info.hpp - Module identity and dependency edges
#pragma once

#include <string>

namespace modgraph
{

// ============================================================================
// Module Info
// ============================================================================

/**
 * Identity of a module as produced by a ModuleResolver.
 *
 * Immutable once produced for a given (specifier, importer) pair.
 */
struct ModuleInfo
{
  /// Canonical absolute path; the key of every cache
  std::string path;

  /// Display name (public path for project files, package name for externals)
  std::string name;

  /// Resolved outside the project tree; never recursed into
  bool is_external = false;

  [[nodiscard]] bool operator==(const ModuleInfo & other) const
  {
    return path == other.path && name == other.name && is_external == other.is_external;
  }
  [[nodiscard]] bool operator!=(const ModuleInfo & other) const { return !(*this == other); }
};

// ============================================================================
// Dependency Edge
// ============================================================================

struct DependencyEdge
{
  /// Specifier as written in the importing module
  std::string specifier;

  ModuleInfo module;

  /// Literal import/export/require statement text
  std::string statement;

  bool dynamic = false;
};

}  // namespace modgraph
