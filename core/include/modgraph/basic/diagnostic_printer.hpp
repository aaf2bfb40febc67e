// modgraph/basic/diagnostic_printer.hpp
//
// Prints diagnostics with a code frame around the failing span.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "modgraph/basic/diagnostic.hpp"
#include "modgraph/basic/source_manager.hpp"

namespace modgraph
{

/**
 * Prints diagnostics in Rust-style format with surrounding context lines.
 *
 * Produces output like:
 *   error[SFC003]: Unclosed block
 *     --> src/App.vue:12:3
 *      |
 *   10 | <style scoped>
 *   11 | .a {
 *   12 |   color: red
 *      |   ^
 *   13 | </style>
 *      |
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors
   * @param context_lines Lines printed before and after the labelled span
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true, uint32_t context_lines = 2);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print all diagnostics ordered by file and position.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_severity_header(const Diagnostic & diag);

  void print_code_frame(const Label & label, const SourceRegistry & sources);

  void print_source_line(uint32_t line_num, std::string_view line);
  void print_marker_line(
    std::string_view line, uint32_t start_col, uint32_t end_col, LabelStyle style,
    std::string_view label_message);

  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string display_path(const fs::path & path) const;

  [[nodiscard]] std::string gutter_arrow() const;
  [[nodiscard]] std::string gutter_pipe() const;

  std::ostream & os_;
  bool use_color_;
  uint32_t context_lines_;
};

}  // namespace modgraph
