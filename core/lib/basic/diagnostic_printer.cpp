// modgraph/basic/diagnostic_printer.cpp - Code-frame diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "modgraph/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace modgraph
{

namespace
{

constexpr uint32_t k_tab_width = 4;

std::string expand_tabs(std::string_view line)
{
  std::string cleaned;
  cleaned.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      cleaned.append(k_tab_width, ' ');
    } else if (c != '\r' && c != '\n') {
      cleaned += c;
    }
  }
  return cleaned;
}

std::string_view severity_name(Severity s)
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
    case Severity::Hint:
      return "hint";
  }
  return "error";
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color, uint32_t context_lines)
: os_(os), use_color_(use_color), context_lines_(context_lines)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceRange primary_range = diag.primary_range();
  const FileId file_id = primary_range.file_id();

  std::string filename = diag.file.empty() ? std::string("<unknown>") : diag.file;
  if (file_id.is_valid()) {
    filename = display_path(sources.get_path(file_id));
  }
  const FullSourceRange primary_fr = sources.get_full_range(primary_range);

  print_severity_header(diag);

  if (primary_fr.is_valid()) {
    fmt::print(
      os_, "{} {}:{}:{}\n", gutter_arrow(), filename, primary_fr.start_line,
      primary_fr.start_column);
  } else if (file_id.is_valid() || !diag.file.empty()) {
    fmt::print(os_, "{} {}\n", gutter_arrow(), filename);
  }

  for (const auto & label : diag.labels) {
    print_code_frame(label, sources);
  }

  for (const auto & note : diag.notes) {
    print_trailer("note", note);
  }

  if (diag.help_message) {
    print_trailer("help", *diag.help_message);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.primary_range().get_begin() < b.primary_range().get_begin();
    });

  for (const auto & d : sorted_diags) {
    print(d, sources);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  const std::string_view name = severity_name(diag.severity);
  const std::string code = diag.code.empty() ? std::string() : fmt::format("[{}]", diag.code);

  if (!use_color_) {
    fmt::print(os_, "{}{}: {}\n", name, code, diag.message);
    return;
  }

  os_ << rang::style::bold;
  switch (diag.severity) {
    case Severity::Error:
      os_ << rang::fg::red;
      break;
    case Severity::Warning:
      os_ << rang::fg::yellow;
      break;
    case Severity::Info:
      os_ << rang::fg::cyan;
      break;
    case Severity::Hint:
      os_ << rang::fg::green;
      break;
  }
  os_ << name << code << rang::fg::reset << ": " << diag.message << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_code_frame(const Label & label, const SourceRegistry & sources)
{
  if (!label.range.is_valid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  const SourceFile * source = sources.get_file(label.range.file_id());
  if (source == nullptr) {
    return;
  }

  const FullSourceRange fr = source->get_full_range(label.range);
  if (!fr.is_valid()) {
    return;
  }

  const auto line_count = static_cast<uint32_t>(source->line_count());
  const uint32_t first = fr.start_line > context_lines_ ? fr.start_line - context_lines_ : 1;
  const uint32_t last = std::min(line_count, fr.end_line + context_lines_);

  fmt::print(os_, "{}\n", gutter_pipe());
  for (uint32_t line_num = first; line_num <= last; ++line_num) {
    const std::string_view line = source->get_line(line_num - 1);
    print_source_line(line_num, line);

    if (line_num < fr.start_line || line_num > fr.end_line) {
      continue;
    }

    // Columns covered on this line; multi-line spans underline to line end.
    const uint32_t line_end_col = static_cast<uint32_t>(line.size()) + 1;
    const uint32_t start_col = (line_num == fr.start_line) ? fr.start_column : 1;
    uint32_t end_col = (line_num == fr.end_line) ? fr.end_column : line_end_col;
    if (end_col <= start_col) {
      end_col = start_col + 1;
    }

    const bool last_marker = line_num == fr.end_line;
    print_marker_line(
      line, start_col, end_col, label.style, last_marker ? label.message : std::string_view{});
  }
  fmt::print(os_, "{}\n", gutter_pipe());
}

void DiagnosticPrinter::print_source_line(uint32_t line_num, std::string_view line)
{
  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", line_num);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", line_num);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));
}

void DiagnosticPrinter::print_marker_line(
  std::string_view line, uint32_t start_col, uint32_t end_col, LabelStyle style,
  std::string_view label_message)
{
  fmt::print(os_, "{} ", gutter_pipe());

  std::string marker_prefix;
  uint32_t visual_len = 0;
  for (uint32_t col = 1; col < end_col; ++col) {
    const size_t idx = col - 1;
    const uint32_t width = (idx < line.size() && line[idx] == '\t') ? k_tab_width : 1;
    if (col < start_col) {
      marker_prefix.append(width, ' ');
    } else {
      visual_len += width;
    }
  }

  const char marker_char = (style == LabelStyle::Primary) ? '^' : '-';
  const std::string markers(std::max<uint32_t>(visual_len, 1), marker_char);

  fmt::print(os_, "{}", marker_prefix);
  if (use_color_) {
    if (style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
  }
  fmt::print(os_, "{}", markers);
  if (!label_message.empty()) {
    fmt::print(os_, " {}", label_message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "   = " << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", kind, message);
  } else {
    fmt::print(os_, "   = {}: {}\n", kind, message);
  }
}

std::string DiagnosticPrinter::display_path(const fs::path & path) const
{
  std::error_code ec;
  const auto rel_path = fs::relative(path, fs::current_path(ec), ec);
  if (ec || rel_path.empty() || *rel_path.begin() == "..") {
    return path.generic_string();
  }
  return rel_path.generic_string();
}

// =============================================================================
// Gutter helpers
// =============================================================================

std::string DiagnosticPrinter::gutter_arrow() const
{
  if (use_color_) {
    return fmt::format("{}  -->{}", "\033[1;36m", "\033[0m");
  }
  return "  -->";
}

std::string DiagnosticPrinter::gutter_pipe() const
{
  if (use_color_) {
    return fmt::format("{}      |{}", "\033[1;36m", "\033[0m");
  }
  return "      |";
}

}  // namespace modgraph
