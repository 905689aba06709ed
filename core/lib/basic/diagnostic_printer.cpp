// reactc/basic/diagnostic_printer.cpp - Terminal diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "reactc/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <vector>

namespace reactc
{

namespace
{

constexpr uint32_t k_tab_width = 4;

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out.append(k_tab_width, ' ');
    } else if (c != '\r') {
      out += c;
    }
  }
  return out;
}

/// Visual width of the first `count` bytes of a line after tab expansion.
uint32_t visual_width(std::string_view line, uint32_t count)
{
  uint32_t width = 0;
  for (uint32_t i = 0; i < count && i < line.size(); ++i) {
    width += line[i] == '\t' ? k_tab_width : 1;
  }
  return width;
}

rang::fg severity_color(Severity s)
{
  switch (s) {
    case Severity::Error:
      return rang::fg::red;
    case Severity::Warning:
      return rang::fg::yellow;
    case Severity::Info:
      return rang::fg::cyan;
  }
  return rang::fg::reset;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFile & source)
{
  print_severity_header(diag);

  LineColumn lc = diag.location;
  if (!lc.is_valid() && diag.primary_range().is_valid()) {
    lc = source.get_line_column(diag.primary_range().start);
  }

  const std::string filename = display_name(source);
  if (lc.is_valid()) {
    fmt::print(os_, "{} {}:{}:{}\n", gutter("-->"), filename, lc.line, lc.column);
  } else {
    fmt::print(os_, "{} {}\n", gutter("-->"), filename);
  }
  fmt::print(os_, "{}\n", gutter("|"));

  for (const auto & label : diag.labels) {
    print_label(label, source);
  }

  if (diag.fix) {
    print_trailer("fix", *diag.fix);
  }

  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceFile & source)
{
  std::vector<const Diagnostic *> sorted;
  sorted.reserve(diags.size());
  for (const auto & d : diags) {
    sorted.push_back(&d);
  }

  std::stable_sort(sorted.begin(), sorted.end(), [](const Diagnostic * a, const Diagnostic * b) {
    return a->primary_range().start < b->primary_range().start;
  });

  for (const auto * d : sorted) {
    print(*d, source);
  }
}

void DiagnosticPrinter::print_compact(const Diagnostic & diag, std::string_view filename)
{
  fmt::print(os_, "{}", filename);
  if (diag.location.is_valid()) {
    fmt::print(os_, ":{}:{}", diag.location.line, diag.location.column);
  }
  fmt::print(os_, ": {}", to_string(diag.severity));
  if (!diag.code.empty()) {
    fmt::print(os_, "[{}]", diag.code);
  }
  fmt::print(os_, ": {}\n", diag.message);
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_severity_header(const Diagnostic & diag)
{
  std::string head(to_string(diag.severity));
  if (!diag.code.empty()) {
    head += fmt::format("[{}]", diag.code);
  }

  if (use_color_) {
    os_ << rang::style::bold << severity_color(diag.severity) << head << rang::fg::reset << ": "
        << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}: {}\n", head, diag.message);
  }
}

void DiagnosticPrinter::print_label(const Label & label, const SourceFile & source)
{
  if (!label.range.is_valid()) {
    if (!label.message.empty()) {
      print_trailer("note", label.message);
    }
    return;
  }

  const LineColumn begin = source.get_line_column(label.range.start);
  const LineColumn end = source.get_line_column(label.range.end);
  if (!begin.is_valid()) {
    return;
  }

  const std::string_view line = source.get_line(begin.line - 1);
  if (line.empty()) {
    return;
  }

  // Multi-line ranges are underlined to the end of their first line.
  const uint32_t last_col =
    end.line == begin.line ? std::max(end.column, begin.column + 1)
                           : static_cast<uint32_t>(line.size()) + 1;
  const uint32_t pad = visual_width(line, begin.column - 1);
  const uint32_t width =
    std::max<uint32_t>(1, visual_width(line, last_col - 1) - visual_width(line, begin.column - 1));
  const char marker = label.style == LabelStyle::Primary ? '^' : '-';

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", begin.line);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", begin.line);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));

  fmt::print(os_, "{} {}", gutter("|"), std::string(pad, ' '));
  if (use_color_) {
    os_ << (label.style == LabelStyle::Primary ? rang::fg::red : rang::fg::cyan)
        << rang::style::bold;
  }
  fmt::print(os_, "{}", std::string(width, marker));
  if (!label.message.empty()) {
    fmt::print(os_, " {}", label.message);
  }
  if (use_color_) {
    os_ << rang::style::reset << rang::fg::reset;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_trailer(std::string_view kind, std::string_view message)
{
  fmt::print(os_, "{}\n", gutter("|"));
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "{}: {}\n", kind, message);
  } else {
    fmt::print(os_, "      = {}: {}\n", kind, message);
  }
}

std::string DiagnosticPrinter::display_name(const SourceFile & source) const
{
  if (source.path().empty()) {
    return "<input>";
  }
  std::error_code ec;
  const auto rel = std::filesystem::relative(source.path(), std::filesystem::current_path(), ec);
  if (ec || rel.empty()) {
    return source.path().string();
  }
  return rel.string();
}

std::string DiagnosticPrinter::gutter(std::string_view tail) const
{
  // Right-align the tail under the line-number column.
  std::string text = fmt::format("{:>7}", tail);
  if (use_color_) {
    return fmt::format("\033[1;36m{}\033[0m", text);
  }
  return text;
}

}  // namespace reactc
