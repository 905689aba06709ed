// reactc/basic/diagnostic_printer.hpp
//
// Renders diagnostics for terminals: a Rust-style block with the offending
// source line, or a single compact line per diagnostic.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "reactc/basic/diagnostic.hpp"
#include "reactc/basic/source_manager.hpp"

namespace reactc
{

/**
 * Prints diagnostics in Rust-style format.
 *
 * Produces output like:
 *   warning[non-reactive-mutation]: Mutation of `items` will not update the UI: ...
 *       --> src/List.tsx:3:3
 *         |
 *       3 |   items.push(x);
 *         |   ^^^^^^^^^^^^^ method-call of a non-reactive binding
 *         |
 *         = fix: Declare `items` with `let` instead of `const` so ...
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceFile & source);

  /// Print every diagnostic ordered by source position.
  void print_all(const DiagnosticBag & diags, const SourceFile & source);

  /// `file:line:col: severity[code]: message` without source context.
  void print_compact(const Diagnostic & diag, std::string_view filename);

private:
  void print_severity_header(const Diagnostic & diag);
  void print_label(const Label & label, const SourceFile & source);
  void print_trailer(std::string_view kind, std::string_view message);

  [[nodiscard]] std::string display_name(const SourceFile & source) const;
  [[nodiscard]] std::string gutter(std::string_view tail) const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace reactc
