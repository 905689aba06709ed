// reactc/basic/diagnostic.hpp - Diagnostic types shared by parser, analyses and driver
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "reactc/basic/source_manager.hpp"

namespace reactc
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * Severity level for diagnostics.
 */
enum class Severity : uint8_t {
  Error,
  Warning,
  Info,
};

[[nodiscard]] constexpr std::string_view to_string(Severity s) noexcept
{
  switch (s) {
    case Severity::Error:
      return "error";
    case Severity::Warning:
      return "warning";
    case Severity::Info:
      return "info";
  }
  return "error";
}

enum class LabelStyle {
  Primary,    // the offending construct
  Secondary,  // related context
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/// Well-known diagnostic codes.
namespace diag_codes
{
inline constexpr const char * k_parse_error = "parse-error";
inline constexpr const char * k_non_reactive_mutation = "non-reactive-mutation";
inline constexpr const char * k_props_destructuring = "props-destructuring";
inline constexpr const char * k_io_error = "io-error";
}  // namespace diag_codes

struct Diagnostic
{
  Severity severity = Severity::Error;
  std::string code;  // e.g. "props-destructuring"
  std::string message;

  /// labels.front() is the primary label; any others are notes.
  std::vector<Label> labels;

  /// 1-based position of the primary label start (invalid if unknown).
  LineColumn location;

  /// Human-readable suggested edit. Never applied automatically.
  std::optional<std::string> fix;

  [[nodiscard]] SourceRange primary_range() const noexcept
  {
    return labels.empty() ? SourceRange{} : labels.front().range;
  }
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Holds a diagnostic while its code, notes and fix are attached; the
 * destructor commits it to the bag. A moved-from builder commits nothing.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag) : bag_(&bag), diagnostic_(std::move(diag))
  {
  }

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;
  DiagnosticBuilder & operator=(DiagnosticBuilder &&) = delete;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  /// Secondary label pointing at related code.
  DiagnosticBuilder & with_note(SourceRange range, std::string msg);
  DiagnosticBuilder & with_fix(std::string fix);

private:
  DiagnosticBag * bag_;
  Diagnostic diagnostic_;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  /// A bag bound to a source file fills in LineColumn for every report.
  /// The file must outlive any report made while it is attached.
  explicit DiagnosticBag(const SourceFile * source) : source_(source) {}

  void attach_source(const SourceFile * source) noexcept { source_ = source; }

  DiagnosticBuilder report(
    Severity severity, SourceRange range, std::string message, std::string label_message = "");

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "")
  {
    return report(Severity::Error, range, std::move(message), std::move(label_message));
  }
  DiagnosticBuilder report_warning(
    SourceRange range, std::string message, std::string label_message = "")
  {
    return report(Severity::Warning, range, std::move(message), std::move(label_message));
  }
  DiagnosticBuilder report_info(
    SourceRange range, std::string message, std::string label_message = "")
  {
    return report(Severity::Info, range, std::move(message), std::move(label_message));
  }

  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] std::vector<Diagnostic> with_code(std::string_view code) const;
  [[nodiscard]] size_t count(Severity severity) const;
  [[nodiscard]] bool has_errors() const { return count(Severity::Error) != 0; }
  [[nodiscard]] bool has_warnings() const { return count(Severity::Warning) != 0; }

  /// Appends other's diagnostics; their locations are kept as computed.
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  friend class DiagnosticBuilder;

  void commit(Diagnostic && diag) { diagnostics_.push_back(std::move(diag)); }

  const SourceFile * source_ = nullptr;
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace reactc
