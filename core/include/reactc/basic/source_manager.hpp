// reactc/basic/source_manager.hpp - Source ranges and the single-file source buffer
//
// Every AST node carries a half-open byte range into the file it was parsed
// from. Line/column pairs are computed on demand from a line-start table.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace reactc
{

// ============================================================================
// SourceRange - Half-open byte range
// ============================================================================

/**
 * A range of source code [start, end) expressed as byte offsets.
 *
 * Offsets are the currency of the whole compiler: the edit buffer is
 * addressed by the same offsets the parser records, so no conversion is
 * needed between analysis and rewriting.
 */
struct SourceRange
{
  static constexpr uint32_t k_invalid_offset = UINT32_MAX;

  uint32_t start = k_invalid_offset;
  uint32_t end = k_invalid_offset;

  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(uint32_t s, uint32_t e) noexcept : start(s), end(e) {}

  [[nodiscard]] constexpr bool is_valid() const noexcept
  {
    return start != k_invalid_offset && end != k_invalid_offset;
  }

  [[nodiscard]] constexpr bool contains(uint32_t offset) const noexcept
  {
    return offset >= start && offset < end;
  }

  [[nodiscard]] constexpr bool contains(SourceRange other) const noexcept
  {
    return other.start >= start && other.end <= end;
  }

  [[nodiscard]] constexpr bool overlaps(SourceRange other) const noexcept
  {
    return start < other.end && other.start < end;
  }

  [[nodiscard]] constexpr uint32_t size() const noexcept
  {
    return is_valid() && end >= start ? end - start : 0;
  }

  [[nodiscard]] constexpr bool operator==(SourceRange other) const noexcept
  {
    return start == other.start && end == other.end;
  }
  [[nodiscard]] constexpr bool operator!=(SourceRange other) const noexcept
  {
    return !(*this == other);
  }
};

/// Smallest range covering both a and b.
[[nodiscard]] constexpr SourceRange join_ranges(SourceRange a, SourceRange b) noexcept
{
  if (!a.is_valid()) return b;
  if (!b.is_valid()) return a;
  return {a.start < b.start ? a.start : b.start, a.end > b.end ? a.end : b.end};
}

// ============================================================================
// LineColumn
// ============================================================================

/**
 * Human-readable position (1-based line and column).
 */
struct LineColumn
{
  uint32_t line = 0;    ///< 1-indexed line number (0 = invalid)
  uint32_t column = 0;  ///< 1-indexed column number (0 = invalid)

  [[nodiscard]] constexpr bool is_valid() const noexcept { return line > 0 && column > 0; }
};

// ============================================================================
// SourceFile
// ============================================================================

/**
 * Owns the text of one input file plus its line table.
 *
 * The compiler works on one file per invocation, so there is no registry:
 * a SourceFile is created by the driver and borrowed by every stage.
 */
class SourceFile
{
public:
  SourceFile() = default;
  SourceFile(std::filesystem::path path, std::string content);

  [[nodiscard]] const std::filesystem::path & path() const noexcept { return path_; }
  [[nodiscard]] std::string_view content() const noexcept { return content_; }
  [[nodiscard]] uint32_t size() const noexcept { return static_cast<uint32_t>(content_.size()); }
  [[nodiscard]] size_t line_count() const noexcept { return line_offsets_.size(); }

  /// Convert a byte offset to a 1-based line/column. Offsets past EOF clamp.
  [[nodiscard]] LineColumn get_line_column(uint32_t offset) const noexcept;

  /// Text of a 0-based line, without the line terminator.
  [[nodiscard]] std::string_view get_line(uint32_t line_index) const noexcept;

  /// Original text covered by a range (clamped to the file).
  [[nodiscard]] std::string_view get_slice(SourceRange range) const noexcept;

private:
  void build_line_table();

  std::filesystem::path path_;
  std::string content_;
  std::vector<uint32_t> line_offsets_;
};

}  // namespace reactc
