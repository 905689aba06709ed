// reactc/transform/edit_buffer.hpp - Offset-addressed text editing over an original source
//
// All transformers address the buffer with offsets of the ORIGINAL source,
// so edits made by one pass never shift the positions another pass uses.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "reactc/basic/source_manager.hpp"

namespace reactc
{

/**
 * Chunked edit buffer.
 *
 * The original text is split into chunks on demand. Each chunk carries an
 * `intro` (text emitted before it) and an `outro` (text emitted after it),
 * plus its content, which an overwrite replaces. Insertions come in two
 * flavours that differ only when a later overwrite or slice touches the
 * insertion point:
 *
 * - *left* insertions at `pos` attach to the chunk that ENDS at `pos`
 *   (they travel with the text before `pos`);
 * - *right* insertions at `pos` attach to the chunk that STARTS at `pos`
 *   (they travel with the text after `pos`).
 *
 * `append_*` adds after existing insertions at the same point; `prepend_*`
 * adds before them.
 *
 * @code
 *   EditBuffer buf("let x = 1;");
 *   buf.overwrite(0, 3, "const");
 *   buf.append_left(8, "signal(");
 *   buf.append_right(9, ")");
 *   buf.to_string();  // "const x = signal(1);"
 * @endcode
 */
class EditBuffer
{
public:
  explicit EditBuffer(std::string_view original);

  /// Insertions at a position out of range or inside overwritten text are
  /// rejected and counted in rejected_edits().
  void append_left(uint32_t pos, std::string_view text);
  void append_right(uint32_t pos, std::string_view text);
  void prepend_left(uint32_t pos, std::string_view text);
  void prepend_right(uint32_t pos, std::string_view text);

  /**
   * Replace [start, end) with `text`.
   *
   * Insertions attached to the chunks inside the range are dropped. An empty
   * or invalid range, or one that cuts an earlier overwrite, is rejected.
   */
  void overwrite(uint32_t start, uint32_t end, std::string_view text);
  void overwrite(SourceRange range, std::string_view text)
  {
    overwrite(range.start, range.end, text);
  }

  /**
   * Like overwrite(), but insertions at the outer edges of the range (right
   * insertions at `start`, left insertions at `end`) are kept.
   */
  void replace(uint32_t start, uint32_t end, std::string_view text);
  void replace(SourceRange range, std::string_view text)
  {
    replace(range.start, range.end, text);
  }

  /// Text emitted before the whole buffer.
  void prepend(std::string_view text);

  /**
   * Current text of [start, end) in original offsets.
   *
   * Includes left insertions at `end`, right insertions at `start`, and
   * everything inside; excludes left insertions at `start` and right
   * insertions at `end`.
   */
  [[nodiscard]] std::string slice(uint32_t start, uint32_t end) const;
  [[nodiscard]] std::string slice(SourceRange range) const
  {
    return slice(range.start, range.end);
  }

  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] std::string_view original() const noexcept { return original_; }

  /// True once any edit has been made.
  [[nodiscard]] bool has_changed() const noexcept { return changed_; }

  /// Number of edits refused because they targeted overwritten text.
  [[nodiscard]] size_t rejected_edits() const noexcept { return rejected_; }

private:
  struct Chunk
  {
    uint32_t start;
    uint32_t end;
    std::string intro;
    std::string outro;
    std::string content;
    bool edited = false;
  };

  /// Ensure a chunk boundary at `pos`. Fails inside an overwritten chunk.
  bool split(uint32_t pos);

  /// Boundaries at start and end; indices of the first and last covered chunk.
  bool covered_chunks(uint32_t start, uint32_t end, size_t & first, size_t & last);

  /// Index of the chunk starting / ending exactly at pos, or npos.
  [[nodiscard]] size_t chunk_starting_at(uint32_t pos) const noexcept;
  [[nodiscard]] size_t chunk_ending_at(uint32_t pos) const noexcept;

  /// Index of the chunk containing offset pos (start <= pos < end), or npos.
  [[nodiscard]] size_t chunk_containing(uint32_t pos) const noexcept;

  static constexpr size_t npos = static_cast<size_t>(-1);

  std::string original_;
  std::vector<Chunk> chunks_;  ///< Ordered by start, covering [0, size)
  std::string intro_;
  std::string outro_;
  bool changed_ = false;
  size_t rejected_ = 0;
};

}  // namespace reactc
