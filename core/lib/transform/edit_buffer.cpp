// reactc/transform/edit_buffer.cpp - Offset-addressed text editing
#include "reactc/transform/edit_buffer.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <utility>

namespace reactc
{

EditBuffer::EditBuffer(std::string_view original) : original_(original)
{
  if (!original_.empty()) {
    chunks_.push_back({0, static_cast<uint32_t>(original_.size()), {}, {}, original_, false});
  }
}

// ============================================================================
// Chunk lookup
// ============================================================================

size_t EditBuffer::chunk_containing(uint32_t pos) const noexcept
{
  auto it = std::upper_bound(
    chunks_.begin(), chunks_.end(), pos,
    [](uint32_t p, const Chunk & c) { return p < c.start; });
  if (it == chunks_.begin()) {
    return npos;
  }
  const auto idx = static_cast<size_t>(std::distance(chunks_.begin(), it)) - 1;
  return chunks_[idx].end > pos ? idx : npos;
}

size_t EditBuffer::chunk_starting_at(uint32_t pos) const noexcept
{
  const size_t idx = chunk_containing(pos);
  return idx != npos && chunks_[idx].start == pos ? idx : npos;
}

size_t EditBuffer::chunk_ending_at(uint32_t pos) const noexcept
{
  if (pos == 0) {
    return npos;
  }
  const size_t idx = chunk_containing(pos - 1);
  return idx != npos && chunks_[idx].end == pos ? idx : npos;
}

bool EditBuffer::split(uint32_t pos)
{
  if (pos == 0 || pos >= original_.size()) {
    return pos <= original_.size();
  }
  const size_t idx = chunk_containing(pos);
  if (idx == npos) {
    return false;
  }
  if (chunks_[idx].start == pos) {
    return true;
  }
  if (chunks_[idx].edited) {
    return false;
  }

  Chunk & left = chunks_[idx];
  Chunk right{pos, left.end, {}, std::move(left.outro), left.content.substr(pos - left.start),
              false};
  left.content.resize(pos - left.start);
  left.end = pos;
  left.outro.clear();
  chunks_.insert(chunks_.begin() + static_cast<std::ptrdiff_t>(idx) + 1, std::move(right));
  return true;
}

// ============================================================================
// Insertions
// ============================================================================

void EditBuffer::append_left(uint32_t pos, std::string_view text)
{
  if (!split(pos)) {
    ++rejected_;
    return;
  }
  const size_t idx = chunk_ending_at(pos);
  std::string & target = idx == npos ? intro_ : chunks_[idx].outro;
  target.append(text);
  changed_ = true;
}

void EditBuffer::prepend_left(uint32_t pos, std::string_view text)
{
  if (!split(pos)) {
    ++rejected_;
    return;
  }
  const size_t idx = chunk_ending_at(pos);
  std::string & target = idx == npos ? intro_ : chunks_[idx].outro;
  target.insert(0, text);
  changed_ = true;
}

void EditBuffer::append_right(uint32_t pos, std::string_view text)
{
  if (!split(pos)) {
    ++rejected_;
    return;
  }
  const size_t idx = chunk_starting_at(pos);
  std::string & target = idx == npos ? outro_ : chunks_[idx].intro;
  target.append(text);
  changed_ = true;
}

void EditBuffer::prepend_right(uint32_t pos, std::string_view text)
{
  if (!split(pos)) {
    ++rejected_;
    return;
  }
  const size_t idx = chunk_starting_at(pos);
  std::string & target = idx == npos ? outro_ : chunks_[idx].intro;
  target.insert(0, text);
  changed_ = true;
}

void EditBuffer::prepend(std::string_view text)
{
  intro_.insert(0, text);
  changed_ = true;
}

// ============================================================================
// Overwrite
// ============================================================================

bool EditBuffer::covered_chunks(uint32_t start, uint32_t end, size_t & first, size_t & last)
{
  if (start >= end || end > original_.size()) {
    return false;
  }
  if (!split(start) || !split(end)) {
    return false;
  }
  first = chunk_starting_at(start);
  last = chunk_ending_at(end);
  return first != npos && last != npos && first <= last;
}

void EditBuffer::overwrite(uint32_t start, uint32_t end, std::string_view text)
{
  size_t first = npos;
  size_t last = npos;
  if (!covered_chunks(start, end, first, last)) {
    ++rejected_;
    return;
  }
  for (size_t i = first; i <= last; ++i) {
    Chunk & c = chunks_[i];
    c.intro.clear();
    c.outro.clear();
    c.content.clear();
    c.edited = true;
  }
  chunks_[first].content = std::string(text);
  changed_ = true;
}

void EditBuffer::replace(uint32_t start, uint32_t end, std::string_view text)
{
  size_t first = npos;
  size_t last = npos;
  if (!covered_chunks(start, end, first, last)) {
    ++rejected_;
    return;
  }
  std::string intro = std::move(chunks_[first].intro);
  std::string outro = std::move(chunks_[last].outro);
  overwrite(start, end, text);
  chunks_[first].intro = std::move(intro);
  chunks_[last].outro = std::move(outro);
}

// ============================================================================
// Read-back
// ============================================================================

std::string EditBuffer::slice(uint32_t start, uint32_t end) const
{
  std::string result;
  if (start >= end || end > original_.size()) {
    return result;
  }
  const size_t first = chunk_containing(start);
  if (first == npos) {
    return result;
  }

  for (size_t i = first; i < chunks_.size(); ++i) {
    const Chunk & c = chunks_[i];
    if (!c.intro.empty() && (i != first || c.start == start)) {
      result += c.intro;
    }
    const bool contains_end = c.start < end && c.end >= end;
    if (c.edited) {
      // Overwritten text cannot be cut; it is returned whole.
      result += c.content;
    } else {
      const size_t from = i == first ? start - c.start : 0;
      const size_t to = contains_end ? end - c.start : c.content.size();
      result.append(c.content, from, to - from);
    }
    if (!c.outro.empty() && (!contains_end || c.end == end)) {
      result += c.outro;
    }
    if (contains_end) {
      break;
    }
  }
  return result;
}

std::string EditBuffer::to_string() const
{
  std::string out = intro_;
  for (const Chunk & c : chunks_) {
    out += c.intro;
    out += c.content;
    out += c.outro;
  }
  out += outro_;
  return out;
}

}  // namespace reactc
