// semtok/basic/line_index.hpp - Byte offset to UTF-16 line/column mapping
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "semtok/basic/source_range.hpp"

namespace semtok
{

/**
 * Line table over a UTF-8 buffer.
 *
 * Grammar engines report byte offsets and byte columns; the host editor
 * expects columns in UTF-16 code units. The index does not own the text, so
 * the buffer must outlive it.
 */
class LineIndex
{
public:
  explicit LineIndex(std::string_view text);

  [[nodiscard]] std::string_view text() const noexcept { return text_; }
  [[nodiscard]] uint32_t line_count() const noexcept
  {
    return static_cast<uint32_t>(line_offsets_.size());
  }

  /// Byte offset of the first byte of `line` (clamped to the text size).
  [[nodiscard]] uint32_t line_start(uint32_t line) const noexcept;

  /// Position of a byte offset; offsets past the end clamp to the end.
  [[nodiscard]] SourcePosition position_at(uint32_t byte_offset) const noexcept;

  /// Position for a (row, byte column) pair as reported by tree-sitter.
  [[nodiscard]] SourcePosition position_at(uint32_t line, uint32_t byte_column) const noexcept;

  /// Number of UTF-16 code units encoded by `bytes`.
  [[nodiscard]] static uint32_t utf16_length(std::string_view bytes) noexcept;

private:
  std::string_view text_;
  std::vector<uint32_t> line_offsets_;  // byte offsets of each line start
};

}  // namespace semtok
