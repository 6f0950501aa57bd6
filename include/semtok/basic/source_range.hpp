// semtok/basic/source_range.hpp - Line/column positions and ranges
//
// Positions follow the host editor addressing: 0-based lines, columns in
// UTF-16 code units.
//
#pragma once

#include <cstdint>

namespace semtok
{

// ============================================================================
// SourcePosition
// ============================================================================

struct SourcePosition
{
  uint32_t line = 0;
  uint32_t column = 0;

  constexpr SourcePosition() noexcept = default;
  constexpr SourcePosition(uint32_t l, uint32_t c) noexcept : line(l), column(c) {}

  [[nodiscard]] constexpr bool operator==(SourcePosition other) const noexcept
  {
    return line == other.line && column == other.column;
  }
  [[nodiscard]] constexpr bool operator!=(SourcePosition other) const noexcept
  {
    return !(*this == other);
  }
  [[nodiscard]] constexpr bool operator<(SourcePosition other) const noexcept
  {
    return line < other.line || (line == other.line && column < other.column);
  }
  [[nodiscard]] constexpr bool operator<=(SourcePosition other) const noexcept
  {
    return !(other < *this);
  }
  [[nodiscard]] constexpr bool operator>(SourcePosition other) const noexcept
  {
    return other < *this;
  }
  [[nodiscard]] constexpr bool operator>=(SourcePosition other) const noexcept
  {
    return !(*this < other);
  }
};

// ============================================================================
// SourceRange
// ============================================================================

/**
 * Half-open range [start, end) of positions.
 *
 * A well-formed range has start <= end. Ranges coming from the matching layer
 * are not validated on construction; the normalizer rejects inverted ones.
 */
struct SourceRange
{
  SourcePosition start;
  SourcePosition end;

  constexpr SourceRange() noexcept = default;
  constexpr SourceRange(SourcePosition s, SourcePosition e) noexcept : start(s), end(e) {}
  constexpr SourceRange(uint32_t sl, uint32_t sc, uint32_t el, uint32_t ec) noexcept
  : start(sl, sc), end(el, ec)
  {
  }

  [[nodiscard]] constexpr bool is_empty() const noexcept { return start == end; }
  [[nodiscard]] constexpr bool is_single_line() const noexcept { return start.line == end.line; }

  /// Non-strict containment: equal ranges contain each other.
  [[nodiscard]] constexpr bool contains(SourceRange other) const noexcept
  {
    return start <= other.start && other.end <= end;
  }

  /// Containment that treats an identical range as not contained.
  [[nodiscard]] constexpr bool strictly_contains(SourceRange other) const noexcept
  {
    return contains(other) && *this != other;
  }

  /// True if the ranges share at least one position (touching ends count).
  [[nodiscard]] constexpr bool intersects(SourceRange other) const noexcept
  {
    const SourcePosition s = start < other.start ? other.start : start;
    const SourcePosition e = end < other.end ? end : other.end;
    return s <= e;
  }

  /// The part of this range that lies before `other` starts.
  [[nodiscard]] constexpr SourceRange before(SourceRange other) const noexcept
  {
    return {start, other.start};
  }

  /// The part of this range that lies after `other` ends.
  [[nodiscard]] constexpr SourceRange after(SourceRange other) const noexcept
  {
    return {other.end, end};
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

/**
 * Translate a range computed relative to an embedded substring into the
 * coordinates of the enclosing text, where the substring begins at `origin`.
 *
 * Only positions on the substring's first line move horizontally.
 */
[[nodiscard]] constexpr SourcePosition shift_position(
  SourcePosition pos, SourcePosition origin) noexcept
{
  if (pos.line == 0) {
    return {origin.line, pos.column + origin.column};
  }
  return {pos.line + origin.line, pos.column};
}

[[nodiscard]] constexpr SourceRange shift_range(SourceRange range, SourcePosition origin) noexcept
{
  return {shift_position(range.start, origin), shift_position(range.end, origin)};
}

}  // namespace semtok
