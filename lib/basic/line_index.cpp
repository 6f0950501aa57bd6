// semtok/basic/line_index.cpp - Line table and UTF-16 column conversion
#include "semtok/basic/line_index.hpp"

#include <algorithm>

namespace semtok
{

LineIndex::LineIndex(std::string_view text) : text_(text)
{
  line_offsets_.push_back(0);
  for (size_t i = 0; i < text_.size(); ++i) {
    if (text_[i] == '\n') {
      line_offsets_.push_back(static_cast<uint32_t>(i + 1));
    }
  }
}

uint32_t LineIndex::line_start(uint32_t line) const noexcept
{
  if (line >= line_offsets_.size()) {
    return static_cast<uint32_t>(text_.size());
  }
  return line_offsets_[line];
}

SourcePosition LineIndex::position_at(uint32_t byte_offset) const noexcept
{
  if (byte_offset > text_.size()) {
    byte_offset = static_cast<uint32_t>(text_.size());
  }

  auto it = std::upper_bound(line_offsets_.begin(), line_offsets_.end(), byte_offset);
  --it;  // line_offsets_[0] == 0, so `it` never precedes begin()

  const auto line = static_cast<uint32_t>(it - line_offsets_.begin());
  return {line, utf16_length(text_.substr(*it, byte_offset - *it))};
}

SourcePosition LineIndex::position_at(uint32_t line, uint32_t byte_column) const noexcept
{
  if (line >= line_offsets_.size()) {
    return position_at(static_cast<uint32_t>(text_.size()));
  }
  const uint32_t start = line_offsets_[line];
  const auto available = static_cast<uint32_t>(text_.size()) - start;
  const uint32_t len = std::min(byte_column, available);
  return {line, utf16_length(text_.substr(start, len))};
}

uint32_t LineIndex::utf16_length(std::string_view bytes) noexcept
{
  uint32_t units = 0;
  size_t i = 0;
  while (i < bytes.size()) {
    const auto c0 = static_cast<unsigned char>(bytes[i]);

    // Decode only the sequence length; malformed bytes count as one unit each.
    size_t nbytes = 1;
    if ((c0 & 0xE0) == 0xC0) {
      nbytes = 2;
    } else if ((c0 & 0xF0) == 0xE0) {
      nbytes = 3;
    } else if ((c0 & 0xF8) == 0xF0) {
      nbytes = 4;
    }

    if (nbytes > 1) {
      bool well_formed = i + nbytes <= bytes.size();
      for (size_t k = 1; well_formed && k < nbytes; ++k) {
        well_formed = (static_cast<unsigned char>(bytes[i + k]) & 0xC0) == 0x80;
      }
      if (!well_formed) {
        nbytes = 1;
      }
    }

    // Code points outside the BMP take a surrogate pair.
    units += (nbytes == 4) ? 2U : 1U;
    i += nbytes;
  }
  return units;
}

}  // namespace semtok
