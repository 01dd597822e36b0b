#pragma once
/*
 * LineIndex
 *
 * Purpose: ordered line spans derived from a character sequence.
 * Note: rebuilt in full after every edit, no incremental patching.
 */
#include <vector>
#include <string>
#include <cstddef>
#include "types.hpp"

class LineIndex {
public:
  std::vector<LineSpan> spans;

  void build_from_text(const std::u32string& data);
  size_t line_count() const { return spans.size(); }
  const LineSpan& span(size_t row) const { return spans[row]; }
  size_t line_length(size_t row) const;
  size_t line_of(size_t pos) const;
  std::u32string line_text(const std::u32string& data, size_t row) const;

private:
  size_t data_len_ = 0;
};
