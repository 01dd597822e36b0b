#include "line_index.hpp"
#include <algorithm>
#include <cassert>

void LineIndex::build_from_text(const std::u32string& data) {
  spans.clear();
  data_len_ = data.size();
  size_t start = 0;
  for (size_t i = 0; i < data.size(); ++i) {
    if (data[i] == U'\n') {
      spans.push_back(LineSpan{start, i});
      start = i + 1;
    }
  }
  if (start < data.size()) spans.push_back(LineSpan{start, data.size() - 1});
  else spans.push_back(LineSpan{start, start});
}

size_t LineIndex::line_length(size_t row) const {
  const LineSpan& s = spans[row];
  if (s.start >= data_len_) return 0;
  return s.end - s.start + 1;
}

size_t LineIndex::line_of(size_t pos) const {
  assert(!spans.empty());
  assert(pos <= data_len_);
  // last span whose start is <= pos
  auto it = std::upper_bound(spans.begin(), spans.end(), pos,
                             [](size_t p, const LineSpan& s) { return p < s.start; });
  if (it == spans.begin()) return 0;
  size_t row = static_cast<size_t>(it - spans.begin()) - 1;
  assert(pos <= spans[row].end || pos == data_len_);
  return row;
}

std::u32string LineIndex::line_text(const std::u32string& data, size_t row) const {
  size_t n = line_length(row);
  if (n == 0) return std::u32string();
  return data.substr(spans[row].start, n);
}
