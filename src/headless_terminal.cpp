#include "headless_terminal.hpp"
#include "utf8.hpp"

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) {
  clear();
}

void HeadlessTerminal::clear() {
  cells_.assign(static_cast<size_t>(rows_), std::u32string(static_cast<size_t>(cols_), U' '));
  highlighted_.assign(static_cast<size_t>(rows_), false);
}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = rows;
  cols_ = cols;
  clear();
}

void HeadlessTerminal::put(int row, int col, const std::string& text, bool highlight) {
  if (row < 0 || row >= rows_) return;
  std::u32string cps = utf8_decode(text);
  for (size_t i = 0; i < cps.size(); ++i) {
    long c = static_cast<long>(col) + static_cast<long>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    cells_[row][static_cast<size_t>(c)] = cps[i];
  }
  if (highlight) highlighted_[row] = true;
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) { put(row, col, text, false); }
void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text) { put(row, col, text, true); }
void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int) { put(row, col, text, true); }


KeyEvent HeadlessTerminal::read_key() {
  if (keys_.empty()) return KeyEvent{Key::Closed, 0};
  KeyEvent ev = keys_.front();
  keys_.pop_front();
  return ev;
}

void HeadlessTerminal::push_text(const std::u32string& s) {
  for (char32_t c : s) {
    if (c == U'\n') push_key(KeyEvent{Key::Enter, 0});
    else push_key(KeyEvent{Key::Char, c});
  }
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  std::u32string r = cells_[row];
  size_t n = r.find_last_not_of(U' ');
  r.resize(n == std::u32string::npos ? 0 : n + 1);
  return utf8_encode(r);
}

bool HeadlessTerminal::row_highlighted(int row) const {
  if (row < 0 || row >= rows_) return false;
  return highlighted_[row];
}
