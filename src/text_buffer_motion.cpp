#include "text_buffer.hpp"
#include <algorithm>

size_t TextBuffer::current_line() const { return lines_.line_of(cursor_pos_); }

size_t TextBuffer::current_column() const {
  return cursor_pos_ - lines_.span(current_line()).start;
}

void TextBuffer::move_left(size_t n) { move_horizontal(n, Direction::Backward); }
void TextBuffer::move_right(size_t n) { move_horizontal(n, Direction::Forward); }
void TextBuffer::move_up(size_t n) { move_vertical(n, Direction::Backward); }
void TextBuffer::move_down(size_t n) { move_vertical(n, Direction::Forward); }

void TextBuffer::move_horizontal(size_t n, Direction dir) {
  if (dir == Direction::Backward) {
    cursor_pos_ = (n > cursor_pos_) ? 0 : cursor_pos_ - n;
  } else {
    size_t room = data_.size() - cursor_pos_;
    cursor_pos_ += std::min(n, room);
  }
  sticky_column_.reset();
}

void TextBuffer::move_vertical(size_t n, Direction dir) {
  size_t cur = current_line();
  size_t count = lines_.line_count();
  if (dir == Direction::Backward && cur < n) return;
  if (dir == Direction::Forward && (n >= count || cur >= count - n)) return;

  size_t desired = sticky_column_ ? *sticky_column_ : cursor_pos_ - lines_.span(cur).start;
  size_t target = (dir == Direction::Backward) ? cur - n : cur + n;
  size_t len = lines_.line_length(target);
  bool last = (target + 1 == count);
  // the end-of-buffer slot is a valid column only on the last line
  bool fits = desired < len || (last && desired == len);
  size_t col = desired;
  if (!fits) {
    sticky_column_ = desired;
    col = std::max<size_t>(len, 1) - 1;
  }
  cursor_pos_ = lines_.span(target).start + col;
}

void TextBuffer::move_to(int x, int y) {
  vp_.x = x;
  vp_.y = y;
}

void TextBuffer::resize(int width, int height) {
  vp_.width = std::max(0, width);
  vp_.height = std::max(0, height);
}

ScreenPos TextBuffer::cursor_screen_xy() const {
  size_t row = current_line();
  long x = static_cast<long>(cursor_pos_ - lines_.span(row).start) - static_cast<long>(vp_.offset_x);
  long y = static_cast<long>(row) - static_cast<long>(vp_.offset_y);
  return ScreenPos{x + vp_.x, y + vp_.y};
}

// Smallest offset change that brings `coord` into [0, extent).
static void scroll_axis(long coord, int extent, size_t& offset) {
  if (extent <= 0) return;
  if (coord < 0) {
    size_t back = static_cast<size_t>(-coord);
    offset = (back > offset) ? 0 : offset - back;
  } else if (coord >= extent) {
    offset += static_cast<size_t>(coord - extent + 1);
  }
}

void TextBuffer::scroll() {
  ScreenPos p = cursor_screen_xy();
  scroll_axis(p.x - vp_.x, vp_.width, vp_.offset_x);
  scroll_axis(p.y - vp_.y, vp_.height, vp_.offset_y);
}
