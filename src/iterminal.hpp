#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh, keys).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * Note: text is UTF-8; one character is one cell.
 */
#include <string>
#include "types.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize get_size() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_highlighted(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void set_cursor_visible(bool visible) = 0;
  virtual void refresh() = 0;
  virtual KeyEvent read_key() = 0;
};
