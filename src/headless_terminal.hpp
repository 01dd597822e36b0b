#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for tests; keeps a cell grid, the cursor and a
 *          queue of scripted keys. An empty queue reads as Key::Closed.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);

  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void set_cursor_visible(bool visible) override { cursor_visible_ = visible; }
  void refresh() override { refresh_count_++; }
  KeyEvent read_key() override;

  void resize(int rows, int cols);
  void push_key(KeyEvent ev) { keys_.push_back(ev); }
  void push_text(const std::u32string& s);
  // Row contents as UTF-8 with trailing blanks removed.
  std::string row_text(int row) const;
  bool row_highlighted(int row) const;
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  bool cursor_visible() const { return cursor_visible_; }
  int refresh_count() const { return refresh_count_; }

private:
  void put(int row, int col, const std::string& text, bool highlight);

  int rows_;
  int cols_;
  std::vector<std::u32string> cells_;
  std::vector<bool> highlighted_;
  std::deque<KeyEvent> keys_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  bool cursor_visible_ = true;
  int refresh_count_ = 0;
};
