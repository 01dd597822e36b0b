#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and key input.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"

inline constexpr int kStatusLinePair = 1;

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void set_cursor_visible(bool visible) override;
  void refresh() override;
  KeyEvent read_key() override;
private:
  bool colors_ = false;
};
