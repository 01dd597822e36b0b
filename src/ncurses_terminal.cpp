#include "ncurses_terminal.hpp"
#include "input.hpp"
#include <cerrno>
#include <ncurses.h>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    (void)use_default_colors();
    // status line: light text on a dark bar
    init_pair(kStatusLinePair, COLOR_WHITE, COLOR_BLACK);
    colors_ = true;
  }
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  mvaddnstr(row, col, text.c_str(), (int)text.size());
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text) {
  attron(A_REVERSE);
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(A_REVERSE);
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (!colors_) { draw_highlighted(row, col, text); return; }
  attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::set_cursor_visible(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }


KeyEvent NcursesTerminal::read_key() {
  wint_t wch = 0;
  errno = 0;
  int r = get_wch(&wch);
  // blocking read: ERR means stdin is gone (EOF, hangup) or a signal arrived
  if (r == ERR) return key_from_read_error(errno);
  if (r == KEY_CODE_YES) {
    switch (wch) {
      case KEY_LEFT: return KeyEvent{Key::Left, 0};
      case KEY_RIGHT: return KeyEvent{Key::Right, 0};
      case KEY_UP: return KeyEvent{Key::Up, 0};
      case KEY_DOWN: return KeyEvent{Key::Down, 0};
      case KEY_ENTER: return KeyEvent{Key::Enter, 0};
      case KEY_BACKSPACE: return KeyEvent{Key::Backspace, 0};
      case KEY_DC: return KeyEvent{Key::Delete, 0};
      case KEY_RESIZE: return KeyEvent{Key::Resize, 0};
      default: return KeyEvent{};
    }
  }
  return KeyEvent{Key::Char, static_cast<char32_t>(wch)};
}
