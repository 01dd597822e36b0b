#include "terminal.hpp"
#include <ncurses.h>
#include <locale.h>
#include "log.hpp"

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  log_set_screen_active(true);
  initscr();
  raw();
  noecho();
  nonl();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  TED_DBG("terminal session started (%dx%d)", COLS, LINES);
}

Terminal::~Terminal() {
  endwin();
  log_set_screen_active(false);
}
