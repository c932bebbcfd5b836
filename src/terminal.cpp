#include "terminal.hpp"
#include <ncurses.h>
#include <locale.h>

Terminal::Terminal(bool enable_mouse) {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);
  ESCDELAY = 25;
  if (enable_mouse) {
    mousemask(BUTTON1_PRESSED | BUTTON1_CLICKED | BUTTON4_PRESSED | BUTTON5_PRESSED, nullptr);
    mouseinterval(0);
  }
}

Terminal::~Terminal() {
  curs_set(1);
  endwin();
}
