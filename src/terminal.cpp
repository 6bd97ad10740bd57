#include "terminal.hpp"
#include <locale.h>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);
  timeout(100);
  ESCDELAY = 25;
}

Terminal::~Terminal() {
  curs_set(1);
  endwin();
}
