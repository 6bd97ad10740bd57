#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main before any NcursesTerminal; destructor restores the terminal.
 * Note: raw/noecho/keypad, hidden cursor and a 100 ms getch timeout so the
 *       loop can pick up worker statistics without a key press.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
};
