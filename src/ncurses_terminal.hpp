#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminalSurface over ncursesw (stdscr).
 * Note: initialization/teardown is managed by the Terminal RAII wrapper;
 *       color pairs are allocated on first use of a (fg, bg) combination.
 */
#include "iterminal.hpp"
#include <map>
#include <utility>
#include <ncurses.h>

class NcursesTerminal : public ITerminalSurface {
public:
  NcursesTerminal();
  TermSize size() const override;
  bool put_char(int row, int col, const std::string& glyph, const Style& style) override;
  void clear_region(const Region& region) override;
  void present() override;
  void clear_all();
private:
  attr_t attrs_for(const Style& style);
  short pair_for(Color fg, Color bg);
  bool colors_ = false;
  short next_pair_ = 1;
  std::map<std::pair<Color, Color>, short> pairs_;
};
