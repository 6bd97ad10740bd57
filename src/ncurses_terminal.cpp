#include "ncurses_terminal.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

static short to_curses(Color c) {
  switch (c) {
    case Color::Black: return COLOR_BLACK;
    case Color::Red: return COLOR_RED;
    case Color::Green: return COLOR_GREEN;
    case Color::Yellow: return COLOR_YELLOW;
    case Color::Blue: return COLOR_BLUE;
    case Color::Magenta: return COLOR_MAGENTA;
    case Color::Cyan: return COLOR_CYAN;
    case Color::White: return COLOR_WHITE;
    case Color::Default: break;
  }
  return -1;
}

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    colors_ = use_default_colors() == OK;
    if (!colors_) spdlog::info("terminal has no default colors; styles use attributes only");
  }
}

TermSize NcursesTerminal::size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

short NcursesTerminal::pair_for(Color fg, Color bg) {
  auto key = std::make_pair(fg, bg);
  if (auto it = pairs_.find(key); it != pairs_.end()) return it->second;
  if (next_pair_ >= COLOR_PAIRS) return 0;
  short id = next_pair_++;
  init_pair(id, to_curses(fg), to_curses(bg));
  pairs_[key] = id;
  return id;
}

attr_t NcursesTerminal::attrs_for(const Style& s) {
  attr_t a = A_NORMAL;
  if (s.weight == Weight::Bold) a |= A_BOLD;
  else if (s.weight == Weight::Dim) a |= A_DIM;
  switch (s.decoration) {
    case Decoration::Underline: a |= A_UNDERLINE; break;
    case Decoration::Blink: a |= A_BLINK; break;
    case Decoration::Reverse: a |= A_REVERSE; break;
    case Decoration::None: break;
  }
  if (colors_ && (s.foreground != Color::Default || s.background != Color::Default)) {
    a |= COLOR_PAIR(pair_for(s.foreground, s.background));
  }
  return a;
}

bool NcursesTerminal::put_char(int row, int col, const std::string& glyph, const Style& style) {
  TermSize sz = size();
  if (row < 0 || row >= sz.rows || col < 0 || col >= sz.cols) return false;
  std::string g = glyph;
  if (g.empty() || (g.size() == 1 && (static_cast<unsigned char>(g[0]) < 0x20 || g[0] == 0x7f))) g = " ";

  attr_t a = attrs_for(style);
  attron(a);
  int rc = mvaddstr(row, col, g.c_str());
  attroff(a);
  // writing the last cell succeeds but the cursor cannot advance past it
  if (rc == ERR && row == sz.rows - 1 && col == sz.cols - 1) return true;
  return rc == OK;
}

void NcursesTerminal::clear_region(const Region& r) {
  TermSize sz = size();
  int r0 = std::max(0, r.y), r1 = std::min(sz.rows, r.y + r.height);
  int c0 = std::max(0, r.x), c1 = std::min(sz.cols, r.x + r.width);
  if (c1 <= c0) return;
  attrset(A_NORMAL);
  for (int row = r0; row < r1; ++row) mvhline(row, c0, ' ', c1 - c0);
}

void NcursesTerminal::present() { ::refresh(); }

void NcursesTerminal::clear_all() { erase(); }
