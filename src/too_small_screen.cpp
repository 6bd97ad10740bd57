#include "too_small_screen.hpp"
#include "utf8.hpp"
#include <algorithm>

std::vector<std::string> too_small_lines(const TerminalTooSmall& err) {
  return {
    "TERMINAL TOO SMALL",
    "Current size: " + std::to_string(err.current.rows) + "x" + std::to_string(err.current.cols),
    "Minimum size: " + std::to_string(err.minimum.rows) + "x" + std::to_string(err.minimum.cols),
    "",
    "Please resize your terminal window",
    "Press 'q' to quit or resize terminal",
  };
}

void draw_too_small_screen(ITerminalSurface& surface, const TerminalTooSmall& err) {
  TermSize sz = surface.size();
  surface.clear_region(Region{0, 0, sz.rows, sz.cols});
  auto lines = too_small_lines(err);
  int n = static_cast<int>(lines.size());
  int top = std::max(0, (sz.rows - n) / 2);
  for (int i = 0; i < n && top + i < sz.rows; ++i) {
    std::string text = utf8_prefix(lines[i], sz.cols);
    int col = std::max(0, (sz.cols - utf8_length(text)) / 2);
    Style st = i == 0 ? bold_style() : Style{};
    for (const std::string& g : utf8_glyphs(text)) {
      if (col >= sz.cols || !surface.put_char(top + i, col, g, st)) break;
      ++col;
    }
  }
  surface.present();
}
