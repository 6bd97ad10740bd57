#include "headless_terminal.hpp"
#include <algorithm>

static const std::string kBlank = " ";

bool is_non_ascii(const std::string& glyph) {
  return std::any_of(glyph.begin(), glyph.end(),
                     [](char ch) { return static_cast<unsigned char>(ch) >= 0x80; });
}

HeadlessTerminal::HeadlessTerminal(int rows, int cols)
  : rows_(std::max(0, rows)), cols_(std::max(0, cols)),
    cells_(static_cast<size_t>(rows_) * static_cast<size_t>(cols_)) {}

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = std::max(0, rows);
  cols_ = std::max(0, cols);
  cells_.assign(static_cast<size_t>(rows_) * static_cast<size_t>(cols_), Cell{});
}

bool HeadlessTerminal::put_char(int row, int col, const std::string& glyph, const Style& style) {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) {
    ++rejected_count_;
    return false;
  }
  if (reject_ && reject_(glyph)) {
    ++rejected_count_;
    return false;
  }
  Cell& c = cells_[index(row, col)];
  c.glyph = glyph;
  c.style = style;
  ++put_count_;
  return true;
}

void HeadlessTerminal::clear_region(const Region& region) {
  int r0 = std::max(0, region.y), r1 = std::min(rows_, region.y + region.height);
  int c0 = std::max(0, region.x), c1 = std::min(cols_, region.x + region.width);
  for (int r = r0; r < r1; ++r)
    for (int c = c0; c < c1; ++c) cells_[index(r, c)] = Cell{};
}

std::string HeadlessTerminal::text_at(int row) const {
  std::string out;
  if (row < 0 || row >= rows_) return out;
  for (int c = 0; c < cols_; ++c) out += cells_[index(row, c)].glyph;
  return out;
}

const std::string& HeadlessTerminal::glyph_at(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return kBlank;
  return cells_[index(row, col)].glyph;
}

Style HeadlessTerminal::style_at(int row, int col) const {
  if (row < 0 || row >= rows_ || col < 0 || col >= cols_) return Style{};
  return cells_[index(row, col)].style;
}
