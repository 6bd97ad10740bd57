#include "frame_renderer.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <string>

static void test_border_cells() {
  FrameRenderer fr;
  Region r{2, 3, 4, 5};
  auto cells = fr.border_cells(r, FrameStyle::Single);
  assert(cells.size() == static_cast<size_t>(2 * 5 + 2 * 2));
  assert(cells.front().row == 2 && cells.front().col == 3);
  assert(cells.front().glyph == "┌" && cells.front().fallback == "+");
  assert(cells.back().row == 5 && cells.back().col == 7);
  assert(cells.back().glyph == "┘");
  for (size_t i = 1; i < cells.size(); ++i) {
    bool ordered = cells[i - 1].row < cells[i].row ||
                   (cells[i - 1].row == cells[i].row && cells[i - 1].col < cells[i].col);
    assert(ordered);
  }
  for (const auto& c : cells) assert(r.contains(c.row, c.col));

  assert(fr.border_cells(Region{0, 0, 2, 10}, FrameStyle::Single).empty());
  assert(fr.border_cells(Region{0, 0, 10, 2}, FrameStyle::Double).empty());
}

static void test_content_area() {
  assert((FrameRenderer::content_area(Region{3, 30, 54, 90}) == Region{4, 31, 52, 88}));
  assert((FrameRenderer::content_area(Region{0, 0, 1, 1}) == Region{1, 1, 0, 0}));
}

static void test_styles() {
  assert(std::string(glyphs_for(FrameStyle::Double).top_left) == "╔");
  assert(std::string(glyphs_for(FrameStyle::Thick).horizontal) == "━");
  assert(std::string(glyphs_for(FrameStyle::Rounded).bottom_right) == "╯");
  assert(parse_frame_style("rounded") == FrameStyle::Rounded);
  assert(!parse_frame_style("fancy").has_value());
  assert(default_frame_style() == FrameStyle::Single);
  for (FrameStyle s : {FrameStyle::Single, FrameStyle::Double, FrameStyle::Thick, FrameStyle::Rounded}) {
    assert(parse_frame_style(frame_style_name(s)) == s);
  }
}

static void test_draw_fallback_chain() {
  FrameRenderer fr;
  Region r{0, 0, 3, 6};
  auto cells = fr.border_cells(r, FrameStyle::Double);

  HeadlessTerminal ok(3, 6);
  assert(fr.draw(ok, cells) == FrameDrawResult::Drawn);
  assert(ok.glyph_at(0, 0) == "╔");
  assert(ok.glyph_at(1, 5) == "║");

  HeadlessTerminal ascii(3, 6);
  ascii.reject_glyphs(is_non_ascii);
  assert(fr.draw(ascii, cells) == FrameDrawResult::AsciiFallback);
  assert(ascii.text_at(0) == "+----+");
  assert(ascii.text_at(1) == "|    |");

  HeadlessTerminal none(3, 6);
  none.reject_glyphs([](const std::string& g) { return g != " "; });
  assert(fr.draw(none, cells) == FrameDrawResult::Omitted);
  assert(none.text_at(0) == "      ");

  HeadlessTerminal any(3, 6);
  assert(fr.draw(any, {}) == FrameDrawResult::Skipped);
  assert(std::string(frame_result_name(FrameDrawResult::AsciiFallback)) == "ascii");
}

int main() {
  test_border_cells();
  test_content_area();
  test_styles();
  test_draw_fallback_chain();
  return 0;
}
