#pragma once
/*
 * FrameRenderer
 *
 * Purpose: border glyphs for a region in one of four frame styles, plus the
 *          interior content area.
 * Fallback: draw() retries with ASCII glyphs when the surface rejects a cell and
 *           blanks the border when that fails too. Never escalates a failure.
 */
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "geometry.hpp"
#include "iterminal.hpp"

enum class FrameStyle { Single, Double, Thick, Rounded };

struct GlyphSet {
  const char* horizontal;
  const char* vertical;
  const char* top_left;
  const char* top_right;
  const char* bottom_left;
  const char* bottom_right;
};

const GlyphSet& glyphs_for(FrameStyle style);
const GlyphSet& ascii_glyphs();
const char* frame_style_name(FrameStyle style);
std::optional<FrameStyle> parse_frame_style(std::string_view name);
FrameStyle default_frame_style();

struct FrameCell {
  int row = 0;
  int col = 0;
  std::string glyph;
  std::string fallback; // ASCII equivalent
};

enum class FrameDrawResult { Drawn, AsciiFallback, Omitted, Skipped };

class FrameRenderer {
public:
  // Outline cells in row-major order; empty when the region is under 3x3.
  std::vector<FrameCell> border_cells(const Region& region, FrameStyle style) const;
  static Region content_area(const Region& region);
  FrameDrawResult draw(ITerminalSurface& surface, const std::vector<FrameCell>& cells) const;
};

const char* frame_result_name(FrameDrawResult r);
