#include "frame_renderer.hpp"
#include "config.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

static const GlyphSet kSingle{"─", "│", "┌", "┐", "└", "┘"};
static const GlyphSet kDouble{"═", "║", "╔", "╗", "╚", "╝"};
static const GlyphSet kThick{"━", "┃", "┏", "┓", "┗", "┛"};
static const GlyphSet kRounded{"─", "│", "╭", "╮", "╰", "╯"};
static const GlyphSet kAscii{"-", "|", "+", "+", "+", "+"};

const GlyphSet& glyphs_for(FrameStyle style) {
  switch (style) {
    case FrameStyle::Single: return kSingle;
    case FrameStyle::Double: return kDouble;
    case FrameStyle::Thick: return kThick;
    case FrameStyle::Rounded: return kRounded;
  }
  return kSingle;
}

const GlyphSet& ascii_glyphs() { return kAscii; }

const char* frame_style_name(FrameStyle style) {
  switch (style) {
    case FrameStyle::Single: return "single";
    case FrameStyle::Double: return "double";
    case FrameStyle::Thick: return "thick";
    case FrameStyle::Rounded: return "rounded";
  }
  return "single";
}

std::optional<FrameStyle> parse_frame_style(std::string_view name) {
  if (name == "single") return FrameStyle::Single;
  if (name == "double") return FrameStyle::Double;
  if (name == "thick") return FrameStyle::Thick;
  if (name == "rounded") return FrameStyle::Rounded;
  return std::nullopt;
}

FrameStyle default_frame_style() {
  return parse_frame_style(QV_DEFAULT_FRAME_STYLE_NAME).value_or(FrameStyle::Single);
}

const char* frame_result_name(FrameDrawResult r) {
  switch (r) {
    case FrameDrawResult::Drawn: return "drawn";
    case FrameDrawResult::AsciiFallback: return "ascii";
    case FrameDrawResult::Omitted: return "omitted";
    case FrameDrawResult::Skipped: return "skipped";
  }
  return "unknown";
}

std::vector<FrameCell> FrameRenderer::border_cells(const Region& r, FrameStyle style) const {
  std::vector<FrameCell> cells;
  if (r.height < 3 || r.width < 3) return cells;
  const GlyphSet& g = glyphs_for(style);
  const GlyphSet& a = ascii_glyphs();
  cells.reserve(static_cast<size_t>(2 * r.width + 2 * (r.height - 2)));
  int bottom = r.y + r.height - 1;
  int right = r.x + r.width - 1;

  cells.push_back({r.y, r.x, g.top_left, a.top_left});
  for (int c = r.x + 1; c < right; ++c) cells.push_back({r.y, c, g.horizontal, a.horizontal});
  cells.push_back({r.y, right, g.top_right, a.top_right});
  for (int row = r.y + 1; row < bottom; ++row) {
    cells.push_back({row, r.x, g.vertical, a.vertical});
    cells.push_back({row, right, g.vertical, a.vertical});
  }
  cells.push_back({bottom, r.x, g.bottom_left, a.bottom_left});
  for (int c = r.x + 1; c < right; ++c) cells.push_back({bottom, c, g.horizontal, a.horizontal});
  cells.push_back({bottom, right, g.bottom_right, a.bottom_right});
  return cells;
}

Region FrameRenderer::content_area(const Region& r) {
  return Region{r.y + 1, r.x + 1, std::max(0, r.height - 2), std::max(0, r.width - 2)};
}

FrameDrawResult FrameRenderer::draw(ITerminalSurface& surface, const std::vector<FrameCell>& cells) const {
  if (cells.empty()) return FrameDrawResult::Skipped;
  auto put_all = [&](bool ascii) {
    bool ok = true;
    for (const auto& c : cells) {
      if (!surface.put_char(c.row, c.col, ascii ? c.fallback : c.glyph, Style{})) ok = false;
    }
    return ok;
  };
  if (put_all(false)) return FrameDrawResult::Drawn;
  spdlog::warn("frame at {},{}: glyphs rejected, retrying with ascii", cells.front().row, cells.front().col);
  if (put_all(true)) return FrameDrawResult::AsciiFallback;

  int blanked = 0;
  for (const auto& c : cells) {
    if (surface.put_char(c.row, c.col, " ", Style{})) blanked++;
  }
  spdlog::warn("frame at {},{}: ascii rejected, border omitted ({} of {} cells blanked)",
               cells.front().row, cells.front().col, blanked, cells.size());
  return FrameDrawResult::Omitted;
}
