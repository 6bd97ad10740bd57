#pragma once
/*
 * DrawOp
 *
 * Purpose: one entry of the draw-operation stream RenderCoordinator emits.
 * Order: regions top, left, main, bottom; within a region a Clear first, then
 *        cells/runs top-to-bottom, left-to-right.
 */
#include <string>
#include "geometry.hpp"
#include "style.hpp"

enum class DrawOpKind { Clear, PutChar, PutRun };

struct DrawOp {
  RegionId region = RegionId::Top;
  DrawOpKind kind = DrawOpKind::Clear;
  int row = 0;
  int col = 0;
  std::string glyph;    // PutChar
  std::string fallback; // PutChar: ASCII replacement, set only on frame cells
  StyledRun run;        // PutRun
  Region area;          // Clear

  bool is_frame() const { return kind == DrawOpKind::PutChar && !fallback.empty(); }
};
