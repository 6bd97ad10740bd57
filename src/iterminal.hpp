#pragma once
/*
 * ITerminalSurface
 *
 * Purpose: the drawing capability the engine consumes (size, per-cell put, clear, present).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * Contract: put_char reports per-cell failure; a failure is recoverable and only
 *           drives the frame glyph fallback. Nothing here throws.
 */
#include <string>
#include "geometry.hpp"
#include "style.hpp"

class ITerminalSurface {
public:
  virtual ~ITerminalSurface() = default;
  virtual TermSize size() const = 0;
  // glyph is one UTF-8 encoded codepoint occupying one cell
  virtual bool put_char(int row, int col, const std::string& glyph, const Style& style) = 0;
  virtual void clear_region(const Region& region) = 0;
  virtual void present() = 0;
};
