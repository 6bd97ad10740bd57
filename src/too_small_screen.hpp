#pragma once
/*
 * TooSmallScreen
 *
 * Purpose: fixed error screen shown while the terminal is below the layout minimum.
 * Note: raw centered writes through the surface only; no layout, wrapping or buffers.
 */
#include <string>
#include <vector>
#include "iterminal.hpp"
#include "layout_engine.hpp"

std::vector<std::string> too_small_lines(const TerminalTooSmall& err);
void draw_too_small_screen(ITerminalSurface& surface, const TerminalTooSmall& err);
