#pragma once
/*
 * NavList
 *
 * Purpose: format navigation items into width x height styled rows for the left region.
 * Format: "N. item" padded to the width, "..." when truncated; the selected row is
 *         "> item" in reverse video. The window follows the selection and '^'/'v'
 *         in the last column flag items above/below it.
 */
#include <string>
#include <vector>
#include "style.hpp"

struct NavListView {
  std::vector<StyledRun> runs; // rows separated by "\n" runs
  int scroll_offset = 0;
  int selected = 0;
  bool more_above = false;
  bool more_below = false;
};

int clamp_selection(int selected, int count);
NavListView format_nav_list(const std::vector<std::string>& items, int selected, int width, int height);
