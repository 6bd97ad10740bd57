#pragma once
/*
 * LayoutEngine
 *
 * Purpose: split the terminal into top/left/main/bottom regions.
 * Rule: top/bottom are 3 rows, left is max(25, cols/4) wide, main takes the rest.
 * Error: throws TerminalTooSmall when the terminal or any region is under its minimum.
 * Note: pure and stateless after construction; safe from any thread.
 */
#include <array>
#include <stdexcept>
#include "geometry.hpp"

struct LayoutPlan {
  int terminal_height = 0;
  int terminal_width = 0;
  Region top;
  Region left;
  Region main;
  Region bottom;

  const Region& region(RegionId id) const;
  bool operator==(const LayoutPlan&) const = default;
};

class TerminalTooSmall : public std::runtime_error {
public:
  TerminalTooSmall(TermSize current, TermSize minimum);
  TermSize current;
  TermSize minimum;
};

class LayoutEngine {
public:
  using MinimumTable = std::array<TermSize, kRegionCount>;

  LayoutEngine();
  explicit LayoutEngine(const MinimumTable& minimums);

  LayoutPlan compute_layout(int rows, int cols) const;
  TermSize region_minimum(RegionId id) const;
  static TermSize minimum_terminal_size();
  static bool terminal_fits(int rows, int cols);
  static MinimumTable default_minimums();

private:
  MinimumTable min_sizes_;
};

LayoutPlan compute_layout(int rows, int cols);
bool detect_size_change(const LayoutPlan& plan, int rows, int cols);
