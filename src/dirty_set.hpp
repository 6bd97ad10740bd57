#pragma once
/*
 * DirtySet
 *
 * Purpose: per-region redraw state, clean -> dirty -> rendered -> clean.
 * Note: flush() also drops regions still dirty (not rendered) so a failed
 *       draw is not retried forever.
 */
#include <array>
#include <vector>
#include "geometry.hpp"

enum class RegionPhase { Clean, Dirty, Rendered };

class DirtySet {
public:
  void mark_dirty(RegionId id);
  void mark_all();
  void mark_rendered(RegionId id);
  void flush();

  RegionPhase phase(RegionId id) const { return phases_[region_index(id)]; }
  bool is_dirty(RegionId id) const { return phase(id) == RegionPhase::Dirty; }
  bool any_dirty() const;
  // dirty regions in draw order
  std::vector<RegionId> pending() const;

private:
  std::array<RegionPhase, kRegionCount> phases_{};
};
