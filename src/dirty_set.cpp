#include "dirty_set.hpp"

void DirtySet::mark_dirty(RegionId id) { phases_[region_index(id)] = RegionPhase::Dirty; }

void DirtySet::mark_all() {
  for (RegionId id : kRegionOrder) mark_dirty(id);
}

void DirtySet::mark_rendered(RegionId id) {
  auto& p = phases_[region_index(id)];
  if (p == RegionPhase::Dirty) p = RegionPhase::Rendered;
}

void DirtySet::flush() {
  for (auto& p : phases_) p = RegionPhase::Clean;
}

bool DirtySet::any_dirty() const {
  for (RegionId id : kRegionOrder) if (is_dirty(id)) return true;
  return false;
}

std::vector<RegionId> DirtySet::pending() const {
  std::vector<RegionId> out;
  for (RegionId id : kRegionOrder) if (is_dirty(id)) out.push_back(id);
  return out;
}
