#pragma once
/*
 * RenderCoordinator
 *
 * Purpose: diff each snapshot against the last one, rebuild only the regions whose
 *          data changed and emit draw operations for those regions alone.
 * Field groups: title/author/version -> top; nav items/selection -> left;
 *               body -> main; status/mode/command input/stats -> bottom.
 * Constraint: render thread only; the snapshot is a value, never shared state.
 */
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "content_buffer.hpp"
#include "dirty_set.hpp"
#include "draw_op.hpp"
#include "fingerprint.hpp"
#include "frame_renderer.hpp"
#include "iterminal.hpp"
#include "layout_engine.hpp"
#include "types.hpp"

class RenderCoordinator {
public:
  explicit RenderCoordinator(const LayoutPlan& plan,
                             FrameStyle style = default_frame_style(),
                             std::shared_ptr<const IFingerprinter> fp = nullptr);

  std::vector<DrawOp> update(const AppSnapshot& snapshot);
  // Applies ops to the surface (frames through the ASCII fallback chain) and presents.
  void present(ITerminalSurface& surface, const std::vector<DrawOp>& ops);

  // New geometry: buffers re-wrap and every region is redrawn on the next update.
  void set_layout(const LayoutPlan& plan);
  const LayoutPlan& layout() const { return plan_; }
  void set_frame_style(FrameStyle style);
  FrameStyle frame_style() const { return style_; }
  void force_redraw() { dirty_.mark_all(); }

  void append_main_line(const std::string& text, const Style& style = {});
  void clear_main();
  // Replaces main content even when the text matches what was last set.
  void set_main_text(const std::string& text);
  // "[Status: <status>]" above the text; plain text when status is empty.
  void set_main_text_with_status(const std::string& text, const std::string& status);
  // Progress is clamped to [0, 1]; without it only the message is shown.
  void show_processing_status(const std::string& message, std::optional<double> progress = std::nullopt);
  void scroll_main_up(int n = 1);
  void scroll_main_down(int n = 1);
  void scroll_main_to_top();
  void scroll_main_to_bottom();

  const ContentBuffer& buffer(RegionId id) const { return buffers_[region_index(id)]; }
  const DirtySet& dirty() const { return dirty_; }
  FrameDrawResult frame_result(RegionId id) const { return frame_results_[region_index(id)]; }
  const std::optional<AppSnapshot>& last_snapshot() const { return last_; }

private:
  ContentBuffer& buf(RegionId id) { return buffers_[region_index(id)]; }
  void diff(const AppSnapshot& s);
  void refresh_region(RegionId id, const AppSnapshot& s);
  void emit_region(RegionId id, std::vector<DrawOp>& out) const;
  std::string top_line(const AppSnapshot& s) const;
  std::string bottom_line(const AppSnapshot& s, int width) const;

  LayoutPlan plan_;
  FrameStyle style_;
  FrameRenderer frames_;
  std::vector<ContentBuffer> buffers_;
  DirtySet dirty_;
  std::optional<AppSnapshot> last_;
  std::array<FrameDrawResult, kRegionCount> frame_results_{};
};
