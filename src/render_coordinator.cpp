#include "render_coordinator.hpp"
#include "nav_list.hpp"
#include "utf8.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

static const char* kDisplayHint = "Press Tab to switch to input mode";
static const char* kInputPrompt = "Command: ";
static const int kLastCommandCells = 20;
static const int kProgressBarCells = 40;

static std::string progress_bar(double progress) {
  int filled = static_cast<int>(kProgressBarCells * progress);
  std::string bar;
  for (int i = 0; i < kProgressBarCells; ++i) bar += i < filled ? "█" : "░";
  return bar;
}

RenderCoordinator::RenderCoordinator(const LayoutPlan& plan, FrameStyle style,
                                     std::shared_ptr<const IFingerprinter> fp)
  : plan_(plan), style_(style) {
  if (!fp) fp = default_fingerprinter();
  buffers_.reserve(kRegionCount);
  for (RegionId id : kRegionOrder) {
    Region inner = FrameRenderer::content_area(plan_.region(id));
    buffers_.emplace_back(inner.width, inner.height, fp);
  }
  frame_results_.fill(FrameDrawResult::Skipped);
  dirty_.mark_all();
}

void RenderCoordinator::set_layout(const LayoutPlan& plan) {
  plan_ = plan;
  for (RegionId id : kRegionOrder) {
    Region inner = FrameRenderer::content_area(plan_.region(id));
    buf(id).resize(inner.width, inner.height);
    // derived regions are regenerated at the new width on the next update
    if (id != RegionId::Main) buf(id).invalidate_fingerprint();
  }
  dirty_.mark_all();
  spdlog::info("layout set to {}x{}", plan_.terminal_height, plan_.terminal_width);
}

void RenderCoordinator::set_frame_style(FrameStyle style) {
  if (style == style_) return;
  style_ = style;
  dirty_.mark_all();
}

void RenderCoordinator::append_main_line(const std::string& text, const Style& style) {
  buf(RegionId::Main).append_line(text, style);
}
void RenderCoordinator::clear_main() { buf(RegionId::Main).clear(); }

void RenderCoordinator::set_main_text(const std::string& text) {
  ContentBuffer& b = buf(RegionId::Main);
  b.invalidate_fingerprint();
  b.set_text(text);
}

void RenderCoordinator::set_main_text_with_status(const std::string& text, const std::string& status) {
  if (status.empty()) set_main_text(text);
  else set_main_text("[Status: " + status + "]\n\n" + text);
}

void RenderCoordinator::show_processing_status(const std::string& message, std::optional<double> progress) {
  std::string text = "Processing: " + message + "\n\n";
  if (progress) {
    double p = std::clamp(*progress, 0.0, 1.0);
    text += "Progress: [" + progress_bar(p) + "] " + std::to_string(static_cast<int>(p * 100)) + "%\n\n";
  }
  text += "Please wait while the operation completes...";
  set_main_text(text);
}
void RenderCoordinator::scroll_main_up(int n) { buf(RegionId::Main).scroll_up(n); }
void RenderCoordinator::scroll_main_down(int n) { buf(RegionId::Main).scroll_down(n); }
void RenderCoordinator::scroll_main_to_top() { buf(RegionId::Main).scroll_to_top(); }
void RenderCoordinator::scroll_main_to_bottom() { buf(RegionId::Main).scroll_to_bottom(); }

void RenderCoordinator::diff(const AppSnapshot& s) {
  if (!last_) {
    dirty_.mark_all();
    return;
  }
  const AppSnapshot& p = *last_;
  if (s.title != p.title || s.author != p.author || s.version != p.version)
    dirty_.mark_dirty(RegionId::Top);
  if (s.nav_items != p.nav_items || s.selected_index != p.selected_index)
    dirty_.mark_dirty(RegionId::Left);
  if (s.body_text != p.body_text)
    dirty_.mark_dirty(RegionId::Main);
  if (s.status != p.status || s.mode != p.mode || s.command_input != p.command_input ||
      !(s.stats == p.stats))
    dirty_.mark_dirty(RegionId::Bottom);
}

std::string RenderCoordinator::top_line(const AppSnapshot& s) const {
  std::string info;
  if (!s.author.empty()) info = s.author;
  if (!s.version.empty()) {
    if (!info.empty()) info += " - ";
    info += "v" + s.version;
  }
  if (s.title.empty()) return info;
  if (info.empty()) return s.title;
  return s.title + " | " + info;
}

std::string RenderCoordinator::bottom_line(const AppSnapshot& s, int width) const {
  if (s.mode == Mode::Input) {
    std::string prompt = kInputPrompt;
    std::string line = prompt + s.command_input + "_";
    if (utf8_length(line) <= width) return line;
    int avail = width - utf8_length(prompt) - 1;
    if (avail <= 0) return utf8_prefix(line, width);
    // keep the cursor end of the input visible
    return prompt + utf8_suffix(s.command_input, avail) + "_";
  }

  std::string line = s.status.empty() ? std::string(kDisplayHint) : "Status: " + s.status;
  line += " | Commands: " + std::to_string(s.stats.total_commands);
  if (!s.stats.last_command.empty()) {
    std::string last = s.stats.last_command;
    if (utf8_length(last) > kLastCommandCells) last = utf8_prefix(last, kLastCommandCells - 3) + "...";
    line += " (last: " + last + ")";
  }
  line += " | Lines: " + std::to_string(s.stats.content_lines);
  line += " | Uptime: " + std::to_string(s.stats.uptime_seconds) + "s";
  return utf8_prefix(line, width);
}

void RenderCoordinator::refresh_region(RegionId id, const AppSnapshot& s) {
  ContentBuffer& b = buf(id);
  switch (id) {
    case RegionId::Top:
      b.set_centered_text(top_line(s), bold_style());
      break;
    case RegionId::Left: {
      NavListView view = format_nav_list(s.nav_items, s.selected_index,
                                         b.viewport_width(), b.viewport_height());
      b.set_formatted(view.runs);
      break;
    }
    case RegionId::Main:
      // redraw-only passes (resize, scroll, append) keep what the buffer holds
      if (!last_ || last_->body_text != s.body_text) b.set_text(s.body_text);
      break;
    case RegionId::Bottom:
      b.set_text(bottom_line(s, b.viewport_width()));
      break;
  }
}

void RenderCoordinator::emit_region(RegionId id, std::vector<DrawOp>& out) const {
  const Region& r = plan_.region(id);
  DrawOp clear;
  clear.region = id;
  clear.kind = DrawOpKind::Clear;
  clear.row = r.y;
  clear.col = r.x;
  clear.area = r;
  out.push_back(clear);

  std::vector<DrawOp> cells;
  for (const FrameCell& c : frames_.border_cells(r, style_)) {
    DrawOp op;
    op.region = id;
    op.kind = DrawOpKind::PutChar;
    op.row = c.row;
    op.col = c.col;
    op.glyph = c.glyph;
    op.fallback = c.fallback;
    cells.push_back(std::move(op));
  }

  Region inner = FrameRenderer::content_area(r);
  const ContentBuffer& b = buffers_[region_index(id)];
  int row = inner.y;
  for (const StyledLine& line : b.visible_lines()) {
    if (row >= inner.y + inner.height) break;
    int col = inner.x;
    for (const StyledRun& run : line.runs) {
      int room = inner.x + inner.width - col;
      if (room <= 0) break;
      if (run.text.empty()) continue;
      DrawOp op;
      op.region = id;
      op.kind = DrawOpKind::PutRun;
      op.row = row;
      op.col = col;
      op.run = StyledRun{utf8_prefix(run.text, room), run.style};
      col += utf8_length(op.run.text);
      cells.push_back(std::move(op));
    }
    ++row;
  }

  std::stable_sort(cells.begin(), cells.end(), [](const DrawOp& lhs, const DrawOp& rhs) {
    if (lhs.row != rhs.row) return lhs.row < rhs.row;
    return lhs.col < rhs.col;
  });
  for (DrawOp& op : cells) out.push_back(std::move(op));
}

std::vector<DrawOp> RenderCoordinator::update(const AppSnapshot& snapshot) {
  AppSnapshot s = snapshot;
  s.selected_index = clamp_selection(s.selected_index, static_cast<int>(s.nav_items.size()));

  diff(s);
  for (RegionId id : kRegionOrder) {
    if (buf(id).changed()) dirty_.mark_dirty(id);
  }

  std::vector<DrawOp> ops;
  for (RegionId id : dirty_.pending()) {
    refresh_region(id, s);
    emit_region(id, ops);
    buf(id).reset_changed();
    dirty_.mark_rendered(id);
  }
  if (!ops.empty()) spdlog::debug("update emitted {} draw ops", ops.size());

  last_ = std::move(s);
  dirty_.flush();
  return ops;
}

void RenderCoordinator::present(ITerminalSurface& surface, const std::vector<DrawOp>& ops) {
  size_t i = 0;
  int clipped = 0;
  while (i < ops.size()) {
    RegionId id = ops[i].region;
    std::vector<FrameCell> frame;
    std::vector<const DrawOp*> content;
    for (; i < ops.size() && ops[i].region == id; ++i) {
      const DrawOp& op = ops[i];
      switch (op.kind) {
        case DrawOpKind::Clear:
          surface.clear_region(op.area);
          break;
        case DrawOpKind::PutChar:
          if (op.is_frame()) frame.push_back(FrameCell{op.row, op.col, op.glyph, op.fallback});
          else content.push_back(&op);
          break;
        case DrawOpKind::PutRun:
          content.push_back(&op);
          break;
      }
    }

    frame_results_[region_index(id)] = frames_.draw(surface, frame);

    for (const DrawOp* op : content) {
      if (op->kind == DrawOpKind::PutChar) {
        if (!surface.put_char(op->row, op->col, op->glyph, Style{})) ++clipped;
        continue;
      }
      int col = op->col;
      for (const std::string& g : utf8_glyphs(op->run.text)) {
        if (!surface.put_char(op->row, col, g, op->run.style)) ++clipped;
        ++col;
      }
    }
  }
  if (clipped > 0) spdlog::debug("present: {} content cells rejected by the surface", clipped);
  surface.present();
}
