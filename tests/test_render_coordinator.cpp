#include "render_coordinator.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <memory>
#include <set>
#include <string>
#include <vector>

static AppSnapshot sample() {
  AppSnapshot s;
  s.title = "Demo";
  s.author = "someone";
  s.version = "1.0";
  s.nav_items = {"One", "Two"};
  s.selected_index = 0;
  s.body_text = "hello\nworld";
  s.status = "ok";
  return s;
}

static RenderCoordinator make(const LayoutPlan& plan) {
  return RenderCoordinator(plan, FrameStyle::Single, std::make_shared<IdentityFingerprinter>());
}

static std::set<RegionId> regions(const std::vector<DrawOp>& ops) {
  std::set<RegionId> out;
  for (const auto& op : ops) out.insert(op.region);
  return out;
}

static void check_order(const std::vector<DrawOp>& ops) {
  for (size_t i = 1; i < ops.size(); ++i) {
    const DrawOp& a = ops[i - 1];
    const DrawOp& b = ops[i];
    assert(region_index(a.region) <= region_index(b.region));
    if (a.region != b.region) {
      assert(b.kind == DrawOpKind::Clear);
      continue;
    }
    assert(b.kind != DrawOpKind::Clear);
    if (a.kind == DrawOpKind::Clear) continue;
    assert(a.row < b.row || (a.row == b.row && a.col < b.col));
  }
}

static bool row_contains(const HeadlessTerminal& t, int row, const std::string& s) {
  return t.text_at(row).find(s) != std::string::npos;
}

static void test_first_update_draws_everything() {
  LayoutPlan plan = compute_layout(60, 120);
  RenderCoordinator rc = make(plan);
  auto ops = rc.update(sample());
  assert(!ops.empty());
  assert(ops.front().kind == DrawOpKind::Clear);
  assert(ops.front().region == RegionId::Top);
  assert(ops.front().area == plan.top);
  assert(regions(ops).size() == 4);
  check_order(ops);
  assert(!rc.dirty().any_dirty());

  HeadlessTerminal term(60, 120);
  rc.present(term, ops);
  assert(term.present_count() == 1);
  assert(term.glyph_at(0, 0) == "┌");
  assert(term.glyph_at(2, 119) == "┘");
  assert(row_contains(term, 1, "Demo | someone - v1.0"));
  // "Demo | someone - v1.0" is 21 cells, centered in 118
  assert(term.glyph_at(1, 1 + 48) == "D");
  assert(term.style_at(1, 1 + 48).weight == Weight::Bold);
  assert(row_contains(term, 4, "> One"));
  assert(term.style_at(4, 1).decoration == Decoration::Reverse);
  assert(row_contains(term, 5, "2. Two"));
  assert(term.text_at(4).find("hello") != std::string::npos);
  assert(term.glyph_at(4, 31) == "h");
  assert(term.glyph_at(5, 31) == "w");
  assert(row_contains(term, 58, "Status: ok | Commands: 0 | Lines: 0 | Uptime: 0s"));
  for (RegionId id : kRegionOrder) assert(rc.frame_result(id) == FrameDrawResult::Drawn);
}

static void test_same_snapshot_is_silent() {
  RenderCoordinator rc = make(compute_layout(60, 120));
  AppSnapshot s = sample();
  assert(!rc.update(s).empty());
  assert(rc.update(s).empty());
  assert(rc.update(s).empty());
}

static void test_field_groups() {
  RenderCoordinator rc = make(compute_layout(60, 120));
  AppSnapshot s = sample();
  rc.update(s);

  s.status = "busy";
  assert((regions(rc.update(s)) == std::set<RegionId>{RegionId::Bottom}));
  s.stats.uptime_seconds = 5;
  assert((regions(rc.update(s)) == std::set<RegionId>{RegionId::Bottom}));
  s.mode = Mode::Input;
  s.command_input = "app";
  assert((regions(rc.update(s)) == std::set<RegionId>{RegionId::Bottom}));
  assert(rc.buffer(RegionId::Bottom).lines()[0].text() == "Command: app_");

  s.selected_index = 1;
  assert((regions(rc.update(s)) == std::set<RegionId>{RegionId::Left}));
  s.nav_items.push_back("Three");
  assert((regions(rc.update(s)) == std::set<RegionId>{RegionId::Left}));

  s.title = "Other";
  assert((regions(rc.update(s)) == std::set<RegionId>{RegionId::Top}));

  s.body_text = "changed";
  assert((regions(rc.update(s)) == std::set<RegionId>{RegionId::Main}));

  s.title = "Again";
  s.status = "both";
  assert((regions(rc.update(s)) == std::set<RegionId>{RegionId::Top, RegionId::Bottom}));
}

static void test_selection_clamped() {
  RenderCoordinator rc = make(compute_layout(60, 120));
  AppSnapshot s = sample();
  s.selected_index = 99;
  rc.update(s);
  assert(rc.last_snapshot()->selected_index == 1);
  s.selected_index = 1;
  assert(rc.update(s).empty());
  s.selected_index = -4;
  assert(!rc.update(s).empty());
  assert(rc.last_snapshot()->selected_index == 0);
}

static void test_main_pass_throughs() {
  RenderCoordinator rc = make(compute_layout(60, 120));
  AppSnapshot s = sample();
  rc.update(s);

  rc.append_main_line("appended");
  auto ops = rc.update(s);
  assert((regions(ops) == std::set<RegionId>{RegionId::Main}));
  assert(rc.buffer(RegionId::Main).line_count() == 3);
  assert(rc.buffer(RegionId::Main).lines()[2].text() == "appended");
  // the unchanged body does not overwrite the appended line
  assert(rc.update(s).empty());
  assert(rc.buffer(RegionId::Main).line_count() == 3);

  rc.scroll_main_up(1);
  assert(rc.update(s).empty());
  for (int i = 0; i < 100; ++i) rc.append_main_line("more " + std::to_string(i));
  rc.update(s);
  assert(rc.buffer(RegionId::Main).scroll_offset() == rc.buffer(RegionId::Main).max_scroll());
  rc.scroll_main_to_top();
  assert((regions(rc.update(s)) == std::set<RegionId>{RegionId::Main}));
  rc.scroll_main_down(3);
  rc.update(s);
  assert(rc.buffer(RegionId::Main).scroll_offset() == 3);
  rc.scroll_main_to_bottom();
  rc.update(s);

  rc.clear_main();
  assert((regions(rc.update(s)) == std::set<RegionId>{RegionId::Main}));
  assert(rc.buffer(RegionId::Main).empty());
}

static void test_main_text_after_clear() {
  RenderCoordinator rc = make(compute_layout(60, 120));
  AppSnapshot s = sample();
  rc.update(s);
  rc.clear_main();
  rc.update(s);
  assert(rc.buffer(RegionId::Main).empty());

  // the same body again must come back, not be suppressed
  rc.set_main_text(s.body_text);
  auto ops = rc.update(s);
  assert((regions(ops) == std::set<RegionId>{RegionId::Main}));
  assert(rc.buffer(RegionId::Main).line_count() == 2);
  assert(rc.buffer(RegionId::Main).lines()[0].text() == "hello");
  HeadlessTerminal t(60, 120);
  rc.present(t, ops);
  assert(row_contains(t, rc.layout().main.y + 1, "hello"));

  rc.set_main_text(s.body_text);
  assert((regions(rc.update(s)) == std::set<RegionId>{RegionId::Main}));
}

static void test_main_status_and_progress() {
  RenderCoordinator rc = make(compute_layout(60, 120));
  AppSnapshot s = sample();
  rc.update(s);
  const ContentBuffer& main = rc.buffer(RegionId::Main);

  rc.set_main_text_with_status("body", "loading");
  assert((regions(rc.update(s)) == std::set<RegionId>{RegionId::Main}));
  assert(main.line_count() == 3);
  assert(main.lines()[0].text() == "[Status: loading]");
  assert(main.lines()[1].text().empty());
  assert(main.lines()[2].text() == "body");
  rc.set_main_text_with_status("body", "");
  rc.update(s);
  assert(main.line_count() == 1 && main.lines()[0].text() == "body");

  rc.show_processing_status("copy", 0.5);
  rc.update(s);
  assert(main.line_count() == 5);
  assert(main.lines()[0].text() == "Processing: copy");
  std::string half = "Progress: [";
  for (int i = 0; i < 20; ++i) half += "█";
  for (int i = 0; i < 20; ++i) half += "░";
  half += "] 50%";
  assert(main.lines()[2].text() == half);
  assert(main.lines()[4].text() == "Please wait while the operation completes...");

  rc.show_processing_status("copy", 3.0);
  rc.update(s);
  assert(main.lines()[2].text().find("] 100%") != std::string::npos);
  assert(main.lines()[2].text().find("░") == std::string::npos);
  rc.show_processing_status("copy", -1.0);
  rc.update(s);
  assert(main.lines()[2].text().find("] 0%") != std::string::npos);

  rc.show_processing_status("scan");
  rc.update(s);
  assert(main.line_count() == 3);
  assert(main.lines()[2].text() == "Please wait while the operation completes...");
}

static void test_frame_style_and_layout_changes() {
  RenderCoordinator rc = make(compute_layout(60, 120));
  AppSnapshot s = sample();
  rc.update(s);

  rc.set_frame_style(FrameStyle::Double);
  auto ops = rc.update(s);
  assert(regions(ops).size() == 4);
  HeadlessTerminal term(60, 120);
  rc.present(term, ops);
  assert(term.glyph_at(0, 0) == "╔");
  rc.set_frame_style(FrameStyle::Double);
  assert(rc.update(s).empty());

  rc.append_main_line("kept across resize");
  rc.update(s);
  LayoutPlan bigger = compute_layout(80, 200);
  rc.set_layout(bigger);
  assert(rc.layout() == bigger);
  ops = rc.update(s);
  assert(regions(ops).size() == 4);
  check_order(ops);
  assert(rc.buffer(RegionId::Main).viewport_width() == bigger.main.width - 2);
  assert(rc.buffer(RegionId::Main).lines().back().text() == "kept across resize");
  for (const auto& line : rc.buffer(RegionId::Left).lines()) assert(line.width() == bigger.left.width - 2);
  rc.force_redraw();
  assert(regions(rc.update(s)).size() == 4);
}

static void test_ascii_fallback_at_present() {
  RenderCoordinator rc = make(compute_layout(60, 120));
  auto ops = rc.update(sample());
  HeadlessTerminal term(60, 120);
  term.reject_glyphs(is_non_ascii);
  rc.present(term, ops);
  assert(term.glyph_at(0, 0) == "+");
  assert(term.glyph_at(0, 1) == "-");
  assert(term.glyph_at(1, 0) == "|");
  for (RegionId id : kRegionOrder) assert(rc.frame_result(id) == FrameDrawResult::AsciiFallback);
  // content is still drawn
  assert(term.glyph_at(4, 31) == "h");
}

static void test_bottom_lines() {
  RenderCoordinator rc = make(compute_layout(60, 120));
  AppSnapshot s = sample();
  s.status.clear();
  s.stats = StatsSnapshot{42, 7, 3, "append hi"};
  rc.update(s);
  assert(rc.buffer(RegionId::Bottom).lines()[0].text() ==
         "Press Tab to switch to input mode | Commands: 3 (last: append hi) | Lines: 7 | Uptime: 42s");

  s.mode = Mode::Input;
  s.command_input = std::string(200, 'x') + "END";
  rc.update(s);
  std::string line = rc.buffer(RegionId::Bottom).lines()[0].text();
  assert(line.rfind("Command: ", 0) == 0);
  assert(line.size() == 118);
  assert(line.substr(line.size() - 4) == "END_");
}

static void test_top_line_parts() {
  RenderCoordinator rc = make(compute_layout(60, 120));
  AppSnapshot s;
  s.title = "Only";
  rc.update(s);
  std::string top = rc.buffer(RegionId::Top).lines()[0].text();
  assert(top.find("Only") != std::string::npos);
  assert(top.find('|') == std::string::npos);
  // centered within the 118-cell interior
  assert(top.size() == static_cast<size_t>((118 - 4) / 2 + 4));
  assert(rc.buffer(RegionId::Left).lines()[0].text() == "No items");
}

int main() {
  test_first_update_draws_everything();
  test_same_snapshot_is_silent();
  test_field_groups();
  test_selection_clamped();
  test_main_pass_throughs();
  test_main_text_after_clear();
  test_main_status_and_progress();
  test_frame_style_and_layout_changes();
  test_ascii_fallback_at_present();
  test_bottom_lines();
  test_top_line_parts();
  return 0;
}
