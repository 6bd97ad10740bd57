#include "app.hpp"
#include "file_reader.hpp"
#include "too_small_screen.hpp"
#include <ncurses.h>
#include <algorithm>
#include <spdlog/spdlog.h>

static const char* kTitle = "Quadview Demo";
static const char* kAuthor = "quadview";

static std::string join_lines(const std::vector<std::string>& lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) out += '\n';
    out += lines[i];
  }
  return out;
}

static void pop_utf8_char(std::string& s) {
  if (s.empty()) return;
  size_t i = s.size() - 1;
  while (i > 0 && (static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) i--;
  s.erase(i);
}

App::App(const std::optional<std::filesystem::path>& file, const Settings& settings,
         const std::string& startup_message)
  : settings_(settings), worker_(settings.stats_interval), status_(startup_message), file_(file) {
  sections_ = {Section::Home, Section::Layout, Section::Styles, Section::Log};
  if (file_) {
    std::string msg;
    if (!read_lines(*file_, file_lines_, msg)) spdlog::warn("{}", msg);
    file_message_ = msg;
    if (status_.empty()) status_ = msg;
    sections_.push_back(Section::File);
  }
  register_commands();
  body_ = body_for(active_);
}

void App::run() {
  worker_.start();
  relayout();
  while (!should_quit_) {
    render();
    int ch = getch();
    handle_input(ch);
  }
  if (!worker_.stop(std::chrono::milliseconds(QV_WORKER_JOIN_TIMEOUT_MS)))
    spdlog::warn("exiting with the stats worker still running");
}

void App::relayout() {
  TermSize sz = term_.size();
  try {
    LayoutPlan plan = engine_.compute_layout(sz.rows, sz.cols);
    if (!coord_) coord_.emplace(plan, settings_.frame_style);
    else if (coord_->layout() != plan) coord_->set_layout(plan);
    too_small_.reset();
    too_small_drawn_ = false;
    term_.clear_all();
    coord_->force_redraw();
    if (active_ == Section::Layout) body_ = body_for(active_);
  } catch (const TerminalTooSmall& e) {
    spdlog::warn("{}", e.what());
    too_small_ = e;
    too_small_drawn_ = false;
  }
}

AppSnapshot App::snapshot() const {
  AppSnapshot s;
  s.title = kTitle;
  s.author = kAuthor;
  s.version = QV_VERSION;
  for (Section sec : sections_) {
    switch (sec) {
      case Section::Home: s.nav_items.push_back("Home"); break;
      case Section::Layout: s.nav_items.push_back("Layout"); break;
      case Section::Styles: s.nav_items.push_back("Styles"); break;
      case Section::Log: s.nav_items.push_back("Log"); break;
      case Section::File: s.nav_items.push_back("File: " + file_->filename().string()); break;
    }
  }
  s.selected_index = selected_;
  s.body_text = body_;
  s.status = status_;
  s.mode = mode_;
  s.command_input = cmdline_;
  WorkerStats ws = worker_.snapshot();
  s.stats.uptime_seconds = ws.uptime_seconds;
  s.stats.content_lines = coord_ ? coord_->buffer(RegionId::Main).line_count() : 0;
  s.stats.total_commands = total_commands_;
  s.stats.last_command = last_command_;
  return s;
}

void App::render() {
  TermSize sz = term_.size();
  if (too_small_) {
    if (sz != too_small_->current) { relayout(); return; }
    if (!too_small_drawn_) {
      draw_too_small_screen(term_, *too_small_);
      too_small_drawn_ = true;
    }
    return;
  }
  if (!coord_) return;
  if (detect_size_change(coord_->layout(), sz.rows, sz.cols)) {
    relayout();
    if (too_small_) return;
  }
  std::vector<DrawOp> ops = coord_->update(snapshot());
  if (!ops.empty()) coord_->present(term_, ops);
}

void App::handle_input(int ch) {
  if (too_small_) {
    if (ch == 'q' || ch == 'Q') should_quit_ = true;
    else if (ch == KEY_RESIZE) relayout();
    return;
  }
  if (mode_ == Mode::Input) handle_input_key(input_.decode_input(ch));
  else handle_display_key(input_.decode_display(ch));
}

void App::handle_display_key(const KeyAction& k) {
  int page = coord_ ? std::max(1, coord_->buffer(RegionId::Main).viewport_height()) : 1;
  switch (k.action) {
    case Action::Up: move_selection(-k.count); break;
    case Action::Down: move_selection(k.count); break;
    case Action::Activate: activate(selected_); break;
    case Action::PageUp: if (coord_) coord_->scroll_main_up(page * k.count); break;
    case Action::PageDown: if (coord_) coord_->scroll_main_down(page * k.count); break;
    case Action::Top: if (coord_) coord_->scroll_main_to_top(); break;
    case Action::Bottom: if (coord_) coord_->scroll_main_to_bottom(); break;
    case Action::ToggleMode: mode_ = Mode::Input; input_.reset(); break;
    case Action::Quit: should_quit_ = true; break;
    case Action::Resize: relayout(); break;
    default: break;
  }
}

void App::handle_input_key(const KeyAction& k) {
  switch (k.action) {
    case Action::InsertChar: cmdline_.push_back(static_cast<char>(k.ch)); break;
    case Action::Backspace: pop_utf8_char(cmdline_); break;
    case Action::Submit:
      execute_command();
      cmdline_.clear();
      mode_ = Mode::Display;
      break;
    case Action::ToggleMode: mode_ = Mode::Display; break;
    case Action::Resize: relayout(); break;
    default: break;
  }
}

void App::move_selection(int delta) {
  int n = static_cast<int>(sections_.size());
  selected_ = std::clamp(selected_ + delta, 0, std::max(0, n - 1));
}

void App::activate(int index) {
  if (index < 0 || index >= static_cast<int>(sections_.size())) return;
  selected_ = index;
  active_ = sections_[index];
  body_ = body_for(active_);
  // re-opening a section restores its text after clear or progress output
  if (coord_) coord_->set_main_text(body_);
  status_ = "Opened " + snapshot().nav_items[index];
}

std::string App::body_for(Section s) const {
  switch (s) {
    case Section::Home:
      return "Welcome to quadview.\n"
             "\n"
             "Four framed regions: title bar, navigation, main content and status bar.\n"
             "Only regions whose data changed are redrawn.\n"
             "\n"
             "Keys (display mode):\n"
             "  Up/Down or k/j   move the selection (counts allowed, e.g. 3j)\n"
             "  Enter            open the selected section\n"
             "  PgUp/PgDn        scroll the main region\n"
             "  gg/G, Home/End   jump to top/bottom\n"
             "  Tab              switch to input mode\n"
             "  q                quit\n"
             "\n"
             "Commands (input mode): status <text>, append <text>, clear, frame <style>,\n"
             "progress <percent> [message], goto <n>, set name=value, quit";
    case Section::Layout: {
      if (!coord_) return "No layout yet.";
      const LayoutPlan& p = coord_->layout();
      std::string out = "Terminal: " + std::to_string(p.terminal_height) + "x" +
                        std::to_string(p.terminal_width) + "\n\n";
      for (RegionId id : kRegionOrder) {
        const Region& r = p.region(id);
        TermSize min = engine_.region_minimum(id);
        out += std::string(region_name(id)) + ": y=" + std::to_string(r.y) + " x=" + std::to_string(r.x) +
               " h=" + std::to_string(r.height) + " w=" + std::to_string(r.width) +
               " (min " + std::to_string(min.rows) + "x" + std::to_string(min.cols) + ")\n";
      }
      TermSize m = LayoutEngine::minimum_terminal_size();
      out += "\nMinimum terminal: " + std::to_string(m.rows) + "x" + std::to_string(m.cols);
      return out;
    }
    case Section::Styles: {
      std::string out = "Frame styles (change with: frame <name>)\n\n";
      for (FrameStyle fs : {FrameStyle::Single, FrameStyle::Double, FrameStyle::Thick, FrameStyle::Rounded}) {
        const GlyphSet& g = glyphs_for(fs);
        out += std::string("  ") + g.top_left + g.horizontal + g.horizontal + g.top_right + "  " +
               frame_style_name(fs) + "\n";
      }
      out += "\nCurrent: ";
      out += frame_style_name(settings_.frame_style);
      return out;
    }
    case Section::Log:
      return log_lines_.empty() ? std::string("Log is empty. Use: append <text>")
                                : join_lines(log_lines_);
    case Section::File:
      if (file_lines_.empty()) return file_message_;
      return join_lines(file_lines_);
  }
  return std::string();
}

void App::execute_command() {
  std::string line = normalize_command_line(cmdline_);
  if (line.empty()) return;
  total_commands_++;
  last_command_ = line;
  std::string msg;
  if (!registry_.execute_line(line, msg)) spdlog::info("command failed: {}: {}", line, msg);
  status_ = msg;
}

void App::apply_live_settings() {
  if (coord_) coord_->set_frame_style(settings_.frame_style);
  spdlog::set_level(settings_.log_level);
  if (active_ == Section::Styles) body_ = body_for(active_);
}
