#include "app.hpp"
#include <string>
#include <spdlog/spdlog.h>

static std::string join_args(const std::vector<std::string>& args) {
  std::string out;
  for (size_t i = 0; i < args.size(); ++i) {
    if (i) out += ' ';
    out += args[i];
  }
  return out;
}

void App::register_commands() {
  registry_.register_command("status", [](const std::vector<std::string>& args, std::string& msg) {
    // the status line itself shows msg
    msg = join_args(args);
    return true;
  });
  registry_.register_command("append", [this](const std::vector<std::string>& args, std::string& msg) {
    std::string text = join_args(args);
    log_lines_.push_back(text);
    if (active_ == Section::Log && coord_) {
      if (log_lines_.size() == 1) {
        // replace the empty-log placeholder
        coord_->clear_main();
      }
      coord_->append_main_line(text);
      msg = "appended";
    } else {
      msg = "appended to Log (" + std::to_string(log_lines_.size()) + " lines)";
    }
    return true;
  });
  registry_.register_command("clear", [this](const std::vector<std::string>&, std::string& msg) {
    if (active_ == Section::Log) log_lines_.clear();
    if (coord_) coord_->clear_main();
    msg = "cleared";
    return true;
  });
  registry_.register_command("progress", [this](const std::vector<std::string>& args, std::string& msg) {
    int pct = -1;
    if (!args.empty()) {
      try { pct = std::stoi(args[0]); } catch (const std::exception&) { pct = -1; }
    }
    if (pct < 0) { msg = "progress: use progress <percent> [message]"; return false; }
    if (!coord_) { msg = "progress: no layout"; return false; }
    if (pct >= 100) {
      coord_->set_main_text_with_status(body_, "done");
      msg = "done";
      return true;
    }
    std::string what = "working";
    if (args.size() > 1) what = join_args(std::vector<std::string>(args.begin() + 1, args.end()));
    coord_->show_processing_status(what, pct / 100.0);
    msg = what + " " + std::to_string(pct) + "%";
    return true;
  });
  registry_.register_command("frame", [this](const std::vector<std::string>& args, std::string& msg) {
    auto style = args.empty() ? std::nullopt : parse_frame_style(args[0]);
    if (!style) { msg = "frame: use single|double|thick|rounded"; return false; }
    settings_.frame_style = *style;
    apply_live_settings();
    msg = std::string("frame ") + frame_style_name(*style);
    return true;
  });
  registry_.register_command("goto", [this](const std::vector<std::string>& args, std::string& msg) {
    int n = 0;
    if (!args.empty()) {
      try { n = std::stoi(args[0]); } catch (const std::exception&) { n = 0; }
    }
    if (n < 1 || n > static_cast<int>(sections_.size())) {
      msg = "goto: use a section number 1-" + std::to_string(sections_.size());
      return false;
    }
    activate(n - 1);
    msg = status_;
    return true;
  });
  registry_.register_command("quit", [this](const std::vector<std::string>&, std::string& msg) {
    should_quit_ = true;
    msg = "bye";
    return true;
  });
  registry_.register_command("q", [this](const std::vector<std::string>&, std::string& msg) {
    should_quit_ = true;
    msg = "bye";
    return true;
  });

  // "set" commands write settings_; frame style and log level also apply live
  for (const char* name : {"set framestyle", "set loglevel"}) {
    CommandRegistry inner;
    register_setting_commands(inner, settings_);
    registry_.register_command(name, [this, inner, name = std::string(name)](
                                   const std::vector<std::string>& args, std::string& msg) {
      if (!inner.execute(name, args, msg)) return false;
      apply_live_settings();
      return true;
    });
  }
  for (const char* name : {"set logfile", "set statsinterval"}) {
    CommandRegistry inner;
    register_setting_commands(inner, settings_);
    registry_.register_command(name, [inner, name = std::string(name)](
                                   const std::vector<std::string>& args, std::string& msg) {
      if (!inner.execute(name, args, msg)) return false;
      msg += " (applies on next start)";
      spdlog::info("{}", msg);
      return true;
    });
  }
}
