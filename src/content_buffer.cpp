#include "content_buffer.hpp"
#include "text_wrapper.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

static std::string concat_text(const std::vector<StyledRun>& runs) {
  std::string s;
  for (const auto& r : runs) s += r.text;
  return s;
}

ContentBuffer::ContentBuffer(int width, int height, std::shared_ptr<const IFingerprinter> fp)
  : fp_(fp ? std::move(fp) : default_fingerprinter()),
    width_(std::max(0, width)),
    height_(std::max(0, height)) {}

bool ContentBuffer::same_baseline(const std::string& fp, Align align) const {
  return fingerprint_ && *fingerprint_ == fp && baseline_align_ == align;
}

void ContentBuffer::replace(Block block, std::string fp) {
  Align align = block.align;
  clear();
  blocks_.push_back(std::move(block));
  lines_ = layout_block(blocks_.back());
  scroll_offset_ = 0;
  fingerprint_ = std::move(fp);
  baseline_align_ = align;
  changed_ = true;
}

void ContentBuffer::set_text(const std::string& text) {
  std::string fp = fp_->fingerprint(text);
  if (same_baseline(fp, Align::Left)) return;
  replace(Block{{StyledRun{text, Style{}}}, Align::Left, false}, std::move(fp));
}

void ContentBuffer::set_text_with_style(const std::string& text, const Style& style) {
  set_formatted({StyledRun{text, style}});
}

void ContentBuffer::set_centered_text(const std::string& text, const Style& style) {
  std::string fp = fp_->fingerprint(text);
  if (same_baseline(fp, Align::Center)) return;
  replace(Block{{StyledRun{text, style}}, Align::Center, false}, std::move(fp));
}

void ContentBuffer::set_formatted(const std::vector<StyledRun>& runs) {
  std::string fp = fp_->fingerprint(concat_text(runs));
  if (same_baseline(fp, Align::Left)) return;
  replace(Block{runs, Align::Left, false}, std::move(fp));
}

void ContentBuffer::append_block(Block block) {
  int before = line_count();
  bool at_bottom = scroll_offset_ + height_ >= before;
  auto added = layout_block(block);
  blocks_.push_back(std::move(block));
  lines_.insert(lines_.end(), std::make_move_iterator(added.begin()), std::make_move_iterator(added.end()));
  fingerprint_.reset();
  changed_ = true;
  if (at_bottom) scroll_offset_ = max_scroll();
}

void ContentBuffer::append_line(const std::string& text, const Style& style) {
  append_block(Block{{StyledRun{text, style}}, Align::Left, true});
}

void ContentBuffer::append_line(const std::vector<StyledRun>& runs) {
  append_block(Block{runs, Align::Left, true});
}

void ContentBuffer::clear() {
  if (!lines_.empty()) {
    changed_ = true;
    fingerprint_.reset();
  }
  blocks_.clear();
  lines_.clear();
  scroll_offset_ = 0;
}

int ContentBuffer::max_scroll() const {
  return std::max(0, line_count() - height_);
}

void ContentBuffer::clamp_scroll() {
  scroll_offset_ = std::clamp(scroll_offset_, 0, max_scroll());
}

void ContentBuffer::scroll_up(int n) {
  int old = scroll_offset_;
  scroll_offset_ = std::max(0, scroll_offset_ - std::max(0, n));
  if (scroll_offset_ != old) changed_ = true;
}

void ContentBuffer::scroll_down(int n) {
  int old = scroll_offset_;
  scroll_offset_ = std::min(max_scroll(), scroll_offset_ + std::max(0, n));
  if (scroll_offset_ != old) changed_ = true;
}

void ContentBuffer::scroll_to_top() {
  if (scroll_offset_ != 0) changed_ = true;
  scroll_offset_ = 0;
}

void ContentBuffer::scroll_to_bottom() {
  int target = max_scroll();
  if (scroll_offset_ != target) changed_ = true;
  scroll_offset_ = target;
}

bool ContentBuffer::can_scroll_up() const { return scroll_offset_ > 0; }

bool ContentBuffer::can_scroll_down() const { return scroll_offset_ + height_ < line_count(); }

ScrollInfo ContentBuffer::scroll_info() const {
  return ScrollInfo{scroll_offset_, line_count(), height_};
}

std::span<const StyledLine> ContentBuffer::visible_lines() const {
  int start = std::min(scroll_offset_, line_count());
  int count = std::min(height_, line_count() - start);
  return std::span<const StyledLine>(lines_).subspan(static_cast<size_t>(start), static_cast<size_t>(count));
}

std::vector<StyledLine> ContentBuffer::layout_block(const Block& b) const {
  auto out = wrap(b.runs, width_);
  if (out.empty() && b.keep_blank) out.emplace_back();
  if (b.align == Align::Center) {
    for (auto& line : out) {
      int pad = (width_ - line.width()) / 2;
      if (pad > 0) line.runs.insert(line.runs.begin(), StyledRun{std::string(pad, ' '), Style{}});
    }
  }
  return out;
}

void ContentBuffer::rebuild() {
  lines_.clear();
  for (const auto& b : blocks_) {
    auto part = layout_block(b);
    lines_.insert(lines_.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
  }
}

void ContentBuffer::resize(int width, int height) {
  width = std::max(0, width);
  height = std::max(0, height);
  if (width == width_ && height == height_) return;
  bool rewrap = width != width_;
  width_ = width;
  height_ = height;
  if (rewrap) rebuild();
  clamp_scroll();
  changed_ = true;
  spdlog::debug("content buffer resized to {}x{}, {} lines, offset {}", height_, width_, line_count(), scroll_offset_);
}
