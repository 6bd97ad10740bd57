#pragma once
/*
 * ContentBuffer
 *
 * Purpose: wrapped, scrollable content of one region's viewport.
 * Invariants: 0 <= scroll_offset <= max(0, lines - viewport_height);
 *             every line is at most viewport_width cells wide.
 * Suppression: set_text/set_formatted with content whose fingerprint matches the
 *              last baseline are no-ops; append_line drops the baseline.
 * Note: total operations, never throw; not thread-safe (render thread only).
 */
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "style.hpp"
#include "fingerprint.hpp"

struct ScrollInfo {
  int offset = 0;
  int total = 0;
  int visible = 0;
};

class ContentBuffer {
public:
  ContentBuffer(int width, int height, std::shared_ptr<const IFingerprinter> fp = nullptr);

  void set_text(const std::string& text);
  void set_text_with_style(const std::string& text, const Style& style);
  void set_centered_text(const std::string& text, const Style& style = {});
  void set_formatted(const std::vector<StyledRun>& runs);

  void append_line(const std::string& text, const Style& style = {});
  void append_line(const std::vector<StyledRun>& runs);
  void clear();

  void scroll_up(int n = 1);
  void scroll_down(int n = 1);
  void scroll_to_top();
  void scroll_to_bottom();
  bool can_scroll_up() const;
  bool can_scroll_down() const;

  // Re-wraps stored content at the new width and re-clamps the scroll offset.
  void resize(int width, int height);

  std::span<const StyledLine> visible_lines() const;
  const std::vector<StyledLine>& lines() const { return lines_; }
  int line_count() const { return static_cast<int>(lines_.size()); }
  int scroll_offset() const { return scroll_offset_; }
  int max_scroll() const;
  ScrollInfo scroll_info() const;
  int viewport_width() const { return width_; }
  int viewport_height() const { return height_; }
  bool empty() const { return lines_.empty(); }

  const std::optional<std::string>& fingerprint() const { return fingerprint_; }
  void invalidate_fingerprint() { fingerprint_.reset(); }

  // set whenever the visible result may differ; the coordinator resets it after drawing
  bool changed() const { return changed_; }
  void reset_changed() { changed_ = false; }

private:
  enum class Align { Left, Center };
  struct Block {
    std::vector<StyledRun> runs;
    Align align = Align::Left;
    bool keep_blank = false; // an empty block still occupies one line
  };

  bool same_baseline(const std::string& fp, Align align) const;
  void replace(Block block, std::string fp);
  void append_block(Block block);
  std::vector<StyledLine> layout_block(const Block& b) const;
  void rebuild();
  void clamp_scroll();

  std::shared_ptr<const IFingerprinter> fp_;
  std::vector<Block> blocks_;
  std::vector<StyledLine> lines_;
  int scroll_offset_ = 0;
  int width_ = 0;
  int height_ = 0;
  std::optional<std::string> fingerprint_;
  Align baseline_align_ = Align::Left;
  bool changed_ = false;
};
