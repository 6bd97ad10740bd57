#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminalSurface for tests and benches; records every cell.
 * Note: a glyph predicate can reject cells to simulate a terminal without
 *       box-drawing (or any non-ASCII) support.
 */
#include <functional>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminalSurface {
public:
  using GlyphFilter = std::function<bool(const std::string&)>;

  HeadlessTerminal(int rows, int cols);

  TermSize size() const override { return {rows_, cols_}; }
  bool put_char(int row, int col, const std::string& glyph, const Style& style) override;
  void clear_region(const Region& region) override;
  void present() override { ++present_count_; }

  // cells for which filter returns true are rejected
  void reject_glyphs(GlyphFilter filter) { reject_ = std::move(filter); }
  void resize(int rows, int cols);

  std::string text_at(int row) const;
  const std::string& glyph_at(int row, int col) const;
  Style style_at(int row, int col) const;
  int present_count() const { return present_count_; }
  int put_count() const { return put_count_; }
  int rejected_count() const { return rejected_count_; }

private:
  struct Cell {
    std::string glyph = " ";
    Style style{};
  };
  int index(int row, int col) const { return row * cols_ + col; }

  int rows_;
  int cols_;
  std::vector<Cell> cells_;
  GlyphFilter reject_;
  int present_count_ = 0;
  int put_count_ = 0;
  int rejected_count_ = 0;
};

// rejects anything outside 7-bit ASCII
bool is_non_ascii(const std::string& glyph);
