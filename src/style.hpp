#pragma once
/*
 * Style
 *
 * Purpose: text style (weight/decoration/colors) and styled runs/lines.
 * Note: pure data; surfaces decide how a Style maps to terminal attributes.
 */
#include <string>
#include <vector>

enum class Weight { Normal, Bold, Dim };
enum class Decoration { None, Underline, Blink, Reverse };
enum class Color { Default, Black, Red, Green, Yellow, Blue, Magenta, Cyan, White };

struct Style {
  Weight weight = Weight::Normal;
  Decoration decoration = Decoration::None;
  Color foreground = Color::Default;
  Color background = Color::Default;
  bool operator==(const Style&) const = default;
};

struct StyledRun {
  std::string text;
  Style style{};
  bool operator==(const StyledRun&) const = default;
};

struct StyledLine {
  std::vector<StyledRun> runs;

  int width() const;       // displayed cells (codepoints)
  std::string text() const; // run texts concatenated
  bool operator==(const StyledLine&) const = default;
};

inline Style bold_style() { Style s; s.weight = Weight::Bold; return s; }
inline Style reverse_style() { Style s; s.decoration = Decoration::Reverse; return s; }
