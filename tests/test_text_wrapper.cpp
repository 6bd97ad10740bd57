#include "text_wrapper.hpp"
#include "utf8.hpp"
#include <cassert>
#include <random>
#include <string>
#include <vector>

static std::vector<std::string> texts(const std::vector<StyledLine>& lines) {
  std::vector<std::string> out;
  for (const auto& l : lines) out.push_back(l.text());
  return out;
}

static void test_hard_cut() {
  auto lines = wrap({StyledRun{"abcdefghij", Style{}}}, 4);
  assert((texts(lines) == std::vector<std::string>{"abcd", "efgh", "ij"}));
  for (const auto& l : lines) {
    assert(l.runs.size() == 1);
    assert(l.runs[0].style == Style{});
  }
}

static void test_breaks() {
  assert(wrap_text("", 10).empty());
  assert((texts(wrap_text("a\nb", 10)) == std::vector<std::string>{"a", "b"}));
  assert((texts(wrap_text("a\n\nb", 10)) == std::vector<std::string>{"a", "", "b"}));
  assert((texts(wrap_text("a\n", 10)) == std::vector<std::string>{"a", ""}));
  assert((texts(wrap_text("\n", 10)) == std::vector<std::string>{"", ""}));
}

static void test_styles_preserved() {
  Style b = bold_style();
  auto lines = wrap({StyledRun{"abc", Style{}}, StyledRun{"defg", b}}, 5);
  assert(lines.size() == 2);
  assert(lines[0].runs.size() == 2);
  assert(lines[0].runs[0].text == "abc");
  assert(lines[0].runs[1].text == "de" && lines[0].runs[1].style == b);
  assert(lines[1].runs.size() == 1);
  assert(lines[1].runs[0].text == "fg" && lines[1].runs[0].style == b);
}

static void test_utf8_cells() {
  auto lines = wrap_text("\xC3\xA9\xC3\xA9\xC3\xA9", 2);
  assert(lines.size() == 2);
  assert(lines[0].width() == 2);
  assert(lines[1].text() == "\xC3\xA9");
  assert(utf8_length("\xC3\xA9x") == 2);
}

static void test_degenerate_width() {
  auto lines = wrap_text("abc", 0);
  assert((texts(lines) == std::vector<std::string>{"a", "b", "c"}));
}

static void test_width_bound_and_round_trip() {
  std::mt19937 rng(777);
  const std::string alphabet = "abc xyz\t-.\xC3\xA9";
  std::uniform_int_distribution<int> len_d(0, 200), width_d(1, 40), pick(0, 9), runs_d(1, 5);
  for (int iter = 0; iter < 1000; ++iter) {
    std::vector<StyledRun> runs;
    std::string expected;
    int nruns = runs_d(rng);
    for (int r = 0; r < nruns; ++r) {
      std::string t;
      int n = len_d(rng) / nruns;
      for (int i = 0; i < n; ++i) {
        int k = pick(rng);
        if (k == 9) t += "\xC3\xA9";
        else t += alphabet[static_cast<size_t>(k)];
      }
      Style st;
      if (r % 2) st.weight = Weight::Bold;
      runs.push_back(StyledRun{t, st});
      expected += t;
    }
    int w = width_d(rng);
    auto lines = wrap(runs, w);
    std::string joined;
    for (const auto& l : lines) {
      assert(l.width() <= w);
      joined += l.text();
    }
    assert(joined == expected);
  }
}

int main() {
  test_hard_cut();
  test_breaks();
  test_styles_preserved();
  test_utf8_cells();
  test_degenerate_width();
  test_width_bound_and_round_trip();
  return 0;
}
