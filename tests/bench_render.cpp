#include "content_buffer.hpp"
#include "headless_terminal.hpp"
#include "render_coordinator.hpp"
#include "text_wrapper.hpp"
#include <chrono>
#include <iostream>
#include <random>
#include <string>
#include <vector>

struct BenchCfg {
  int text_len = 2000000;   // characters wrapped per pass
  int appends = 100000;     // append_line calls
  int updates = 20000;      // coordinator updates with a changing status
};

static std::string make_text(int n) {
  std::mt19937 rng(12345);
  std::uniform_int_distribution<int> dist(0, 40);
  std::string s;
  s.reserve(static_cast<size_t>(n));
  for (int i = 0; i < n; ++i) {
    int k = dist(rng);
    s += k == 0 ? '\n' : static_cast<char>('a' + k % 26);
  }
  return s;
}

static void bench_wrap(const BenchCfg& cfg) {
  std::string text = make_text(cfg.text_len);
  for (int width : {40, 88, 200}) {
    auto t0 = std::chrono::steady_clock::now();
    auto lines = wrap_text(text, width);
    auto t1 = std::chrono::steady_clock::now();
    std::chrono::duration<double> dt = t1 - t0;
    std::cout << "[wrap]     len=" << cfg.text_len << " width=" << width << " lines=" << lines.size()
              << " took " << dt.count() << "s\n";
  }
}

static void bench_append(const BenchCfg& cfg) {
  ContentBuffer b(88, 52);
  auto t0 = std::chrono::steady_clock::now();
  for (int i = 0; i < cfg.appends; ++i) b.append_line("log line " + std::to_string(i));
  auto t1 = std::chrono::steady_clock::now();
  std::chrono::duration<double> dt = t1 - t0;
  std::cout << "[append]   n=" << cfg.appends << " offset=" << b.scroll_offset()
            << " took " << dt.count() << "s\n";
}

static void bench_updates(const BenchCfg& cfg) {
  LayoutPlan plan = compute_layout(60, 120);
  RenderCoordinator rc(plan);
  HeadlessTerminal term(60, 120);
  AppSnapshot s;
  s.title = "bench";
  s.nav_items = {"one", "two", "three"};
  s.body_text = make_text(20000);
  rc.present(term, rc.update(s));

  size_t ops_total = 0;
  auto t0 = std::chrono::steady_clock::now();
  for (int i = 0; i < cfg.updates; ++i) {
    s.status = "tick " + std::to_string(i);
    auto ops = rc.update(s);
    ops_total += ops.size();
    rc.present(term, ops);
  }
  auto t1 = std::chrono::steady_clock::now();
  std::chrono::duration<double> dt = t1 - t0;
  std::cout << "[update]   n=" << cfg.updates << " ops=" << ops_total << " took " << dt.count() << "s\n";

  t0 = std::chrono::steady_clock::now();
  for (int i = 0; i < cfg.updates; ++i) {
    auto ops = rc.update(s);
    ops_total += ops.size();
  }
  t1 = std::chrono::steady_clock::now();
  dt = t1 - t0;
  std::cout << "[idle]     n=" << cfg.updates << " took " << dt.count() << "s\n";
}

int main(int argc, char** argv) {
  BenchCfg cfg;
  if (argc > 1) {
    try { cfg.text_len = std::stoi(argv[1]); }
    catch (const std::exception&) { std::cerr << "bad length " << argv[1] << ", using " << cfg.text_len << "\n"; }
  }
  std::cout << "Render path benchmark (text_len=" << cfg.text_len << ")\n";
  bench_wrap(cfg);
  bench_append(cfg);
  bench_updates(cfg);
  return 0;
}
