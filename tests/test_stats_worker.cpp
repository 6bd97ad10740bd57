#include "stats_worker.hpp"
#include <cassert>
#include <chrono>
#include <thread>

using namespace std::chrono_literals;

static void test_ticks_and_stop() {
  StatsWorker w(10ms);
  assert(!w.running());
  assert((w.snapshot() == WorkerStats{}));
  w.start();
  assert(w.running());
  auto deadline = std::chrono::steady_clock::now() + 2s;
  while (w.snapshot().ticks < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  WorkerStats a = w.snapshot();
  assert(a.ticks >= 3);
  assert(a.uptime_seconds >= 0);
  assert(w.stop(500ms));
  assert(!w.running());
  WorkerStats b = w.snapshot();
  std::this_thread::sleep_for(30ms);
  // no writes after a joined stop
  assert(w.snapshot() == b);
  assert(w.stop(10ms));
}

static void test_snapshots_are_monotonic() {
  StatsWorker w(1ms);
  w.start();
  long last = 0;
  for (int i = 0; i < 200; ++i) {
    WorkerStats s = w.snapshot();
    assert(s.ticks >= last);
    last = s.ticks;
  }
  assert(w.stop(500ms));
}

static void test_default_interval_and_destructor() {
  StatsWorker w(0ms);
  assert(w.interval() > 0ms);
  {
    StatsWorker scoped(5ms);
    scoped.start();
  }
}

int main() {
  test_ticks_and_stop();
  test_snapshots_are_monotonic();
  test_default_interval_and_destructor();
  return 0;
}
