#pragma once
/*
 * StatsWorker
 *
 * Purpose: background thread that ticks at a fixed interval and keeps uptime/tick counts.
 * Concurrency: the worker is the only writer; readers get a copy via snapshot().
 *              It never touches rendering state.
 * Shutdown: stop(timeout) waits for the loop to exit, then joins. Past the deadline the
 *           thread is detached; its state is shared so a late write stays valid.
 */
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

struct WorkerStats {
  long uptime_seconds = 0;
  long ticks = 0;
  bool operator==(const WorkerStats&) const = default;
};

class StatsWorker {
public:
  explicit StatsWorker(std::chrono::milliseconds interval);
  ~StatsWorker();
  StatsWorker(const StatsWorker&) = delete;
  StatsWorker& operator=(const StatsWorker&) = delete;

  void start();
  // true when the thread was joined within the timeout
  bool stop(std::chrono::milliseconds timeout);
  WorkerStats snapshot() const;
  bool running() const { return thread_.joinable(); }
  std::chrono::milliseconds interval() const { return interval_; }

private:
  struct Shared {
    mutable std::mutex m;
    std::condition_variable cv;
    bool stop = false;
    bool exited = false;
    WorkerStats stats;
    std::chrono::steady_clock::time_point started;
  };
  static void run(std::shared_ptr<Shared> s, std::chrono::milliseconds interval);

  std::chrono::milliseconds interval_;
  std::shared_ptr<Shared> shared_;
  std::thread thread_;
};
