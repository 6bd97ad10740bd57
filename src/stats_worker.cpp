#include "stats_worker.hpp"
#include "config.hpp"
#include <spdlog/spdlog.h>

StatsWorker::StatsWorker(std::chrono::milliseconds interval)
  : interval_(interval.count() > 0 ? interval : std::chrono::milliseconds(QV_DEFAULT_STATS_INTERVAL_MS)),
    shared_(std::make_shared<Shared>()) {}

StatsWorker::~StatsWorker() {
  if (running()) stop(std::chrono::milliseconds(QV_WORKER_JOIN_TIMEOUT_MS));
}

void StatsWorker::start() {
  if (running()) return;
  {
    std::lock_guard<std::mutex> lk(shared_->m);
    shared_->stop = false;
    shared_->exited = false;
    shared_->started = std::chrono::steady_clock::now();
  }
  thread_ = std::thread(&StatsWorker::run, shared_, interval_);
  spdlog::info("stats worker started, interval {} ms", interval_.count());
}

void StatsWorker::run(std::shared_ptr<Shared> s, std::chrono::milliseconds interval) {
  std::unique_lock<std::mutex> lk(s->m);
  while (!s->stop) {
    if (s->cv.wait_for(lk, interval, [&] { return s->stop; })) break;
    auto elapsed = std::chrono::steady_clock::now() - s->started;
    s->stats.uptime_seconds = static_cast<long>(
        std::chrono::duration_cast<std::chrono::seconds>(elapsed).count());
    s->stats.ticks++;
  }
  s->exited = true;
  s->cv.notify_all();
}

bool StatsWorker::stop(std::chrono::milliseconds timeout) {
  if (!running()) return true;
  bool exited;
  {
    std::unique_lock<std::mutex> lk(shared_->m);
    shared_->stop = true;
    shared_->cv.notify_all();
    exited = shared_->cv.wait_for(lk, timeout, [&] { return shared_->exited; });
  }
  if (exited) {
    thread_.join();
    spdlog::info("stats worker stopped");
    return true;
  }
  spdlog::warn("stats worker missed its {} ms join deadline; detaching", timeout.count());
  thread_.detach();
  return false;
}

WorkerStats StatsWorker::snapshot() const {
  std::lock_guard<std::mutex> lk(shared_->m);
  return shared_->stats;
}
