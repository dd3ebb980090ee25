#include "liqmap/backfill_worker.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace liqmap {

BackfillWorker::BackfillWorker(std::shared_ptr<CandleFetcher> fetcher,
                               RecoveryCallback on_recovered,
                               BackfillConfig config)
    : fetcher_(std::move(fetcher)), on_recovered_(std::move(on_recovered)),
      config_(config), running_(false) {
  if (!fetcher_) {
    throw std::invalid_argument("BackfillWorker requires a fetcher");
  }
  if (config_.max_queue == 0) {
    throw std::invalid_argument("max_queue must be > 0");
  }
}

BackfillWorker::~BackfillWorker() {
  stop();
}

void BackfillWorker::start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return; // Already running
  }

  worker_thread_ = std::thread([this]() { run_loop(); });
  std::cout << "[BACKFILL] worker started\n";
}

void BackfillWorker::stop() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) {
    return; // Already stopped
  }

  {
    // Pairs with the predicate check in run_loop so the wakeup is not lost.
    std::lock_guard<std::mutex> lock(mutex_);
  }
  cv_.notify_all();
  idle_cv_.notify_all();
  if (worker_thread_.joinable()) {
    worker_thread_.join();
  }

  std::cout << "[BACKFILL] worker stopped\n";
}

void BackfillWorker::submit(const BackfillRequest &request) {
  if (request.count == 0) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      // Nothing would ever drain it
      ++stats_.dropped;
      std::cerr << "[BACKFILL] worker not running, dropping request symbol="
                << request.symbol
                << " tf=" << timeframe_label(request.timeframe)
                << " start=" << request.start_open_ts
                << " count=" << request.count << "\n";
      return;
    }
    if (queue_.size() >= config_.max_queue) {
      ++stats_.dropped;
      std::cerr << "[BACKFILL] queue full, dropping request symbol="
                << request.symbol
                << " tf=" << timeframe_label(request.timeframe)
                << " start=" << request.start_open_ts
                << " count=" << request.count << "\n";
      return;
    }
    queue_.push_back(request);
    ++stats_.requested;
  }
  cv_.notify_one();
}

void BackfillWorker::wait_idle() {
  std::unique_lock<std::mutex> lock(mutex_);
  idle_cv_.wait(lock, [this]() {
    return (queue_.empty() && !in_flight_) || !running_;
  });
}

BackfillStats BackfillWorker::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void BackfillWorker::run_loop() {
  while (true) {
    BackfillRequest request;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this]() { return !queue_.empty() || !running_; });
      if (!running_) {
        break;
      }
      request = queue_.front();
      queue_.pop_front();
      in_flight_ = true;
    }

    process(request);

    {
      std::lock_guard<std::mutex> lock(mutex_);
      in_flight_ = false;
    }
    idle_cv_.notify_all();
  }
  idle_cv_.notify_all();
}

void BackfillWorker::process(const BackfillRequest &request) {
  const uint64_t step = interval_seconds(request.timeframe);
  const uint64_t end_ts = request.end_open_ts();

  std::vector<Candle> batch;
  try {
    batch = fetcher_->fetch_candles(request.symbol, request.timeframe,
                                    request.start_open_ts, request.count);
  } catch (const std::exception &ex) {
    std::cerr << "[BACKFILL] fetch failed symbol=" << request.symbol
              << " tf=" << timeframe_label(request.timeframe)
              << " start=" << request.start_open_ts << " error: " << ex.what()
              << "\n";
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.failed;
    return;
  }

  uint64_t recovered = 0;
  for (const auto &candle : batch) {
    // Keep only candles inside the requested range and on the grid.
    if (candle.open_ts < request.start_open_ts || candle.open_ts > end_ts ||
        (candle.open_ts - request.start_open_ts) % step != 0) {
      continue;
    }
    if (on_recovered_) {
      try {
        on_recovered_(candle);
      } catch (const std::exception &ex) {
        std::cerr << "[BACKFILL] recovery callback error symbol="
                  << request.symbol << " open_ts=" << candle.open_ts << ": "
                  << ex.what() << "\n";
        continue;
      }
    }
    ++recovered;
  }

  const uint64_t missing = request.count > recovered ? request.count - recovered : 0;
  if (missing > 0) {
    std::cerr << "[BACKFILL] incomplete recovery symbol=" << request.symbol
              << " tf=" << timeframe_label(request.timeframe)
              << " recovered=" << recovered << "/" << request.count << "\n";
  } else {
    std::cout << "[BACKFILL] recovered symbol=" << request.symbol
              << " tf=" << timeframe_label(request.timeframe)
              << " count=" << recovered << "\n";
  }

  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.completed;
  stats_.candles_recovered += recovered;
  stats_.candles_missing += missing;
}

} // namespace liqmap
