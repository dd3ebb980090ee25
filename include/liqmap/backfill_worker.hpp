#pragma once

#include "liqmap/candle_source.hpp"
#include "liqmap/candle_sync.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace liqmap {

struct BackfillConfig {
  std::size_t max_queue{1024}; // requests beyond this are dropped and logged
};

struct BackfillStats {
  uint64_t requested{0};
  uint64_t completed{0};
  uint64_t failed{0};
  uint64_t dropped{0};
  uint64_t candles_recovered{0};
  uint64_t candles_missing{0};
};

/// Background forward-fill executor.
///
/// submit() only enqueues, and drops requests while the worker is stopped.
/// A single worker thread drains the queue, calls
/// the fetcher and hands recovered candles to the recovery callback. Fetch
/// failures are logged and counted, retries belong to the fetcher.
class BackfillWorker : public BackfillSink {
public:
  using RecoveryCallback = std::function<void(const Candle &)>;

  BackfillWorker(std::shared_ptr<CandleFetcher> fetcher,
                 RecoveryCallback on_recovered,
                 BackfillConfig config = BackfillConfig{});

  ~BackfillWorker() override;

  /// Start the worker thread
  void start();

  /// Drain nothing further and join the worker thread
  void stop();

  void submit(const BackfillRequest &request) override;

  /// Block until the queue is empty and no request is in flight
  void wait_idle();

  BackfillStats stats() const;

private:
  void run_loop();
  void process(const BackfillRequest &request);

  std::shared_ptr<CandleFetcher> fetcher_;
  RecoveryCallback on_recovered_;
  BackfillConfig config_;

  std::deque<BackfillRequest> queue_;
  bool in_flight_{false};
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;

  std::atomic<bool> running_;
  std::thread worker_thread_;
  BackfillStats stats_;
};

} // namespace liqmap
