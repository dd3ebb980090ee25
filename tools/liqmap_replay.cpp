#include "liqmap/backfill_worker.hpp"
#include "liqmap/candle_history.hpp"
#include "liqmap/jetstream_publisher.hpp"
#include "liqmap/liquidity_map.hpp"
#include "liqmap/sync_registry.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

struct ReplayOptions {
  std::string input_path;
  std::string backfill_path;
  std::string nats_url = "nats://127.0.0.1:4222";
  std::string stream = "LIQMAP";
  std::string subject_root = "liqmap";
  std::vector<liqmap::Timeframe> timeframes;
  std::size_t min_timeframes = 2;
  bool dry_run = false;
};

void usage() {
  std::cerr << "Usage: liqmap_replay --input FILE [--backfill FILE] "
            << "[--timeframes 1m,5m,15m,1h] [--min-timeframes N] "
            << "[--nats-url URL] [--stream NAME] [--subject-root ROOT] "
            << "[--dry-run]\n"
            << "CSV rows: symbol,timeframe,open_ts,open,high,low,close,volume\n";
}

std::vector<liqmap::Timeframe> parse_timeframes(const std::string &list) {
  std::vector<liqmap::Timeframe> out;
  std::stringstream ss(list);
  std::string label;
  while (std::getline(ss, label, ',')) {
    if (label.empty()) {
      continue;
    }
    const liqmap::Timeframe tf = liqmap::parse_timeframe(label);
    if (std::find(out.begin(), out.end(), tf) == out.end()) {
      out.push_back(tf);
    }
  }
  return out;
}

bool parse_args(int argc, char **argv, ReplayOptions &opts) {
  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg(argv[i]);
      if (arg == "--input" && i + 1 < argc) {
        opts.input_path = argv[++i];
      } else if (arg == "--backfill" && i + 1 < argc) {
        opts.backfill_path = argv[++i];
      } else if (arg == "--timeframes" && i + 1 < argc) {
        opts.timeframes = parse_timeframes(argv[++i]);
      } else if (arg == "--min-timeframes" && i + 1 < argc) {
        opts.min_timeframes = static_cast<std::size_t>(std::stoul(argv[++i]));
      } else if (arg == "--nats-url" && i + 1 < argc) {
        opts.nats_url = argv[++i];
      } else if (arg == "--stream" && i + 1 < argc) {
        opts.stream = argv[++i];
      } else if (arg == "--subject-root" && i + 1 < argc) {
        opts.subject_root = argv[++i];
      } else if (arg == "--dry-run") {
        opts.dry_run = true;
      } else if (arg == "--help") {
        usage();
        return false;
      } else {
        std::cerr << "unknown argument: " << arg << "\n";
        usage();
        return false;
      }
    }
  } catch (const std::exception &ex) {
    std::cerr << "invalid argument: " << ex.what() << "\n";
    usage();
    return false;
  }

  if (opts.input_path.empty()) {
    usage();
    return false;
  }
  if (opts.timeframes.empty()) {
    opts.timeframes = {liqmap::Timeframe::MIN_1, liqmap::Timeframe::MIN_5,
                       liqmap::Timeframe::MIN_15, liqmap::Timeframe::HOUR_1};
  }
  return true;
}

bool parse_candle(const std::string &line, liqmap::Candle &candle) {
  std::stringstream ss(line);
  std::vector<std::string> fields;
  std::string field;
  while (std::getline(ss, field, ',')) {
    fields.push_back(field);
  }
  if (fields.size() < 8) {
    std::cerr << "expected 8 fields in line: " << line << "\n";
    return false;
  }

  try {
    candle.symbol = fields[0];
    candle.timeframe = liqmap::parse_timeframe(fields[1]);
    candle.open_ts = std::stoull(fields[2]);
    candle.close_ts =
        candle.open_ts + liqmap::interval_seconds(candle.timeframe) - 1;
    candle.open = std::stod(fields[3]);
    candle.high = std::stod(fields[4]);
    candle.low = std::stod(fields[5]);
    candle.close = std::stod(fields[6]);
    candle.volume = std::stod(fields[7]);
    candle.is_closed = true;
  } catch (const std::exception &ex) {
    std::cerr << "failed to parse line: " << line << " error: " << ex.what()
              << "\n";
    return false;
  }
  return true;
}

std::vector<liqmap::Candle> load_csv(const std::string &path) {
  std::vector<liqmap::Candle> candles;
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("failed to open input file: " + path);
  }
  std::string line;
  while (std::getline(file, line)) {
    if (line.empty() || line[0] == '#') {
      continue;
    }
    liqmap::Candle candle;
    if (parse_candle(line, candle)) {
      candles.push_back(candle);
    }
  }
  return candles;
}

/// Serves backfill requests from a CSV dump instead of the exchange API
class CsvCandleFetcher : public liqmap::CandleFetcher {
public:
  explicit CsvCandleFetcher(std::vector<liqmap::Candle> candles) {
    for (auto &c : candles) {
      const Key key{c.symbol, c.timeframe};
      by_stream_[key][c.open_ts] = std::move(c);
    }
  }

  std::vector<liqmap::Candle> fetch_candles(const std::string &symbol,
                                            liqmap::Timeframe timeframe,
                                            uint64_t start_open_ts,
                                            uint32_t limit) override {
    std::vector<liqmap::Candle> out;
    auto it = by_stream_.find(Key{symbol, timeframe});
    if (it == by_stream_.end()) {
      return out;
    }
    for (auto c = it->second.lower_bound(start_open_ts);
         c != it->second.end() && out.size() < limit; ++c) {
      out.push_back(c->second);
    }
    return out;
  }

private:
  using Key = std::pair<std::string, liqmap::Timeframe>;
  std::map<Key, std::map<uint64_t, liqmap::Candle>> by_stream_;
};

struct SymbolState {
  std::unique_ptr<liqmap::LiquidityMap> map;
  std::map<liqmap::Timeframe, std::unique_ptr<liqmap::CandleHistory>> history;
};

} // namespace

int main(int argc, char **argv) {
  ReplayOptions opts;
  if (!parse_args(argc, argv, opts)) {
    return 1;
  }

  std::vector<liqmap::Candle> input;
  std::vector<liqmap::Candle> backfill_rows;
  try {
    input = load_csv(opts.input_path);
    if (!opts.backfill_path.empty()) {
      backfill_rows = load_csv(opts.backfill_path);
    }
  } catch (const std::exception &ex) {
    std::cerr << ex.what() << "\n";
    return 1;
  }

  std::shared_ptr<liqmap::EventPublisher> publisher;
  if (opts.dry_run) {
    publisher = std::make_shared<liqmap::InMemoryPublisher>();
  } else {
    liqmap::JetStreamConfig js_cfg;
    js_cfg.url = opts.nats_url;
    js_cfg.stream = opts.stream;
    js_cfg.subject_root = opts.subject_root;
    try {
      publisher = std::make_shared<liqmap::JetStreamPublisher>(js_cfg);
    } catch (const std::exception &ex) {
      std::cerr << "failed to initialize JetStream publisher: " << ex.what()
                << "\n";
      return 1;
    }
  }

  std::map<std::string, SymbolState> symbols;
  std::mutex symbols_mutex; // guards insertion against backfill lookups

  auto state_for = [&](const std::string &symbol) -> SymbolState & {
    auto it = symbols.find(symbol);
    if (it != symbols.end()) {
      return it->second;
    }
    liqmap::LiquidityMapOptions map_opts;
    map_opts.symbol = symbol;
    for (liqmap::Timeframe tf : opts.timeframes) {
      map_opts.timeframes.push_back(liqmap::default_timeframe_config(tf));
    }
    map_opts.publisher = publisher;

    SymbolState state;
    state.map = std::make_unique<liqmap::LiquidityMap>(std::move(map_opts));
    for (liqmap::Timeframe tf : opts.timeframes) {
      const std::size_t capacity = state.map->config(tf).lookback_candles * 2;
      state.history.emplace(
          tf, std::make_unique<liqmap::CandleHistory>(symbol, tf, capacity));
    }
    return symbols.emplace(symbol, std::move(state)).first->second;
  };

  std::shared_ptr<liqmap::BackfillWorker> backfill;
  if (!backfill_rows.empty()) {
    auto fetcher = std::make_shared<CsvCandleFetcher>(std::move(backfill_rows));
    // Recovered candles only fill history; zones refresh on the next live close
    backfill = std::make_shared<liqmap::BackfillWorker>(
        fetcher, [&](const liqmap::Candle &candle) {
          std::lock_guard<std::mutex> lock(symbols_mutex);
          auto it = symbols.find(candle.symbol);
          if (it == symbols.end()) {
            return;
          }
          auto h = it->second.history.find(candle.timeframe);
          if (h != it->second.history.end()) {
            h->second->insert_backfill(candle);
          }
        });
    backfill->start();
  }

  liqmap::CandleSyncRegistry registry(backfill, publisher);

  std::size_t processed = 0;
  std::size_t gaps = 0;
  for (const auto &candle : input) {
    auto result =
        registry.on_closed_candle(candle.symbol, candle.timeframe, candle);
    if (result.gap) {
      ++gaps;
    }
    if (!result.accepted()) {
      continue;
    }

    SymbolState *state_ptr = nullptr;
    {
      std::lock_guard<std::mutex> lock(symbols_mutex);
      state_ptr = &state_for(candle.symbol);
    }
    SymbolState &state = *state_ptr;
    auto h = state.history.find(candle.timeframe);
    if (h == state.history.end()) {
      continue;
    }
    h->second->upsert(candle);

    try {
      const auto &cfg = state.map->config(candle.timeframe);
      state.map->on_candle_close(candle.timeframe,
                                 h->second->window(cfg.lookback_candles),
                                 candle.close);
      ++processed;
    } catch (const std::exception &ex) {
      std::cerr << "refresh failed symbol=" << candle.symbol
                << " ts=" << candle.open_ts << ": " << ex.what() << "\n";
    }
  }

  if (backfill) {
    backfill->wait_idle();
    backfill->stop();
  }

  std::cout << "processed " << processed << " candles, " << gaps << " gaps"
            << std::endl;

  for (auto &entry : symbols) {
    auto zones = entry.second.map->get_confluence_zones(opts.min_timeframes);
    std::cout << entry.first << ": " << zones.size() << " confluence zones\n";
    for (const auto &z : zones) {
      std::cout << "  [" << z.price_low << ", " << z.price_high << "] "
                << liqmap::zone_kind_label(z.kind) << " "
                << liqmap::timeframe_label(z.timeframe)
                << " weight=" << z.confluence_weight
                << " tfs=" << z.confluence_count << " "
                << liqmap::zone_strength_label(z.strength) << "\n";
    }

    const auto stats = entry.second.map->statistics();
    std::cout << "  filters: atr=" << stats.filters.atr_filtered
              << " volume=" << stats.filters.volume_filtered
              << " distance=" << stats.filters.distance_filtered
              << " age=" << stats.filters.age_filtered << "\n";
  }
  return 0;
}
