#pragma once
#include "df/data/DataSource.hpp"
#include "df/data/MemoryDataSource.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace df {

struct FakeDataSourceConfig {
  int tickIntervalMs{100};
  int candleIntervalMs{2000};
  float startPrice{100.0f};
  float volatility{0.5f};
  std::size_t historyCandles{50};   // generated up front for fetchInitial
  double startTime{1700000000.0};   // epoch seconds of candle 0
  std::uint32_t seed{42};
};

// Synthetic OHLCV candles. A producer thread starts a new candle every
// candleIntervalMs and ticks the current one in between; ticks revise the
// last candle, which the engine sees as corrections.
// Columns: time, open, high, low, close, volume.
class FakeDataSource : public DataSource {
public:
  explicit FakeDataSource(const FakeDataSourceConfig& config);
  ~FakeDataSource() override;

  Table fetchInitial(std::size_t back) override;
  Table fetchSince(RowIndex position) override;
  void acknowledge() override;

  void start();
  void stop();
  bool isRunning() const;

  // Called on the producer thread after every new candle or tick.
  void setOnData(std::function<void()> cb);

  // Deterministic stepping (no thread).
  RowIndex appendCandle();
  RowIndex tickCandle();

  std::uint32_t candleCount() const;
  float priceMin() const;
  float priceMax() const;

private:
  void producerLoop();
  Row currentRow(RowIndex idx) const;
  float rng();
  void notify();

  FakeDataSourceConfig config_;
  MemoryDataSource table_;
  std::thread thread_;
  std::atomic<bool> running_{false};

  // Generator state; stepMtx_ serializes stepping from the producer thread
  // and from callers of appendCandle()/tickCandle().
  std::mutex stepMtx_;
  std::uint32_t seed_;
  float price_;
  float currentOpen_;
  float currentHigh_;
  float currentLow_;
  float currentClose_;
  float currentVolume_{0.0f};

  mutable std::mutex stateMtx_;
  std::uint32_t candleCount_{0};
  float priceMin_{1e9f};
  float priceMax_{-1e9f};
  std::function<void()> onData_;
};

} // namespace df
