#include "df/data/FakeDataSource.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace df {

FakeDataSource::FakeDataSource(const FakeDataSourceConfig& config)
    : config_(config),
      table_({"time", "open", "high", "low", "close", "volume"}),
      seed_(config.seed), price_(config.startPrice),
      currentOpen_(config.startPrice), currentHigh_(config.startPrice),
      currentLow_(config.startPrice), currentClose_(config.startPrice) {
  for (std::size_t i = 0; i < config_.historyCandles; i++) appendCandle();
}

FakeDataSource::~FakeDataSource() { stop(); }

Table FakeDataSource::fetchInitial(std::size_t back) {
  return table_.fetchInitial(back);
}

Table FakeDataSource::fetchSince(RowIndex position) {
  return table_.fetchSince(position);
}

void FakeDataSource::acknowledge() { table_.acknowledge(); }

void FakeDataSource::start() {
  if (running_.load()) return;
  running_.store(true);
  thread_ = std::thread(&FakeDataSource::producerLoop, this);
}

void FakeDataSource::stop() {
  running_.store(false);
  if (thread_.joinable()) thread_.join();
}

bool FakeDataSource::isRunning() const { return running_.load(); }

void FakeDataSource::setOnData(std::function<void()> cb) {
  std::lock_guard<std::mutex> lock(stateMtx_);
  onData_ = std::move(cb);
}

std::uint32_t FakeDataSource::candleCount() const {
  std::lock_guard<std::mutex> lock(stateMtx_);
  return candleCount_;
}

float FakeDataSource::priceMin() const {
  std::lock_guard<std::mutex> lock(stateMtx_);
  return priceMin_;
}

float FakeDataSource::priceMax() const {
  std::lock_guard<std::mutex> lock(stateMtx_);
  return priceMax_;
}

void FakeDataSource::producerLoop() {
  using Clock = std::chrono::steady_clock;

  auto nextTick = Clock::now();
  auto nextCandle = Clock::now() +
      std::chrono::milliseconds(config_.candleIntervalMs);

  while (running_.load()) {
    nextTick += std::chrono::milliseconds(config_.tickIntervalMs);
    std::this_thread::sleep_until(nextTick);
    if (!running_.load()) break;

    if (Clock::now() >= nextCandle) {
      appendCandle();
      nextCandle += std::chrono::milliseconds(config_.candleIntervalMs);
    } else {
      tickCandle();
    }
  }
}

// Simple LCG, same sequence for the same seed.
float FakeDataSource::rng() {
  seed_ = seed_ * 1103515245u + 12345u;
  return static_cast<float>((seed_ >> 16) & 0x7FFF) / 32767.0f;
}

RowIndex FakeDataSource::appendCandle() {
  RowIndex idx;
  {
    std::lock_guard<std::mutex> step(stepMtx_);
    float change = (rng() - 0.5f) * config_.volatility * 2.0f;
    price_ += change;
    currentOpen_ = price_;
    currentHigh_ = price_ + rng() * config_.volatility * 0.5f;
    currentLow_ = price_ - rng() * config_.volatility * 0.5f;
    currentClose_ = price_;
    currentVolume_ = rng() * 1000.0f;

    {
      std::lock_guard<std::mutex> lock(stateMtx_);
      idx = static_cast<RowIndex>(candleCount_);
      candleCount_++;
      priceMin_ = std::min(priceMin_, currentLow_);
      priceMax_ = std::max(priceMax_, currentHigh_);
    }
    table_.append(currentRow(idx));
  }
  notify();
  return idx;
}

RowIndex FakeDataSource::tickCandle() {
  if (candleCount() == 0) return appendCandle();

  RowIndex idx;
  {
    std::lock_guard<std::mutex> step(stepMtx_);
    float tick = (rng() - 0.5f) * config_.volatility;
    currentClose_ += tick;
    currentHigh_ = std::max(currentHigh_, currentClose_);
    currentLow_ = std::min(currentLow_, currentClose_);
    currentVolume_ += rng() * 100.0f;
    price_ = currentClose_;

    {
      std::lock_guard<std::mutex> lock(stateMtx_);
      idx = static_cast<RowIndex>(candleCount_) - 1;
      priceMin_ = std::min(priceMin_, currentLow_);
      priceMax_ = std::max(priceMax_, currentHigh_);
    }
    table_.revise(currentRow(idx));
  }
  notify();
  return idx;
}

Row FakeDataSource::currentRow(RowIndex idx) const {
  Row r;
  r.index = idx;
  r.fields["time"] = config_.startTime +
      static_cast<double>(idx) * config_.candleIntervalMs / 1000.0;
  r.fields["open"] = static_cast<double>(currentOpen_);
  r.fields["high"] = static_cast<double>(currentHigh_);
  r.fields["low"] = static_cast<double>(currentLow_);
  r.fields["close"] = static_cast<double>(currentClose_);
  r.fields["volume"] = static_cast<double>(currentVolume_);
  return r;
}

void FakeDataSource::notify() {
  std::function<void()> cb;
  {
    std::lock_guard<std::mutex> lock(stateMtx_);
    cb = onData_;
  }
  if (cb) cb();
}

} // namespace df
