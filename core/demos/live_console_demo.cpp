// Live console demo
// FakeDataSource -> SyncEngine -> JsonMessageSink + ColumnSink, driven by a
// TickLoop on the main thread (~30 ticks/s). Prints every delivery as JSON.
//
// Usage: live_console_demo [config.json] [--seconds N]
//   config.json: {"lookback":50,"timeoutMs":100,"verbose":false}

#include "df/data/FakeDataSource.hpp"
#include "df/data/RowJson.hpp"
#include "df/loop/TickLoop.hpp"
#include "df/session/SyncEngine.hpp"
#include "df/session/SyncEngineConfig.hpp"
#include "df/sink/ColumnSink.hpp"
#include "df/sink/JsonMessageSink.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

static bool loadConfig(const char* path, df::SyncEngineConfig& cfg) {
  std::ifstream in(path);
  if (!in) {
    std::fprintf(stderr, "Cannot open %s\n", path);
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  if (!df::deserializeSyncEngineConfig(ss.str(), cfg)) {
    std::fprintf(stderr, "Invalid config in %s\n", path);
    return false;
  }
  return true;
}

int main(int argc, char* argv[]) {
  df::SyncEngineConfig cfg;
  cfg.lookback = 50;
  cfg.timeoutMs = 100;
  int seconds = 5;

  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--seconds" && i + 1 < argc) {
      seconds = std::atoi(argv[++i]);
    } else if (!loadConfig(argv[i], cfg)) {
      return 1;
    }
  }
  std::printf("Config: %s\n", df::serializeSyncEngineConfig(cfg).c_str());

  df::FakeDataSourceConfig feedCfg;
  feedCfg.tickIntervalMs = 50;
  feedCfg.candleIntervalMs = 500;
  feedCfg.historyCandles = 120;
  df::FakeDataSource feed(feedCfg);

  df::TickLoop loop;
  df::JsonMessageSink printer("console", [](const std::string& msg) {
    std::printf("%s\n", msg.c_str());
  });
  df::ColumnSinkConfig chartCfg;
  chartCfg.columns = {"time", "close"};
  df::ColumnSink chart(chartCfg);

  df::SyncEngine engine(loop, feed, {&printer, &chart}, cfg);
  feed.setOnData([&engine]() { engine.notifyUpdate(); });
  feed.start();

  auto end = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
  while (std::chrono::steady_clock::now() < end) {
    loop.runOnce();
    std::this_thread::sleep_for(std::chrono::milliseconds(33));
  }

  feed.stop();
  feed.setOnData(nullptr);
  engine.stop();

  df::SyncStats st = engine.stats();
  std::printf("Candles: %u  retained: %zu  last index: %lld\n",
              feed.candleCount(), chart.rowCount(),
              static_cast<long long>(engine.lastPosition()));
  std::printf("Appended %llu, corrected %llu, patched %llu, streamed %llu\n",
              static_cast<unsigned long long>(st.rowsAppended),
              static_cast<unsigned long long>(st.rowsCorrected),
              static_cast<unsigned long long>(st.rowsPatched),
              static_cast<unsigned long long>(st.rowsStreamed));
  std::printf("Flushes: %llu append (%llu coalesced), %llu correction (%llu coalesced)\n",
              static_cast<unsigned long long>(st.appendFlushes),
              static_cast<unsigned long long>(st.appendFlushesCoalesced),
              static_cast<unsigned long long>(st.correctionFlushes),
              static_cast<unsigned long long>(st.correctionFlushesCoalesced));
  std::vector<df::Row> window = engine.store().snapshot();
  if (window.size() > 5) window.erase(window.begin(), window.end() - 5);
  std::printf("Last rows: %s\n", df::rowsToJson(window).c_str());
  std::printf("Live console demo complete\n");
  return 0;
}
