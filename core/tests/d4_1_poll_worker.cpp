// D4.1 — PollWorker against a MemoryDataSource
// Tests: initial fill, notify-gated polling, routing of appends and
// corrections, thrown and malformed fetches, rejected rows, failed initial
// fetch retried, background thread start/stop.

#include "df/data/MemoryDataSource.hpp"
#include "df/data/PollWorker.hpp"
#include "df/debug/Stats.hpp"
#include "df/loop/CoalescingScheduler.hpp"
#include "df/loop/TickLoop.hpp"
#include "df/store/PendingQueue.hpp"
#include "df/store/WindowedStore.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <thread>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static df::Row closeRow(df::RowIndex idx, double close) {
  df::Row r;
  r.index = idx;
  r.fields["close"] = close;
  return r;
}

// Store, queue and scheduler wired the way SyncEngine wires them, with the
// flush handler only counting.
struct Rig {
  df::TickLoop loop;
  df::WindowedStore store;
  df::PendingQueue queue;
  int appendFlushes = 0;
  int correctionFlushes = 0;
  df::CoalescingScheduler scheduler;

  explicit Rig(std::size_t lookback)
    : store(lookback),
      scheduler(loop, [this](df::FlushKind k) {
        if (k == df::FlushKind::Append) appendFlushes++;
        else correctionFlushes++;
      }) {}
};

static df::PollWorkerConfig cfg(std::size_t lookback) {
  df::PollWorkerConfig c;
  c.lookback = lookback;
  c.timeoutMs = 10;
  return c;
}

int main() {
  // --- Test 1: fill, then only poll after notify ---
  {
    df::MemoryDataSource src({"close"});
    for (int i = 1; i <= 5; i++) src.append(closeRow(i, 100.0 + i));

    Rig rig(3);
    df::PollWorker worker(src, rig.store, rig.queue, rig.scheduler, cfg(3));
    requireTrue(worker.fill(), "fill succeeds");
    requireTrue(rig.store.size() == 3, "store holds lookback rows");
    requireTrue(rig.store.snapshot().front().index == 3, "most recent rows");
    requireTrue(worker.lastKnownPosition() == 5, "position at tail");
    requireTrue(rig.queue.isAppendPending(), "append flag set");
    requireTrue(rig.scheduler.isScheduled(df::FlushKind::Append), "append flush requested");

    std::size_t fetches = src.fetchCount();
    requireTrue(worker.pollOnce() == 0, "no poll without notify");
    requireTrue(src.fetchCount() == fetches, "source not touched");

    src.append(closeRow(6, 106.0));
    worker.notifyUpdate();
    requireTrue(worker.pollOnce() == 1, "one row routed");
    requireTrue(worker.lastKnownPosition() == 6, "position advanced");
    requireTrue(!worker.updatePending(), "flag consumed");
    requireTrue(rig.store.positionOfLastAppended() == 6, "store tail 6");

    rig.loop.runOnce();
    requireTrue(rig.appendFlushes == 1, "fill + append coalesced into one flush");
    std::printf("  Test 1 (fill + notify): PASS\n");
  }

  // --- Test 2: revisions become corrections once delivered ---
  {
    df::MemoryDataSource src({"close"});
    for (int i = 1; i <= 4; i++) src.append(closeRow(i, 10.0 * i));

    Rig rig(10);
    df::PollWorker worker(src, rig.store, rig.queue, rig.scheduler, cfg(10));
    worker.fill();
    rig.store.takeUndelivered();  // what the append flush does

    src.revise(closeRow(3, 33.0));
    src.append(closeRow(5, 50.0));
    worker.notifyUpdate();
    requireTrue(worker.pollOnce() == 2, "revision + new row routed");
    requireTrue(rig.queue.correctionCount() == 1, "one correction queued");
    requireTrue(rig.store.find(3)->get("close") == 33.0, "store already corrected");
    requireTrue(rig.scheduler.isScheduled(df::FlushKind::Correction), "correction flush requested");

    auto items = rig.queue.drainCorrections();
    requireTrue(items.size() == 1 && items[0].row.index == 3, "correction for row 3");
    requireTrue(items[0].generation == rig.store.generation(), "generation stamped");

    df::SyncStats st;
    worker.collect(st);
    requireTrue(st.rowsAppended == 1 && st.rowsCorrected == 1, "routing counters");
    std::printf("  Test 2 (corrections): PASS\n");
  }

  // --- Test 3: thrown fetch drops the cycle and retries ---
  {
    df::MemoryDataSource src({"close"});
    src.append(closeRow(1, 1.0));
    Rig rig(5);
    df::PollWorker worker(src, rig.store, rig.queue, rig.scheduler, cfg(5));
    worker.fill();

    src.append(closeRow(2, 2.0));
    src.failNextFetch("connection reset");
    worker.notifyUpdate();
    requireTrue(worker.pollOnce() == 0, "failed cycle routes nothing");
    requireTrue(rig.store.size() == 1, "store untouched");
    requireTrue(worker.updatePending(), "retry armed");
    requireTrue(worker.lastError().code == "SOURCE_FETCH_FAILED", "error recorded");

    requireTrue(worker.pollOnce() == 1, "retry routes the row");
    requireTrue(rig.store.size() == 2, "row applied on retry");

    df::SyncStats st;
    worker.collect(st);
    requireTrue(st.fetchErrors == 1, "one fetch error");
    std::printf("  Test 3 (fetch failure): PASS\n");
  }

  // --- Test 4: malformed batch applies nothing ---
  {
    df::MemoryDataSource src({"close"});
    src.append(closeRow(1, 1.0));
    Rig rig(5);
    df::PollWorker worker(src, rig.store, rig.queue, rig.scheduler, cfg(5));
    worker.fill();

    src.append(closeRow(2, 2.0));
    src.append(closeRow(3, 3.0));
    src.corruptNextFetch();
    worker.notifyUpdate();
    requireTrue(worker.pollOnce() == 0, "descending batch refused");
    requireTrue(rig.store.size() == 1, "nothing applied");
    requireTrue(worker.lastError().code == "SOURCE_MALFORMED_BATCH", "malformed recorded");
    requireTrue(worker.lastKnownPosition() == 1, "position unchanged");

    requireTrue(worker.pollOnce() == 2, "retry succeeds");
    requireTrue(rig.store.positionOfLastAppended() == 3, "both rows applied");
    std::printf("  Test 4 (malformed batch): PASS\n");
  }

  // --- Test 5: rejected rows are dropped, not refetched ---
  {
    df::MemoryDataSource src({"close"});
    src.append(closeRow(1, 1.0));
    Rig rig(5);
    df::PollWorker worker(src, rig.store, rig.queue, rig.scheduler, cfg(5));
    worker.fill();

    df::Row bad = closeRow(2, 2.0);
    bad.fields["vwap"] = 2.5;
    src.append(bad);
    worker.notifyUpdate();
    requireTrue(worker.pollOnce() == 1, "row routed");
    requireTrue(rig.store.size() == 1, "rejected row not stored");
    requireTrue(worker.lastKnownPosition() == 2, "position moves past rejected row");

    src.append(closeRow(3, 3.0));
    worker.notifyUpdate();
    requireTrue(worker.pollOnce() == 1, "only the new row fetched");

    df::SyncStats st;
    worker.collect(st);
    requireTrue(st.rowsRejected == 1, "one rejected");
    std::printf("  Test 5 (rejected rows): PASS\n");
  }

  // --- Test 6: failed initial fetch is retried by the next cycle ---
  {
    df::MemoryDataSource src({"close"});
    for (int i = 1; i <= 3; i++) src.append(closeRow(i, 1.0 * i));
    src.failNextFetch("not ready");

    Rig rig(5);
    df::PollWorker worker(src, rig.store, rig.queue, rig.scheduler, cfg(5));
    requireTrue(!worker.fill(), "fill fails");
    requireTrue(worker.resyncPending(), "resync pending");
    requireTrue(rig.store.size() == 0, "store empty");

    worker.pollOnce();
    requireTrue(!worker.resyncPending(), "resync done");
    requireTrue(rig.store.size() == 3, "store filled");
    requireTrue(rig.queue.isAppendPending(), "append pending after resync");
    std::printf("  Test 6 (initial fetch retry): PASS\n");
  }

  // --- Test 7: background thread picks up notifications, stops promptly ---
  {
    df::MemoryDataSource src({"close"});
    src.append(closeRow(1, 1.0));
    Rig rig(50);
    df::PollWorker worker(src, rig.store, rig.queue, rig.scheduler, cfg(50));
    worker.fill();
    worker.start();
    requireTrue(worker.isRunning(), "running");

    for (int i = 2; i <= 20; i++) {
      src.append(closeRow(i, 1.0 * i));
      worker.notifyUpdate();
    }
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (rig.store.positionOfLastAppended() != 20 &&
           std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    requireTrue(rig.store.positionOfLastAppended() == 20, "worker caught up");

    auto t0 = std::chrono::steady_clock::now();
    worker.stop();
    worker.join();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    requireTrue(!worker.isRunning(), "stopped");
    requireTrue(ms < 1000, "join returns within a cycle");
    std::printf("  Test 7 (thread, %lld ms to stop): PASS\n", static_cast<long long>(ms));
  }

  // --- Test 8: a revision in a dropped batch comes back on retry ---
  {
    df::MemoryDataSource src({"close"});
    for (int i = 1; i <= 3; i++) src.append(closeRow(i, 1.0 * i));
    Rig rig(10);
    df::PollWorker worker(src, rig.store, rig.queue, rig.scheduler, cfg(10));
    worker.fill();
    rig.store.takeUndelivered();

    src.revise(closeRow(2, 222.0));
    src.append(closeRow(4, 4.0));
    src.corruptNextFetch();
    worker.notifyUpdate();
    requireTrue(worker.pollOnce() == 0, "corrupted batch dropped");
    requireTrue(rig.queue.correctionCount() == 0, "nothing queued from dropped batch");

    requireTrue(worker.pollOnce() == 2, "retry carries revision and new row");
    requireTrue(rig.queue.correctionCount() == 1, "revision routed as correction");
    requireTrue(rig.store.find(2)->get("close") == 222.0, "store holds revised value");
    requireTrue(rig.store.positionOfLastAppended() == 4, "new row applied");

    // Applied batch was acknowledged: the revision is not reported again.
    worker.notifyUpdate();
    requireTrue(worker.pollOnce() == 0, "revision retired after success");

    // Revised again after being acknowledged: reported again.
    src.revise(closeRow(2, 333.0));
    worker.notifyUpdate();
    requireTrue(worker.pollOnce() == 1, "second revision reported");
    requireTrue(rig.store.find(2)->get("close") == 333.0, "second revision applied");
    std::printf("  Test 8 (revision survives dropped batch): PASS\n");
  }

  // --- Test 9: thrown fetch keeps revisions too ---
  {
    df::MemoryDataSource src({"close"});
    for (int i = 1; i <= 3; i++) src.append(closeRow(i, 1.0 * i));
    Rig rig(10);
    df::PollWorker worker(src, rig.store, rig.queue, rig.scheduler, cfg(10));
    worker.fill();
    rig.store.takeUndelivered();

    src.revise(closeRow(3, 30.0));
    src.failNextFetch("timeout");
    worker.notifyUpdate();
    requireTrue(worker.pollOnce() == 0, "failed fetch");
    requireTrue(worker.pollOnce() == 1, "retry returns the revision");
    requireTrue(rig.store.find(3)->get("close") == 30.0, "revision applied");
    std::printf("  Test 9 (revision survives thrown fetch): PASS\n");
  }

  std::printf("\nD4.1 poll worker PASS\n");
  return 0;
}
