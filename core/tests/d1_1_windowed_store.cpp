// D1.1 — WindowedStore + ColumnSchema
// Tests: lookback bound, correction vs append classification, eviction,
// delivered-position bookkeeping, replace(), schema checks.

#include "df/store/WindowedStore.hpp"
#include "df/store/ColumnSchema.hpp"

#include <cstdio>
#include <cstdlib>
#include <stdexcept>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static df::Row makeRow(df::RowIndex idx, double close) {
  df::Row r;
  r.index = idx;
  r.fields["close"] = close;
  return r;
}

static df::Table closeTable(df::RowIndex first, df::RowIndex last) {
  df::Table t;
  t.columns = {"close"};
  for (df::RowIndex i = first; i <= last; i++) t.rows.push_back(makeRow(i, 100.0 + i));
  return t;
}

int main() {
  // --- Test 1: appends never exceed lookback, highest indices retained ---
  {
    df::WindowedStore store(3);
    store.replace(closeTable(0, -1)); // schema only
    for (df::RowIndex i = 1; i <= 10; i++) {
      auto res = store.upsert(makeRow(i, 1.0 * i));
      requireTrue(res.kind == df::UpsertKind::Append, "new tail is append");
      requireTrue(store.size() <= 3, "size <= lookback after every append");
    }
    auto snap = store.snapshot();
    requireTrue(snap.size() == 3, "3 rows retained");
    requireTrue(snap[0].index == 8 && snap[1].index == 9 && snap[2].index == 10,
                "retained rows are the 3 highest indices");
    requireTrue(store.positionOfLastAppended() == 10, "tail is 10");
    std::printf("  Test 1 (lookback bound): PASS\n");
  }

  // --- Test 2: existing index is a correction once delivered, merged before ---
  {
    df::WindowedStore store(5);
    store.replace(closeTable(1, 3));

    // Not delivered yet: the pending append-flush will carry the new value.
    auto early = store.upsert(makeRow(2, 7.0));
    requireTrue(early.kind == df::UpsertKind::Append, "undelivered overwrite merges into append");
    requireTrue(store.size() == 3, "no duplicate row");

    auto batch = store.takeUndelivered();
    requireTrue(batch.rows.size() == 3, "3 rows delivered");
    requireTrue(batch.rows[1].get("close") == 7.0, "delivered row carries overwrite");
    requireTrue(store.lastDeliveredPosition() == 3, "delivered up to 3");

    auto late = store.upsert(makeRow(2, 8.0));
    requireTrue(late.kind == df::UpsertKind::Correction, "delivered overwrite is correction");
    requireTrue(store.size() == 3, "size unchanged by correction");
    requireTrue(store.find(2)->get("close") == 8.0, "value overwritten in place");
    std::printf("  Test 2 (correction classification): PASS\n");
  }

  // --- Test 3: scenario lookback=3, [1,2,3] + 4, then correction for 2 ---
  {
    df::WindowedStore store(3);
    store.replace(closeTable(1, 3));
    auto first = store.takeUndelivered();
    requireTrue(first.rows.size() == 3 && first.retentionCap == 3, "initial batch");

    requireTrue(store.upsert(makeRow(4, 104.0)).kind == df::UpsertKind::Append, "4 appended");
    auto snap = store.snapshot();
    requireTrue(snap.size() == 3 && snap[0].index == 2 && snap[2].index == 4,
                "store is [2,3,4]");

    auto second = store.takeUndelivered();
    requireTrue(second.rows.size() == 1 && second.rows[0].index == 4, "only row 4 delivered");
    requireTrue(store.lastDeliveredPosition() == 4, "last delivered is 4");

    requireTrue(store.upsert(makeRow(5, 105.0)).kind == df::UpsertKind::Append, "5 appended");
    auto evicted = store.upsert(makeRow(2, 222.0));
    requireTrue(evicted.kind == df::UpsertKind::Evicted, "index 2 is out of the window");
    requireTrue(!store.find(2).has_value(), "evicted row not stored");
    requireTrue(store.size() == 3, "size unchanged");
    std::printf("  Test 3 (eviction scenario): PASS\n");
  }

  // --- Test 4: gap below the tail is inserted in order ---
  {
    df::WindowedStore store(5);
    df::Table t;
    t.columns = {"close"};
    t.rows = {makeRow(1, 1.0), makeRow(3, 3.0)};
    store.replace(t);
    store.takeUndelivered();

    auto res = store.upsert(makeRow(2, 2.0));
    requireTrue(res.kind == df::UpsertKind::Correction, "gap row below delivered is correction");
    auto snap = store.snapshot();
    requireTrue(snap.size() == 3 && snap[1].index == 2, "gap inserted in order");

    auto res2 = store.upsert(makeRow(0, 0.5));
    requireTrue(res2.kind == df::UpsertKind::Correction, "head insert below delivered");
    requireTrue(store.snapshot().front().index == 0, "inserted at head");
    std::printf("  Test 4 (gap insert): PASS\n");
  }

  // --- Test 5: delivered position monotonic except right after replace ---
  {
    df::WindowedStore store(4);
    store.replace(closeTable(1, 2));
    df::RowIndex prev = store.lastDeliveredPosition();
    requireTrue(prev == df::kNoPosition, "nothing delivered after replace");

    for (df::RowIndex i = 3; i <= 12; i++) {
      store.upsert(makeRow(i, 0.0));
      if (i % 3 == 0) store.takeUndelivered();
      df::RowIndex cur = store.lastDeliveredPosition();
      requireTrue(cur >= prev, "delivered position never decreases");
      prev = cur;
    }

    store.takeUndelivered();
    auto none = store.takeUndelivered();
    requireTrue(none.empty(), "second take with no new data is empty");
    requireTrue(store.lastDeliveredPosition() == 12, "position stays at 12");

    std::uint64_t gen = store.generation();
    store.replace(closeTable(100, 101));
    requireTrue(store.lastDeliveredPosition() == df::kNoPosition, "replace resets position");
    requireTrue(store.generation() == gen + 1, "replace bumps generation");
    auto fresh = store.takeUndelivered(gen);
    requireTrue(fresh.schemaChanged, "schema flagged for old generation");
    requireTrue(fresh.rows.size() == 2 && fresh.rows[0].index == 100, "whole new content is fresh");
    std::printf("  Test 5 (delivered position): PASS\n");
  }

  // --- Test 6: replace sorts, dedupes and trims to lookback ---
  {
    df::WindowedStore store(3);
    df::Table t;
    t.columns = {"close"};
    t.rows = {makeRow(5, 5.0), makeRow(1, 1.0), makeRow(4, 4.0),
              makeRow(4, 44.0), makeRow(2, 2.0), makeRow(-3, 0.0)};
    store.replace(t);
    auto snap = store.snapshot();
    requireTrue(snap.size() == 3, "trimmed to lookback");
    requireTrue(snap[0].index == 2 && snap[1].index == 4 && snap[2].index == 5,
                "ascending, highest kept");
    requireTrue(snap[1].get("close") == 44.0, "last duplicate wins");
    std::printf("  Test 6 (replace normalization): PASS\n");
  }

  // --- Test 7: schema is fixed per replace and fails closed ---
  {
    df::Table t;
    t.columns = {"open", "close"};
    df::Row r = makeRow(1, 10.0);
    r.fields["volume"] = 5.0;
    t.rows.push_back(r);

    df::ColumnSchema s = df::ColumnSchema::fromTable(t, 7);
    requireTrue(s.size() == 3, "declared + seen columns");
    requireTrue(s.columns()[0] == "open" && s.columns()[1] == "close" &&
                s.columns()[2] == "volume", "declared first, then first-seen");
    requireTrue(s.generation() == 7, "generation recorded");

    df::Row partial;
    partial.index = 2;
    partial.fields["close"] = 3.0;
    auto dense = s.dense(partial);
    requireTrue(dense.size() == 3 && df::isNull(dense[0]) && dense[1] == 3.0,
                "missing fields are null");

    df::WindowedStore store(10);
    store.replace(t);
    df::Row unknown = makeRow(2, 1.0);
    unknown.fields["vwap"] = 1.0;
    auto res = store.upsert(unknown);
    requireTrue(res.kind == df::UpsertKind::Rejected, "unknown field rejected");
    requireTrue(res.err.code == "SCHEMA_UNKNOWN_FIELD", "schema error code");
    requireTrue(store.size() == 1, "rejected row not applied");

    auto neg = store.upsert(makeRow(-5, 1.0));
    requireTrue(neg.kind == df::UpsertKind::Rejected, "negative index rejected");
    requireTrue(neg.err.code == "ROW_INVALID_INDEX", "index error code");

    requireTrue(store.upsert(partial).kind == df::UpsertKind::Append, "partial row accepted");
    requireTrue(df::isNull(store.find(2)->get("open")), "absent field reads null");
    std::printf("  Test 7 (schema): PASS\n");
  }

  // --- Test 8: lookback 0 is refused ---
  {
    bool threw = false;
    try {
      df::WindowedStore store(0);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    requireTrue(threw, "lookback 0 throws");
    std::printf("  Test 8 (invalid lookback): PASS\n");
  }

  std::printf("\nD1.1 windowed store PASS\n");
  return 0;
}
