#include <cache/cache.h>
#include <cache/stats.h>
#include <gtest/gtest.h>

#include <cstdint>

namespace fifocache {
namespace cache {
namespace {

TEST(StatsTest, GetsAndHits) {
  Cache<int64_t, int64_t> c(1000);
  for (int64_t i = 0; i < 30; i++) {
    c.Set(i, i);
  }
  // 50 gets, 30 of them hits
  for (int64_t i = 0; i < 50; i++) {
    c.Get(i);
  }
  Stats st;
  c.UpdateStats(st);
  EXPECT_EQ(st.get_calls, 50u);
  EXPECT_EQ(st.misses, 20u);
  EXPECT_EQ(st.hits, 30u);
  EXPECT_EQ(st.set_calls, 30u);
  EXPECT_EQ(st.entries_count, 30u);
  EXPECT_EQ(st.max_entries, 1000u);
  EXPECT_EQ(st.deletes, 0u);
  EXPECT_EQ(st.evictions, 0u);
}

TEST(StatsTest, Accumulates) {
  Cache<int64_t, int64_t> c(100);
  c.Set(1, 1);
  c.Get(1);
  Stats st;
  c.UpdateStats(st);
  c.UpdateStats(st);
  EXPECT_EQ(st.get_calls, 2u);
  EXPECT_EQ(st.set_calls, 2u);

  st.Reset();
  EXPECT_EQ(st.get_calls, 0u);
  c.UpdateStats(st);
  EXPECT_EQ(st.get_calls, 1u);
}

TEST(StatsTest, Evictions) {
  Cache<int64_t, int64_t> c(10, 1);
  for (int64_t i = 0; i < 25; i++) {
    c.Set(i, i);
  }
  c.Delete(100);
  c.GetAndDelete(24);
  Stats st;
  c.UpdateStats(st);
  EXPECT_EQ(st.evictions, 15u);
  EXPECT_EQ(st.deletes, 2u);
  EXPECT_EQ(st.entries_count, 9u);
}

TEST(StatsTest, String) {
  Stats st;
  st.get_calls = 3;
  st.misses = 1;
  st.hits = 2;
  EXPECT_EQ(st.String(),
            "{get_calls:3 set_calls:0 misses:1 hits:2 deletes:0 evictions:0 "
            "entries_count:0 max_entries:0}");
  EXPECT_EQ(fmt::format("{}", st), st.String());
}

};  // namespace
};  // namespace cache
};  // namespace fifocache
