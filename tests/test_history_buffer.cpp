#include "minitest.hpp"
#include "app/MetricHistory.hpp"
#include "util/HistoryBuffer.hpp"

using puls::util::HistoryBuffer;

TEST(history_keeps_last_n_in_order) {
  HistoryBuffer<double> h(4);
  for (int i = 1; i <= 7; ++i) h.push(i);
  ASSERT_EQ(h.size(), 4u);
  auto v = h.values();
  ASSERT_EQ(v.size(), 4u);
  ASSERT_EQ(v[0], 4.0);
  ASSERT_EQ(v[3], 7.0);
  ASSERT_EQ(*h.latest(), 7.0);
}

TEST(history_partial_fill) {
  HistoryBuffer<int> h(10);
  h.push(3);
  h.push(5);
  auto v = h.values();
  ASSERT_EQ(v.size(), 2u);
  ASSERT_EQ(v[0], 3);
  ASSERT_EQ(v[1], 5);
}

TEST(history_reset_drops_samples) {
  HistoryBuffer<int> h(3);
  h.push(1); h.push(2);
  h.reset(5);
  ASSERT_TRUE(h.empty());
  ASSERT_EQ(h.capacity(), 5u);
  for (int i = 0; i < 6; ++i) h.push(i);
  ASSERT_EQ(h.size(), 5u);
  ASSERT_EQ(h.values().front(), 1);
}

TEST(history_zero_capacity_ignores_push) {
  HistoryBuffer<int> h(0);
  h.push(1);
  ASSERT_TRUE(h.empty());
  ASSERT_TRUE(h.values().empty());
}

TEST(history_latest_is_empty_until_first_push) {
  HistoryBuffer<double> h(3);
  ASSERT_TRUE(!h.latest().has_value());
  h.push(1.5);
  ASSERT_EQ(*h.latest(), 1.5);
  h.reset(3);
  ASSERT_TRUE(!h.latest().has_value());

  HistoryBuffer<double> none(0);
  none.push(2.0);
  ASSERT_TRUE(!none.latest().has_value());
}

TEST(metric_history_streams_are_independent) {
  puls::app::MetricHistory mh(3);
  for (int i = 0; i < 5; ++i) mh.append("cpu.total", i * 10.0);
  mh.append("mem.used_pct", 42.0);
  auto all = mh.export_all();
  ASSERT_EQ(all.size(), 2u);
  ASSERT_EQ(all["cpu.total"].size(), 3u);
  ASSERT_EQ(all["cpu.total"].front(), 20.0);
  ASSERT_EQ(all["mem.used_pct"].size(), 1u);

  mh.reset(10);
  ASSERT_EQ(mh.length(), 10u);
  ASSERT_TRUE(mh.export_all().empty());
}
