#include "minitest.hpp"
#include "app/MetricsRegistry.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using rtspmon::app::MetricsRegistry;
using rtspmon::model::Labels;
using rtspmon::model::MetricKind;

TEST(registry_set_and_get) {
  MetricsRegistry reg;
  reg.set_gauge("stream_up", {{"stream", "a"}}, 1);
  ASSERT_EQ(*reg.value("stream_up", {{"stream", "a"}}), 1.0);
  reg.set_gauge("stream_up", {{"stream", "a"}}, 0);
  ASSERT_EQ(*reg.value("stream_up", {{"stream", "a"}}), 0.0);
  ASSERT_FALSE(reg.value("stream_up", {{"stream", "b"}}).has_value());
  ASSERT_EQ(reg.size(), 1u);
}

TEST(registry_label_order_does_not_matter) {
  MetricsRegistry reg;
  reg.increment_counter("probe_errors_total", {{"stream", "a"}, {"error", "timeout"}});
  reg.increment_counter("probe_errors_total", {{"error", "timeout"}, {"stream", "a"}});
  ASSERT_EQ(reg.size(), 1u);
  ASSERT_EQ(*reg.value("probe_errors_total", {{"stream", "a"}, {"error", "timeout"}}), 2.0);
}

TEST(registry_counter_ignores_negative_delta) {
  MetricsRegistry reg;
  reg.increment_counter("c", {}, 2.5);
  reg.increment_counter("c", {}, -10);
  ASSERT_EQ(*reg.value("c", {}), 2.5);
}

TEST(registry_normalize_last_duplicate_wins) {
  auto n = MetricsRegistry::normalize({{"b", "1"}, {"a", "x"}, {"b", "2"}});
  Labels want{{"a", "x"}, {"b", "2"}};
  ASSERT_TRUE(n == want);
}

TEST(registry_snapshot_is_ordered) {
  MetricsRegistry reg;
  reg.set_gauge("z_metric", {}, 1);
  reg.set_gauge("a_metric", {{"stream", "b"}}, 2);
  reg.set_gauge("a_metric", {{"stream", "a"}}, 3);
  auto snap = reg.snapshot();
  ASSERT_EQ(snap.size(), 3u);
  ASSERT_EQ(snap[0].name, std::string("a_metric"));
  ASSERT_EQ(snap[0].labels[0].second, std::string("a"));
  ASSERT_EQ(snap[1].labels[0].second, std::string("b"));
  ASSERT_EQ(snap[2].name, std::string("z_metric"));
}

TEST(registry_kind_from_description) {
  MetricsRegistry reg;
  reg.describe("probe_cycles_total", "cycles", MetricKind::Counter);
  reg.set_gauge("probe_cycles_total", {}, 5);
  reg.increment_counter("undescribed_total", {});
  auto snap = reg.snapshot();
  ASSERT_TRUE(snap[0].kind == MetricKind::Counter);
  ASSERT_TRUE(snap[1].kind == MetricKind::Counter);
  ASSERT_EQ(reg.families().size(), 1u);
}

TEST(registry_concurrent_writers_and_readers) {
  MetricsRegistry reg;
  constexpr int kWriters = 8;
  constexpr int kIters = 20000;
  std::atomic<bool> done{false};
  std::atomic<int> torn{0};

  std::vector<std::thread> readers;
  for (int r = 0; r < 2; ++r) {
    readers.emplace_back([&]{
      while (!done.load()) {
        for (const auto& s : reg.snapshot()) {
          // Gauges only ever hold 0 or 1 in this test.
          if (s.name == "stream_up" && s.value != 0.0 && s.value != 1.0) torn.fetch_add(1);
        }
      }
    });
  }

  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&, w]{
      std::string stream = "s" + std::to_string(w);
      for (int i = 0; i < kIters; ++i) {
        reg.set_gauge("stream_up", {{"stream", stream}}, i % 2);
        reg.increment_counter("probe_cycles_total", {{"stream", stream}});
        reg.increment_counter("shared_total", {});
      }
    });
  }
  for (auto& t : writers) t.join();
  done.store(true);
  for (auto& t : readers) t.join();

  ASSERT_EQ(torn.load(), 0);
  ASSERT_EQ(*reg.value("shared_total", {}), static_cast<double>(kWriters * kIters));
  for (int w = 0; w < kWriters; ++w)
    ASSERT_EQ(*reg.value("probe_cycles_total", {{"stream", "s" + std::to_string(w)}}),
              static_cast<double>(kIters));
}
