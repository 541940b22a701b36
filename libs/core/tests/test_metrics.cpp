#include "kj/test.h"
#include "resilix/core/metrics.h"

#include <kj/string.h>
#include <thread>
#include <vector>

using namespace resilix::core;

namespace {

KJ_TEST("Counter: Increment") {
  Counter counter("resilix_svc_calls_total"_kj, "Calls"_kj);
  KJ_EXPECT(counter.value() == 0);
  counter.increment();
  counter.increment(4);
  KJ_EXPECT(counter.value() == 5);
  KJ_EXPECT(counter.type() == MetricType::Counter);
}

KJ_TEST("Gauge: Set and adjust") {
  Gauge gauge("resilix_svc_bulkhead_in_flight"_kj, "In flight"_kj);
  gauge.set(3);
  gauge.increment();
  gauge.decrement(2);
  KJ_EXPECT(gauge.value() == 2);
}

KJ_TEST("Histogram: Cumulative buckets") {
  Histogram histogram("latency"_kj, ""_kj, kj::heapArray<double>({0.01, 0.1, 1.0}));
  histogram.observe(0.005);
  histogram.observe(0.05);
  histogram.observe(0.5);
  histogram.observe(5.0);

  auto counts = histogram.bucket_counts();
  KJ_ASSERT(counts.size() == 3);
  KJ_EXPECT(counts[0] == 1);
  KJ_EXPECT(counts[1] == 2);
  KJ_EXPECT(counts[2] == 3);
  KJ_EXPECT(histogram.count() == 4);
  KJ_EXPECT(histogram.sum() > 5.5 && histogram.sum() < 5.6);
}

KJ_TEST("Histogram: Default buckets are ascending") {
  auto buckets = Histogram::default_buckets();
  KJ_ASSERT(buckets.size() > 1);
  for (size_t i = 1; i < buckets.size(); ++i) {
    KJ_EXPECT(buckets[i - 1] < buckets[i]);
  }
}

KJ_TEST("MetricsRegistry: Registration is idempotent") {
  MetricsRegistry registry;
  auto& first = registry.register_counter("resilix_svc_retries_total"_kj, "Retries"_kj);
  auto& second = registry.register_counter("resilix_svc_retries_total"_kj, "Retries"_kj);
  KJ_EXPECT(&first == &second);

  first.increment();
  KJ_EXPECT(registry.counter("resilix_svc_retries_total"_kj)->value() == 1);
  KJ_EXPECT(registry.counter("absent"_kj) == nullptr);
  KJ_EXPECT(registry.gauge("resilix_svc_retries_total"_kj) == nullptr);
}

KJ_TEST("MetricsRegistry: Names by type") {
  MetricsRegistry registry;
  registry.register_counter("b_total"_kj, ""_kj);
  registry.register_counter("a_total"_kj, ""_kj);
  registry.register_gauge("g"_kj, ""_kj);
  registry.register_histogram("h"_kj, ""_kj);

  auto counters = registry.counter_names();
  KJ_ASSERT(counters.size() == 2);
  KJ_EXPECT(counters[0] == "a_total");
  KJ_EXPECT(registry.gauge_names().size() == 1);
  KJ_EXPECT(registry.histogram_names().size() == 1);
}

KJ_TEST("MetricsRegistry: Prometheus export") {
  MetricsRegistry registry;
  registry.register_counter("resilix_svc_calls_total"_kj, "Calls for svc"_kj).increment(3);
  registry.register_gauge("resilix_svc_bulkhead_in_flight"_kj, ""_kj).set(2);
  registry
      .register_histogram("resilix_svc_latency_seconds"_kj, ""_kj,
                          kj::heapArray<double>({0.1, 1.0}))
      .observe(0.5);

  auto text = registry.to_prometheus();
  KJ_EXPECT(text.contains("# HELP resilix_svc_calls_total Calls for svc\n"_kj));
  KJ_EXPECT(text.contains("# TYPE resilix_svc_calls_total counter\n"_kj));
  KJ_EXPECT(text.contains("resilix_svc_calls_total 3\n"_kj));
  KJ_EXPECT(text.contains("resilix_svc_bulkhead_in_flight 2\n"_kj));
  KJ_EXPECT(text.contains("resilix_svc_latency_seconds_bucket{le=\"+Inf\"} 1\n"_kj));
  KJ_EXPECT(text.contains("resilix_svc_latency_seconds_count 1\n"_kj));
  // No HELP line without a description
  KJ_EXPECT(!text.contains("# HELP resilix_svc_bulkhead_in_flight"_kj));
}

KJ_TEST("MetricsRegistry: Concurrent increments") {
  MetricsRegistry registry;
  constexpr int kThreads = 4;
  constexpr int kIterations = 1000;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&registry]() {
      auto& counter = registry.register_counter("shared_total"_kj, ""_kj);
      for (int i = 0; i < kIterations; ++i) {
        counter.increment();
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  KJ_EXPECT(registry.counter("shared_total"_kj)->value() == kThreads * kIterations);
}

} // namespace
