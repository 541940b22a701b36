#include "resilix/core/metrics.h"

#include <kj/common.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string-tree.h>

namespace resilix::core {

// ============================================================================
// Histogram
// ============================================================================

Histogram::Histogram(kj::StringPtr name, kj::StringPtr description, kj::Array<double> buckets)
    : Metric(name, description), buckets_(kj::mv(buckets)),
      bucket_counts_(kj::heapArray<std::atomic<int64_t>>(buckets_.size())) {
  for (auto& count : bucket_counts_) {
    count.store(0);
  }
}

void Histogram::observe(double value) noexcept {
  count_++;
  sum_ += value;
  for (size_t i = 0; i < buckets_.size(); ++i) {
    if (value <= buckets_[i]) {
      bucket_counts_[i].fetch_add(1);
    }
  }
}

kj::Array<int64_t> Histogram::bucket_counts() const {
  auto builder = kj::heapArrayBuilder<int64_t>(bucket_counts_.size());
  for (const auto& count : bucket_counts_) {
    builder.add(count.load());
  }
  return builder.finish();
}

kj::Array<double> Histogram::default_buckets() {
  return kj::heapArray<double>({0.001, 0.002, 0.005, 0.01, 0.02, 0.05, 0.1, 0.2, 0.5, 1.0, 2.0,
                                5.0, 10.0, 30.0, 60.0});
}

// ============================================================================
// MetricsRegistry
// ============================================================================

namespace {

template <typename M> kj::Vector<kj::String> names_of(const kj::TreeMap<kj::String, kj::Own<M>>& map) {
  kj::Vector<kj::String> names(map.size());
  for (const auto& entry : map) {
    names.add(kj::str(entry.key));
  }
  return names;
}

} // namespace

Counter& MetricsRegistry::register_counter(kj::StringPtr name, kj::StringPtr description) {
  auto lock = guarded_.lockExclusive();
  return *lock->counters.findOrCreate(name, [&]() -> decltype(lock->counters)::Entry {
    return {kj::str(name), kj::heap<Counter>(name, description)};
  });
}

Gauge& MetricsRegistry::register_gauge(kj::StringPtr name, kj::StringPtr description) {
  auto lock = guarded_.lockExclusive();
  return *lock->gauges.findOrCreate(name, [&]() -> decltype(lock->gauges)::Entry {
    return {kj::str(name), kj::heap<Gauge>(name, description)};
  });
}

Histogram& MetricsRegistry::register_histogram(kj::StringPtr name, kj::StringPtr description,
                                               kj::Array<double> buckets) {
  auto lock = guarded_.lockExclusive();
  return *lock->histograms.findOrCreate(name, [&]() -> decltype(lock->histograms)::Entry {
    return {kj::str(name), kj::heap<Histogram>(name, description, kj::mv(buckets))};
  });
}

Counter* MetricsRegistry::counter(kj::StringPtr name) const {
  auto lock = guarded_.lockShared();
  KJ_IF_SOME(value, lock->counters.find(name)) {
    return value.get();
  }
  return nullptr;
}

Gauge* MetricsRegistry::gauge(kj::StringPtr name) const {
  auto lock = guarded_.lockShared();
  KJ_IF_SOME(value, lock->gauges.find(name)) {
    return value.get();
  }
  return nullptr;
}

Histogram* MetricsRegistry::histogram(kj::StringPtr name) const {
  auto lock = guarded_.lockShared();
  KJ_IF_SOME(value, lock->histograms.find(name)) {
    return value.get();
  }
  return nullptr;
}

kj::Vector<kj::String> MetricsRegistry::counter_names() const {
  return names_of(guarded_.lockShared()->counters);
}

kj::Vector<kj::String> MetricsRegistry::gauge_names() const {
  return names_of(guarded_.lockShared()->gauges);
}

kj::Vector<kj::String> MetricsRegistry::histogram_names() const {
  return names_of(guarded_.lockShared()->histograms);
}

kj::String MetricsRegistry::to_prometheus() const {
  auto lock = guarded_.lockShared();

  kj::Vector<kj::StringTree> lines;

  for (const auto& entry : lock->counters) {
    const auto& name = entry.key;
    const auto& counter = entry.value;
    if (counter->description().size() > 0) {
      lines.add(kj::strTree("# HELP "_kj, name, " "_kj, counter->description(), "\n"_kj));
    }
    lines.add(kj::strTree("# TYPE "_kj, name, " counter\n"_kj));
    lines.add(kj::strTree(name, " "_kj, counter->value(), "\n"_kj));
  }

  for (const auto& entry : lock->gauges) {
    const auto& name = entry.key;
    const auto& gauge = entry.value;
    if (gauge->description().size() > 0) {
      lines.add(kj::strTree("# HELP "_kj, name, " "_kj, gauge->description(), "\n"_kj));
    }
    lines.add(kj::strTree("# TYPE "_kj, name, " gauge\n"_kj));
    lines.add(kj::strTree(name, " "_kj, gauge->value(), "\n"_kj));
  }

  for (const auto& entry : lock->histograms) {
    const auto& name = entry.key;
    const auto& histogram = entry.value;
    if (histogram->description().size() > 0) {
      lines.add(kj::strTree("# HELP "_kj, name, " "_kj, histogram->description(), "\n"_kj));
    }
    lines.add(kj::strTree("# TYPE "_kj, name, " histogram\n"_kj));
    auto bucket_counts = histogram->bucket_counts();
    auto buckets = histogram->buckets();
    for (size_t i = 0; i < buckets.size(); ++i) {
      lines.add(kj::strTree(name, "_bucket{le=\""_kj, buckets[i], "\"} "_kj, bucket_counts[i],
                            "\n"_kj));
    }
    lines.add(kj::strTree(name, "_bucket{le=\"+Inf\"} "_kj, histogram->count(), "\n"_kj));
    lines.add(kj::strTree(name, "_sum "_kj, histogram->sum(), "\n"_kj));
    lines.add(kj::strTree(name, "_count "_kj, histogram->count(), "\n"_kj));
  }

  return kj::StringTree(lines.releaseAsArray(), ""_kj).flatten();
}

} // namespace resilix::core
