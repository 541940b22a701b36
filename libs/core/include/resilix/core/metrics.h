#pragma once

#include <atomic>
#include <cstdint>
#include <initializer_list>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace resilix::core {

// Metric type
enum class MetricType { Counter, Gauge, Histogram };

// Base metric class
class Metric {
public:
  explicit Metric(kj::StringPtr name, kj::StringPtr description)
      : name_(kj::heapString(name)), description_(kj::heapString(description)) {}
  virtual ~Metric() noexcept = default;

  [[nodiscard]] kj::StringPtr name() const noexcept {
    return name_;
  }
  [[nodiscard]] kj::StringPtr description() const noexcept {
    return description_;
  }
  [[nodiscard]] virtual MetricType type() const noexcept = 0;

private:
  kj::String name_;
  kj::String description_;
};

// Counter metric (monotonically increasing)
class Counter final : public Metric {
public:
  explicit Counter(kj::StringPtr name, kj::StringPtr description) : Metric(name, description) {}

  void increment(int64_t value = 1) noexcept {
    count_ += value;
  }

  [[nodiscard]] int64_t value() const noexcept {
    return count_.load();
  }

  [[nodiscard]] MetricType type() const noexcept override {
    return MetricType::Counter;
  }

private:
  std::atomic<int64_t> count_{0};
};

// Gauge metric (can increase or decrease)
class Gauge final : public Metric {
public:
  explicit Gauge(kj::StringPtr name, kj::StringPtr description) : Metric(name, description) {}

  void increment(int64_t value = 1) noexcept {
    value_ += value;
  }
  void decrement(int64_t value = 1) noexcept {
    value_ -= value;
  }
  void set(int64_t value) noexcept {
    value_.store(value);
  }

  [[nodiscard]] int64_t value() const noexcept {
    return value_.load();
  }

  [[nodiscard]] MetricType type() const noexcept override {
    return MetricType::Gauge;
  }

private:
  std::atomic<int64_t> value_{0};
};

// Histogram metric (cumulative buckets, Prometheus style)
class Histogram final : public Metric {
public:
  explicit Histogram(kj::StringPtr name, kj::StringPtr description,
                     kj::Array<double> buckets = default_buckets());

  void observe(double value) noexcept;

  [[nodiscard]] int64_t count() const noexcept {
    return count_.load();
  }
  [[nodiscard]] double sum() const noexcept {
    return sum_.load();
  }
  [[nodiscard]] kj::ArrayPtr<const double> buckets() const noexcept {
    return buckets_;
  }
  [[nodiscard]] kj::Array<int64_t> bucket_counts() const;

  [[nodiscard]] MetricType type() const noexcept override {
    return MetricType::Histogram;
  }

  static kj::Array<double> default_buckets();

private:
  kj::Array<double> buckets_;
  kj::Array<std::atomic<int64_t>> bucket_counts_;
  std::atomic<int64_t> count_{0};
  std::atomic<double> sum_{0.0};
};

/**
 * @brief Named collection of metrics with Prometheus text export
 *
 * Registration is idempotent: registering an existing name returns the
 * metric already stored under it. Returned references stay valid for the
 * lifetime of the registry.
 */
class MetricsRegistry final {
public:
  MetricsRegistry() = default;
  KJ_DISALLOW_COPY_AND_MOVE(MetricsRegistry);

  Counter& register_counter(kj::StringPtr name, kj::StringPtr description);
  Gauge& register_gauge(kj::StringPtr name, kj::StringPtr description);
  Histogram& register_histogram(kj::StringPtr name, kj::StringPtr description,
                                kj::Array<double> buckets = Histogram::default_buckets());

  // Lookup, nullptr if not registered
  [[nodiscard]] Counter* counter(kj::StringPtr name) const;
  [[nodiscard]] Gauge* gauge(kj::StringPtr name) const;
  [[nodiscard]] Histogram* histogram(kj::StringPtr name) const;

  [[nodiscard]] kj::Vector<kj::String> counter_names() const;
  [[nodiscard]] kj::Vector<kj::String> gauge_names() const;
  [[nodiscard]] kj::Vector<kj::String> histogram_names() const;

  // Export metrics to Prometheus format
  [[nodiscard]] kj::String to_prometheus() const;

private:
  struct RegistryState {
    kj::TreeMap<kj::String, kj::Own<Counter>> counters;
    kj::TreeMap<kj::String, kj::Own<Gauge>> gauges;
    kj::TreeMap<kj::String, kj::Own<Histogram>> histograms;
  };

  kj::MutexGuarded<RegistryState> guarded_;
};

} // namespace resilix::core
