#pragma once

/// @file metrics.h
/// @brief Self-monitoring counters, gauges and histograms exported on /metrics
///
/// Metrics live in a process-wide registry keyed by name and are rendered in
/// the Prometheus text format, sorted by name. The daemon records:
///   runlens_aggregations_total, runlens_aggregation_failures_total,
///   runlens_aggregation_duration_seconds, runlens_jobs_{created,completed,failed}_total,
///   runlens_jobs_running, runlens_reports_skipped_total, runlens_http_requests_total

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace runlens {

class Metric {
public:
    Metric(std::string name, std::string help)
        : name_(std::move(name)), help_(std::move(help)) {}
    virtual ~Metric() = default;

    const std::string& Name() const { return name_; }
    const std::string& Help() const { return help_; }

    /// @brief Append the TYPE line and the samples of this metric
    virtual void AppendSamples(std::string* out) const = 0;

private:
    std::string name_;
    std::string help_;
};

/// @brief Monotonic count; negative deltas are ignored
class Counter : public Metric {
public:
    using Metric::Metric;

    void Increment() { Add(1); }
    void Add(int64_t delta);
    int64_t Value() const { return value_.load(std::memory_order_relaxed); }

    void AppendSamples(std::string* out) const override;

private:
    std::atomic<int64_t> value_{0};
};

class Gauge : public Metric {
public:
    using Metric::Metric;

    void Set(double value) { value_.store(value, std::memory_order_relaxed); }
    void Increment(double delta = 1.0);
    void Decrement(double delta = 1.0) { Increment(-delta); }
    double Value() const { return value_.load(std::memory_order_relaxed); }

    void AppendSamples(std::string* out) const override;

private:
    std::atomic<double> value_{0.0};
};

/// @brief Distribution over fixed upper bounds plus an implicit +Inf bucket
class Histogram : public Metric {
public:
    /// Bounds tuned for aggregation and job durations in seconds
    static std::vector<double> DefaultBounds();

    Histogram(std::string name, std::vector<double> bounds, std::string help = "");

    void Observe(double value);

    int64_t Count() const;
    double Sum() const;

    /// @brief Cumulative (upper bound, count) pairs, +Inf last
    std::vector<std::pair<double, int64_t>> Buckets() const;

    void AppendSamples(std::string* out) const override;

private:
    std::vector<double> bounds_;

    mutable std::mutex mutex_;
    std::vector<int64_t> counts_;  // one per bound, then +Inf
    int64_t count_ = 0;
    double sum_ = 0.0;
};

/// @brief Observes the seconds elapsed between construction and destruction
class ScopedTimer {
public:
    explicit ScopedTimer(Histogram& histogram)
        : histogram_(histogram), start_(std::chrono::steady_clock::now()) {}
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

class MetricsRegistry {
public:
    static MetricsRegistry& Instance();

    /// @brief Find or create; @p help only applies on creation
    /// @throws std::logic_error if @p name is registered with another type
    Counter& GetCounter(const std::string& name, const std::string& help = "");
    Gauge& GetGauge(const std::string& name, const std::string& help = "");
    Histogram& GetHistogram(const std::string& name, const std::string& help = "");

    std::string ExportText() const;

    /// @brief Drop every metric; references handed out before become dangling
    void Reset();

private:
    MetricsRegistry() = default;

    template <typename T, typename... Args>
    T& GetOrCreate(const std::string& name, Args&&... args);

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<Metric>> metrics_;
};

#define RUNLENS_COUNTER(name) ::runlens::MetricsRegistry::Instance().GetCounter(name)
#define RUNLENS_GAUGE(name) ::runlens::MetricsRegistry::Instance().GetGauge(name)
#define RUNLENS_HISTOGRAM(name) ::runlens::MetricsRegistry::Instance().GetHistogram(name)

}  // namespace runlens
