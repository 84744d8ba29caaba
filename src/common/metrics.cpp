#include "metrics.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <absl/strings/str_cat.h>

namespace runlens {

namespace {

void AppendHeader(const Metric& metric, std::string_view type, std::string* out) {
    if (!metric.Help().empty()) {
        absl::StrAppend(out, "# HELP ", metric.Name(), " ", metric.Help(), "\n");
    }
    absl::StrAppend(out, "# TYPE ", metric.Name(), " ", type, "\n");
}

std::string FormatBound(double bound) {
    if (bound == std::numeric_limits<double>::infinity()) {
        return "+Inf";
    }
    return absl::StrCat(bound);
}

}  // namespace

// ============================================================================
// Counter / Gauge
// ============================================================================

void Counter::Add(int64_t delta) {
    if (delta > 0) {
        value_.fetch_add(delta, std::memory_order_relaxed);
    }
}

void Counter::AppendSamples(std::string* out) const {
    AppendHeader(*this, "counter", out);
    absl::StrAppend(out, Name(), " ", Value(), "\n");
}

void Gauge::Increment(double delta) {
    double current = value_.load(std::memory_order_relaxed);
    while (!value_.compare_exchange_weak(current, current + delta,
                                         std::memory_order_relaxed)) {
    }
}

void Gauge::AppendSamples(std::string* out) const {
    AppendHeader(*this, "gauge", out);
    absl::StrAppend(out, Name(), " ", Value(), "\n");
}

// ============================================================================
// Histogram
// ============================================================================

std::vector<double> Histogram::DefaultBounds() {
    return {0.001, 0.005, 0.025, 0.1, 0.5, 1.0, 5.0, 30.0, 120.0, 600.0};
}

Histogram::Histogram(std::string name, std::vector<double> bounds, std::string help)
    : Metric(std::move(name), std::move(help)), bounds_(std::move(bounds)) {
    std::sort(bounds_.begin(), bounds_.end());
    bounds_.erase(std::unique(bounds_.begin(), bounds_.end()), bounds_.end());
    counts_.assign(bounds_.size() + 1, 0);
}

void Histogram::Observe(double value) {
    // Prometheus buckets are inclusive upper bounds
    const size_t index = std::lower_bound(bounds_.begin(), bounds_.end(), value) - bounds_.begin();
    std::lock_guard<std::mutex> lock(mutex_);
    ++counts_[index];
    ++count_;
    sum_ += value;
}

int64_t Histogram::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_;
}

double Histogram::Sum() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sum_;
}

std::vector<std::pair<double, int64_t>> Histogram::Buckets() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<double, int64_t>> result;
    result.reserve(counts_.size());
    int64_t cumulative = 0;
    for (size_t i = 0; i < counts_.size(); ++i) {
        cumulative += counts_[i];
        const double bound =
            i < bounds_.size() ? bounds_[i] : std::numeric_limits<double>::infinity();
        result.emplace_back(bound, cumulative);
    }
    return result;
}

void Histogram::AppendSamples(std::string* out) const {
    AppendHeader(*this, "histogram", out);
    for (const auto& [bound, count] : Buckets()) {
        absl::StrAppend(out, Name(), "_bucket{le=\"", FormatBound(bound), "\"} ", count, "\n");
    }
    absl::StrAppend(out, Name(), "_sum ", Sum(), "\n");
    absl::StrAppend(out, Name(), "_count ", Count(), "\n");
}

ScopedTimer::~ScopedTimer() {
    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    histogram_.Observe(elapsed.count());
}

// ============================================================================
// MetricsRegistry
// ============================================================================

MetricsRegistry& MetricsRegistry::Instance() {
    static MetricsRegistry instance;
    return instance;
}

template <typename T, typename... Args>
T& MetricsRegistry::GetOrCreate(const std::string& name, Args&&... args) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metrics_.find(name);
    if (it == metrics_.end()) {
        it = metrics_.emplace(name, std::make_unique<T>(name, std::forward<Args>(args)...)).first;
    }
    auto* typed = dynamic_cast<T*>(it->second.get());
    if (typed == nullptr) {
        throw std::logic_error(absl::StrCat("Metric ", name, " registered with another type"));
    }
    return *typed;
}

Counter& MetricsRegistry::GetCounter(const std::string& name, const std::string& help) {
    return GetOrCreate<Counter>(name, help);
}

Gauge& MetricsRegistry::GetGauge(const std::string& name, const std::string& help) {
    return GetOrCreate<Gauge>(name, help);
}

Histogram& MetricsRegistry::GetHistogram(const std::string& name, const std::string& help) {
    return GetOrCreate<Histogram>(name, Histogram::DefaultBounds(), help);
}

std::string MetricsRegistry::ExportText() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string out;
    for (const auto& [name, metric] : metrics_) {
        metric->AppendSamples(&out);
    }
    return out;
}

void MetricsRegistry::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    metrics_.clear();
}

}  // namespace runlens
