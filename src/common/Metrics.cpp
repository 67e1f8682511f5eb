#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <utility>

namespace ldg::common::metrics {
namespace {

double computeQuantile(const std::vector<double>& sortedValues, double quantile) {
    if (sortedValues.empty()) {
        return 0.0;
    }
    if (sortedValues.size() == 1U) {
        return sortedValues.front();
    }

    const double clampedQuantile = std::clamp(quantile, 0.0, 1.0);
    const double position = clampedQuantile * static_cast<double>(sortedValues.size() - 1U);
    const auto lowerIndex = static_cast<std::size_t>(std::floor(position));
    const auto upperIndex = static_cast<std::size_t>(std::ceil(position));

    if (lowerIndex == upperIndex) {
        return sortedValues[lowerIndex];
    }

    const double weight = position - static_cast<double>(lowerIndex);
    return sortedValues[lowerIndex] + weight * (sortedValues[upperIndex] - sortedValues[lowerIndex]);
}

}  // namespace

std::uint64_t Registry::Snapshot::counter(const std::string& key) const {
    const auto it = counters.find(key);
    return it == counters.end() ? 0U : it->second.value;
}

std::string Registry::Snapshot::toLogLine() const {
    std::map<std::string, std::string> ordered;
    char buffer[64];
    for (const auto& [key, counter] : counters) {
        std::snprintf(buffer, sizeof(buffer), "%llu", static_cast<unsigned long long>(counter.value));
        ordered.emplace(key, buffer);
    }
    for (const auto& [key, gauge] : gauges) {
        std::snprintf(buffer, sizeof(buffer), "%.2f", gauge.value);
        ordered.emplace(key, buffer);
    }
    for (const auto& [key, stage] : stages) {
        if (stage.p95Ms) {
            std::snprintf(buffer, sizeof(buffer), "n=%llu,p95=%.0fms", static_cast<unsigned long long>(stage.count),
                          *stage.p95Ms);
            ordered.emplace(key, buffer);
        }
    }

    std::string line;
    for (const auto& [key, value] : ordered) {
        if (!line.empty()) {
            line += ' ';
        }
        line += key + '=' + value;
    }
    return line;
}

Registry::Registry() : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(std::string stageKey)
    : impl_(std::make_unique<ScopedTimerImpl>(Registry::instance(), std::move(stageKey))) {}

Registry::ScopedTimer::~ScopedTimer() = default;

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    const auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto& gauge = gauges_[gaugeKey];
    gauge.value = value;
    gauge.updatedAt = now;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.stages.reserve(stages_.size());
    for (const auto& [stageKey, metrics] : stages_) {
        StageSnapshot stageSnapshot;
        stageSnapshot.count = metrics.count;

        auto samples = metrics.samplesMs;
        if (!samples.empty()) {
            std::sort(samples.begin(), samples.end());
            stageSnapshot.p50Ms = computeQuantile(samples, 0.50);
            stageSnapshot.p95Ms = computeQuantile(samples, 0.95);
        }
        snapshot.stages.emplace(stageKey, std::move(stageSnapshot));
    }

    snapshot.counters.reserve(counters_.size());
    for (const auto& [key, value] : counters_) {
        snapshot.counters.emplace(key, CounterSnapshot{value});
    }

    snapshot.gauges.reserve(gauges_.size());
    for (const auto& [key, gauge] : gauges_) {
        snapshot.gauges.emplace(key, GaugeSnapshot{gauge.value, gauge.updatedAt});
    }

    return snapshot;
}

void Registry::StageMetrics::addSample(double latencyMs) {
    ++count;
    if (samplesMs.size() < kMaxSamples) {
        samplesMs.push_back(latencyMs);
        return;
    }
    samplesMs[next] = latencyMs;
    next = (next + 1) % kMaxSamples;
}

void Registry::recordStage(const std::string& stageKey, double latencyMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    stages_[stageKey].addSample(latencyMs);
}

Registry::ScopedTimerImpl::ScopedTimerImpl(Registry& registry, std::string stageKey)
    : registry_(registry), stageKey_(std::move(stageKey)), start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimerImpl::~ScopedTimerImpl() {
    const auto end = std::chrono::steady_clock::now();
    const auto duration = std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(end - start_);
    registry_.recordStage(stageKey_, duration.count());
}

}  // namespace ldg::common::metrics
