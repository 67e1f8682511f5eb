#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ldg::common::metrics {

namespace names {
constexpr const char* kUpdatesConfirmed = "ingest.updates_confirmed";
constexpr const char* kEventsConfirmed = "ingest.events_confirmed";
constexpr const char* kPages = "ingest.pages";
constexpr const char* kEmptyPages = "ingest.empty_pages";
constexpr const char* kDuplicates = "ingest.duplicates";
constexpr const char* kVerifyFailures = "ingest.verify_failures";
constexpr const char* kSaturatedMillis = "ingest.saturated_millis";
constexpr const char* kFilesWritten = "writer.files_written";
constexpr const char* kOutstandingJobs = "writer.outstanding_jobs";
constexpr const char* kProgressPct = "session.progress_pct";
constexpr const char* kFetchStage = "stage.fetch";
constexpr const char* kVerifyStage = "stage.verify";
}  // namespace names

class Registry {
private:
    class ScopedTimerImpl;

public:
    struct StageSnapshot {
        std::uint64_t count{0};
        std::optional<double> p50Ms{};
        std::optional<double> p95Ms{};
    };

    struct CounterSnapshot {
        std::uint64_t value{0};
    };

    struct GaugeSnapshot {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, StageSnapshot> stages;
        std::unordered_map<std::string, CounterSnapshot> counters;
        std::unordered_map<std::string, GaugeSnapshot> gauges;

        std::uint64_t counter(const std::string& key) const;
        // "key=value ..." sorted by key, for the final summary line.
        std::string toLogLine() const;
    };

    // Records the lifetime of the object as one sample of stageKey.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string stageKey);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;
        ScopedTimer(ScopedTimer&&) = delete;
        ScopedTimer& operator=(ScopedTimer&&) = delete;

    private:
        std::unique_ptr<ScopedTimerImpl> impl_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);
    Snapshot snapshot() const;

private:
    // Latency samples kept per stage; older samples are dropped past this many.
    static constexpr std::size_t kMaxSamples = 4096;

    struct StageMetrics {
        std::uint64_t count{0};
        std::vector<double> samplesMs;
        std::size_t next{0};

        void addSample(double latencyMs);
    };

    struct GaugeMetrics {
        double value{0.0};
        std::chrono::steady_clock::time_point updatedAt{};
    };

    class ScopedTimerImpl {
    public:
        ScopedTimerImpl(Registry& registry, std::string stageKey);
        ~ScopedTimerImpl();

    private:
        Registry& registry_;
        std::string stageKey_;
        std::chrono::steady_clock::time_point start_;
    };

    Registry();

    void recordStage(const std::string& stageKey, double latencyMs);

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, StageMetrics> stages_;
    std::unordered_map<std::string, std::uint64_t> counters_;
    std::unordered_map<std::string, GaugeMetrics> gauges_;
};

}  // namespace ldg::common::metrics
