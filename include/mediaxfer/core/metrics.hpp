#pragma once

#include "mediaxfer/core/constants.hpp"
#include "mediaxfer/transfer/concurrency_governor.hpp"

#include <array>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace mediaxfer {

class TransferEngine;

using MetricDimensions = std::map<std::string, std::string>;

/// Fire-and-forget counter sink. Implementations never throw to callers.
class MetricsSink {
public:
    virtual ~MetricsSink() = default;
    virtual void emit_counter(const std::string& name, double value,
                              const MetricDimensions& dimensions) = 0;
};

/// Bounded outbound queue in front of another sink.
///
/// emit_counter() only enqueues; a background thread forwards samples to
/// the delegate. When the queue is full the sample is dropped and counted.
/// Delegate exceptions are logged and dropped.
class AsyncMetricsSink : public MetricsSink {
public:
    explicit AsyncMetricsSink(MetricsSink& delegate,
                              size_t capacity = constants::DEFAULT_METRICS_QUEUE_CAPACITY);
    ~AsyncMetricsSink() override;

    AsyncMetricsSink(const AsyncMetricsSink&) = delete;
    AsyncMetricsSink& operator=(const AsyncMetricsSink&) = delete;

    void emit_counter(const std::string& name, double value,
                      const MetricDimensions& dimensions) override;

    /// Block until every queued sample has been forwarded.
    void flush();

    uint64_t dropped() const;

private:
    struct Sample {
        std::string name;
        double value = 0;
        MetricDimensions dimensions;
    };

    void drain_loop();

    MetricsSink& delegate_;
    size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    std::deque<Sample> queue_;
    bool forwarding_ = false;
    bool stopping_ = false;
    uint64_t dropped_ = 0;
    std::thread thread_;
};

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        histogram_.Observe(std::chrono::duration<double>(elapsed).count());
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry. Transfer metrics are fixed families;
/// anything sent through emit_counter() gets a counter family registered
/// on first use, with the dimensions as labels. A background writer thread
/// periodically serializes the registry using atomic temp+rename.
class MetricsExporter : public MetricsSink {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to the fixed families.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter() override;

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Set pointers for gauge snapshots (not owned).
    void set_engine(TransferEngine* engine) { engine_ = engine; }
    void set_governor(ConcurrencyGovernor* governor) { governor_ = governor; }

    void start();

    /// Stop the writer thread and write one final snapshot.
    void stop();

    void emit_counter(const std::string& name, double value,
                      const MetricDimensions& dimensions) override;

    void record_transfer(const std::string& operation, bool success, uint64_t bytes);
    void record_retry(const std::string& operation);

    prometheus::Histogram& transfer_duration(const std::string& operation);

    /// Serialize the registry to the textfile now. Returns false on I/O failure.
    bool write_file();

private:
    void writer_loop();
    void update_gauges();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;
    std::map<std::string, std::string> labels_;

    std::shared_ptr<prometheus::Registry> registry_;

    TransferEngine* engine_ = nullptr;
    ConcurrencyGovernor* governor_ = nullptr;
    uint64_t prev_parts_completed_ = 0;

    prometheus::Family<prometheus::Counter>* transfers_family_;
    prometheus::Family<prometheus::Counter>* bytes_family_;
    prometheus::Family<prometheus::Counter>* retries_family_;
    prometheus::Family<prometheus::Histogram>* duration_family_;
    prometheus::Counter* parts_completed_;
    std::array<prometheus::Gauge*, RESOURCE_CLASS_COUNT> governor_in_flight_{};
    std::array<prometheus::Gauge*, RESOURCE_CLASS_COUNT> governor_waiting_{};

    // Families registered through emit_counter(), by name
    std::mutex dynamic_mutex_;
    std::map<std::string, prometheus::Family<prometheus::Counter>*> dynamic_families_;

    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace mediaxfer
