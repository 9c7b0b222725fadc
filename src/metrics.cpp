#include "mediaxfer/core/metrics.hpp"
#include "mediaxfer/core/log.hpp"
#include "mediaxfer/transfer/transfer_engine.hpp"

#include <cctype>
#include <fstream>
#include <prometheus/text_serializer.h>

namespace mediaxfer {

// ============================================================================
// AsyncMetricsSink
// ============================================================================

AsyncMetricsSink::AsyncMetricsSink(MetricsSink& delegate, size_t capacity)
    : delegate_(delegate)
    , capacity_(capacity > 0 ? capacity : 1) {
    thread_ = std::thread(&AsyncMetricsSink::drain_loop, this);
}

AsyncMetricsSink::~AsyncMetricsSink() {
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void AsyncMetricsSink::emit_counter(const std::string& name, double value,
                                    const MetricDimensions& dimensions) {
    {
        std::lock_guard lock(mutex_);
        if (queue_.size() >= capacity_) {
            ++dropped_;
            return;
        }
        queue_.push_back({name, value, dimensions});
    }
    cv_.notify_one();
}

void AsyncMetricsSink::flush() {
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] { return queue_.empty() && !forwarding_; });
}

uint64_t AsyncMetricsSink::dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

void AsyncMetricsSink::drain_loop() {
    std::unique_lock lock(mutex_);
    while (true) {
        cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            // stopping_ with nothing left to send
            break;
        }

        Sample sample = std::move(queue_.front());
        queue_.pop_front();
        forwarding_ = true;
        lock.unlock();

        try {
            delegate_.emit_counter(sample.name, sample.value, sample.dimensions);
        } catch (const std::exception& e) {
            log_warn("metric %s dropped: %s", sample.name.c_str(), e.what());
        }

        lock.lock();
        forwarding_ = false;
        if (queue_.empty()) {
            idle_cv_.notify_all();
        }
    }
    idle_cv_.notify_all();
}

// ============================================================================
// MetricsExporter
// ============================================================================

namespace {

// Prometheus names allow [a-zA-Z_:][a-zA-Z0-9_:]*
std::string sanitize_metric_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        bool ok = std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == ':';
        out.push_back(ok ? c : '_');
    }
    if (out.empty() || std::isdigit(static_cast<unsigned char>(out[0]))) {
        out.insert(out.begin(), '_');
    }
    return out;
}

} // namespace

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , labels_(labels)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    transfers_family_ = &prometheus::BuildCounter()
        .Name("mediaxfer_transfers_total")
        .Help("Transfer operations completed, by operation and result")
        .Labels(labels)
        .Register(*registry_);

    bytes_family_ = &prometheus::BuildCounter()
        .Name("mediaxfer_transfer_bytes_total")
        .Help("Bytes moved by successful transfers")
        .Labels(labels)
        .Register(*registry_);

    retries_family_ = &prometheus::BuildCounter()
        .Name("mediaxfer_retries_total")
        .Help("Retry attempts after a failed request")
        .Labels(labels)
        .Register(*registry_);

    parts_completed_ = &prometheus::BuildCounter()
        .Name("mediaxfer_ranged_parts_completed_total")
        .Help("Ranged download parts written")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto& in_flight_family = prometheus::BuildGauge()
        .Name("mediaxfer_governor_in_flight")
        .Help("Operations holding an admission slot")
        .Labels(labels)
        .Register(*registry_);
    auto& waiting_family = prometheus::BuildGauge()
        .Name("mediaxfer_governor_waiting")
        .Help("Operations queued for an admission slot")
        .Labels(labels)
        .Register(*registry_);
    for (size_t i = 0; i < RESOURCE_CLASS_COUNT; ++i) {
        std::string cls = resource_class_name(static_cast<ResourceClass>(i));
        governor_in_flight_[i] = &in_flight_family.Add({{"class", cls}});
        governor_waiting_[i] = &waiting_family.Add({{"class", cls}});
    }

    // --- Histograms ---

    duration_family_ = &prometheus::BuildHistogram()
        .Name("mediaxfer_transfer_duration_seconds")
        .Help("Transfer duration in seconds")
        .Labels(labels)
        .Register(*registry_);
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    update_gauges();
    if (!write_file()) {
        log_warn("failed to write metrics file %s", prom_file_path_.c_str());
    }
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        if (!write_file()) {
            log_debug("metrics write to %s failed", prom_file_path_.c_str());
        }
    }
}

void MetricsExporter::emit_counter(const std::string& name, double value,
                                   const MetricDimensions& dimensions) {
    try {
        std::string metric = sanitize_metric_name(name);
        prometheus::Family<prometheus::Counter>* family = nullptr;
        {
            std::lock_guard lock(dynamic_mutex_);
            auto it = dynamic_families_.find(metric);
            if (it == dynamic_families_.end()) {
                family = &prometheus::BuildCounter()
                    .Name(metric)
                    .Help(name)
                    .Register(*registry_);
                dynamic_families_.emplace(metric, family);
            } else {
                family = it->second;
            }
        }
        if (value > 0) {
            family->Add(dimensions).Increment(value);
        } else {
            // Register the series so a zero count is still exported
            family->Add(dimensions);
        }
    } catch (const std::exception& e) {
        log_warn("failed to record metric %s: %s", name.c_str(), e.what());
    }
}

void MetricsExporter::record_transfer(const std::string& operation, bool success, uint64_t bytes) {
    transfers_family_->Add({{"operation", operation},
                            {"result", success ? "success" : "failure"}}).Increment();
    if (success && bytes > 0) {
        bytes_family_->Add({{"operation", operation}}).Increment(static_cast<double>(bytes));
    }
}

void MetricsExporter::record_retry(const std::string& operation) {
    retries_family_->Add({{"operation", operation}}).Increment();
}

prometheus::Histogram& MetricsExporter::transfer_duration(const std::string& operation) {
    return duration_family_->Add({{"operation", operation}}, prometheus::Histogram::BucketBoundaries{
        0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 900});
}

void MetricsExporter::update_gauges() {
    if (governor_) {
        for (size_t i = 0; i < RESOURCE_CLASS_COUNT; ++i) {
            auto s = governor_->stats(static_cast<ResourceClass>(i));
            governor_in_flight_[i]->Set(static_cast<double>(s.in_flight));
            governor_waiting_[i]->Set(static_cast<double>(s.waiting));
        }
    }

    if (engine_) {
        // Increment by the delta since the last snapshot
        uint64_t parts = engine_->parts_completed();
        if (parts > prev_parts_completed_) {
            parts_completed_->Increment(static_cast<double>(parts - prev_parts_completed_));
            prev_parts_completed_ = parts;
        }
    }
}

bool MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return false;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return false;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
    return !ec;
}

}  // namespace mediaxfer
