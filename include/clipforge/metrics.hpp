#pragma once

#include "clipforge/task.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
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

namespace clipforge {

// Observes the time between construction and destruction, in seconds.
// A null histogram makes it a no-op, so callers need not check for metrics.
class HistogramTimer {
public:
    explicit HistogramTimer(prometheus::Histogram* histogram)
        : histogram_(histogram)
        , started_(std::chrono::steady_clock::now()) {}

    ~HistogramTimer() {
        if (!histogram_) return;
        histogram_->Observe(
            std::chrono::duration<double>(std::chrono::steady_clock::now() - started_).count());
    }

    HistogramTimer(const HistogramTimer&) = delete;
    HistogramTimer& operator=(const HistogramTimer&) = delete;

private:
    prometheus::Histogram* histogram_;
    std::chrono::steady_clock::time_point started_;
};

/// Job metrics in node_exporter textfile-collector format.
///
/// Every metric carries the constant labels given at construction (the CLI
/// passes the job mode). The .prom file is rewritten every write_interval
/// while running and once more on stop(); each write goes through a temp
/// file and a rename so the collector never sees a partial file.
class MetricsExporter {
public:
    MetricsExporter(const std::filesystem::path& prom_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& const_labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    void start();
    void stop();

    void record_submission(ServiceFamily family, bool success);
    // transient = the status check itself failed
    void record_poll(TaskStatus status, bool transient);
    // FailureKind::None counts as success
    void record_job(FailureKind failure);
    void record_download(bool success, uint64_t bytes, std::chrono::milliseconds elapsed);

    prometheus::Gauge& jobs_in_flight() { return *jobs_in_flight_; }
    prometheus::Histogram& job_duration() { return *job_duration_; }

private:
    prometheus::Family<prometheus::Counter>& counter_family(const std::string& name,
                                                            const std::string& help);
    prometheus::Histogram& seconds_histogram(const std::string& name, const std::string& help,
                                             prometheus::Histogram::BucketBoundaries buckets);

    void run_writer();
    void flush();

    const std::filesystem::path prom_path_;
    const std::chrono::seconds write_interval_;
    const std::map<std::string, std::string> const_labels_;
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* submissions_;
    prometheus::Family<prometheus::Counter>* polls_;
    prometheus::Family<prometheus::Counter>* jobs_;
    prometheus::Family<prometheus::Counter>* downloads_;
    prometheus::Counter* download_bytes_;
    prometheus::Gauge* jobs_in_flight_;
    prometheus::Histogram* job_duration_;
    prometheus::Histogram* download_duration_;

    std::thread writer_;
    std::mutex state_mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    bool started_ = false;

    std::mutex flush_mutex_;
};

}  // namespace clipforge
