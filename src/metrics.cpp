#include "clipforge/metrics.hpp"
#include "clipforge/log.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>
#include <system_error>

namespace clipforge {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& const_labels)
    : prom_path_(prom_path)
    , write_interval_(write_interval)
    , const_labels_(const_labels)
    , registry_(std::make_shared<prometheus::Registry>()) {

    submissions_ = &counter_family("clipforge_submissions_total",
                                   "Job submissions by service family and result");
    polls_ = &counter_family("clipforge_polls_total", "Status checks by observed status");
    jobs_ = &counter_family("clipforge_jobs_total", "Finished jobs by outcome");
    downloads_ = &counter_family("clipforge_downloads_total", "Artifact downloads by result");
    download_bytes_ = &counter_family("clipforge_download_bytes_total",
                                      "Artifact bytes written to disk").Add({});

    jobs_in_flight_ = &prometheus::BuildGauge()
        .Name("clipforge_jobs_in_flight")
        .Help("Jobs between submission and final outcome")
        .Labels(const_labels_)
        .Register(*registry_)
        .Add({});

    // Generation jobs take minutes; downloads seconds
    job_duration_ = &seconds_histogram("clipforge_job_duration_seconds",
                                       "End-to-end job duration",
                                       {1, 5, 10, 30, 60, 120, 300, 600, 1200});
    download_duration_ = &seconds_histogram("clipforge_download_duration_seconds",
                                            "Artifact download duration",
                                            {0.1, 0.5, 1, 2.5, 5, 10, 30, 60, 120});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

prometheus::Family<prometheus::Counter>& MetricsExporter::counter_family(
    const std::string& name, const std::string& help) {
    return prometheus::BuildCounter()
        .Name(name)
        .Help(help)
        .Labels(const_labels_)
        .Register(*registry_);
}

prometheus::Histogram& MetricsExporter::seconds_histogram(
    const std::string& name, const std::string& help,
    prometheus::Histogram::BucketBoundaries buckets) {
    return prometheus::BuildHistogram()
        .Name(name)
        .Help(help)
        .Labels(const_labels_)
        .Register(*registry_)
        .Add({}, std::move(buckets));
}

void MetricsExporter::start() {
    std::lock_guard lock(state_mutex_);
    if (started_) return;
    started_ = true;
    stopping_ = false;
    writer_ = std::thread(&MetricsExporter::run_writer, this);
}

void MetricsExporter::stop() {
    {
        std::lock_guard lock(state_mutex_);
        stopping_ = true;
        started_ = false;
    }
    wake_.notify_all();
    if (writer_.joinable()) writer_.join();

    // Final snapshot, also when the writer never ran
    flush();
}

void MetricsExporter::record_submission(ServiceFamily family, bool success) {
    submissions_->Add({{"family", to_string(family)},
                       {"result", success ? "success" : "failure"}}).Increment();
}

void MetricsExporter::record_poll(TaskStatus status, bool transient) {
    polls_->Add({{"result", transient ? "error" : to_string(status)}}).Increment();
}

void MetricsExporter::record_job(FailureKind failure) {
    jobs_->Add({{"outcome", failure == FailureKind::None ? "success" : to_string(failure)}})
        .Increment();
}

void MetricsExporter::record_download(bool success, uint64_t bytes,
                                      std::chrono::milliseconds elapsed) {
    downloads_->Add({{"result", success ? "success" : "failure"}}).Increment();
    download_bytes_->Increment(static_cast<double>(bytes));
    download_duration_->Observe(std::chrono::duration<double>(elapsed).count());
}

void MetricsExporter::run_writer() {
    std::unique_lock lock(state_mutex_);
    while (!wake_.wait_for(lock, write_interval_, [this] { return stopping_; })) {
        lock.unlock();
        flush();
        lock.lock();
    }
}

void MetricsExporter::flush() {
    std::lock_guard lock(flush_mutex_);

    std::filesystem::path tmp = prom_path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        out << prometheus::TextSerializer().Serialize(registry_->Collect());
        if (!out.flush()) {
            log_warn("cannot write metrics to %s", tmp.c_str());
            return;
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, prom_path_, ec);
    if (ec) {
        log_warn("cannot move metrics into place at %s: %s", prom_path_.c_str(),
                 ec.message().c_str());
    }
}

}  // namespace clipforge
