#pragma once

#include "clipforge/job_config.hpp"
#include "clipforge/metrics.hpp"
#include "clipforge/net/http.hpp"
#include "clipforge/task.hpp"
#include "clipforge/task_poller.hpp"
#include "clipforge/task_submitter.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace clipforge {

/// Final result of one job: an artifact (downloaded file path, or the
/// subject id for identification jobs) or a failure description.
struct JobOutcome {
    bool success = false;
    JobKind kind = JobKind::Video;
    std::string artifact;
    std::string task_id;         // empty when the submit response was already resolved
    int poll_attempts = 0;
    uint64_t bytes_downloaded = 0;
    FailureKind failure = FailureKind::None;
    std::string error_message;

    // The artifact on success, "<failure kind>: <message>" otherwise
    std::string describe() const;
};

// "{prompt} --resolution R --duration N --camerafixed B[ --seed S]", trimmed
std::string format_video_prompt(const JobConfig& config);

// Request bodies for the three job kinds
nlohmann::json build_video_payload(const JobConfig& config);
nlohmann::json build_identify_payload(const JobConfig& config);
nlohmann::json build_avatar_payload(const JobConfig& config);

// Runs submit -> poll -> download for one job.
//
// ConfigurationError and net::SigningError are thrown before anything is
// sent. Every other failure comes back as a JobOutcome.
class JobRunner {
public:
    /// @param metrics  Optional, may be null.
    JobRunner(const JobConfig& config, net::HttpTransport& transport,
              MetricsExporter* metrics = nullptr);

    JobOutcome run(const CancellationToken& cancel);
    JobOutcome run(JobKind kind, const CancellationToken& cancel);

private:
    JobOutcome run_video(const CancellationToken& cancel);
    JobOutcome run_signed(JobKind kind, const CancellationToken& cancel);

    // Submit, then poll the handle. Returns the result reference, or nullopt
    // with the failure recorded in outcome.
    std::optional<std::string> submit_and_poll(JobOutcome& outcome,
                                               TaskSubmitter& submitter,
                                               const nlohmann::json& payload,
                                               TaskPoller& poller,
                                               const CancellationToken& cancel);

    // Download the polled result to {output_dir}/{prefix}_{task_id}.mp4
    void download_result(JobOutcome& outcome, const std::string& url, const std::string& prefix);

    PollOptions poll_options() const;

    const JobConfig& config_;
    net::HttpTransport& transport_;
    MetricsExporter* metrics_;
};

}  // namespace clipforge
