#include "clipforge/job_runner.hpp"
#include "clipforge/artifact_downloader.hpp"
#include "clipforge/log.hpp"

#include <cctype>
#include <optional>

namespace clipforge {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Task ids end up in file names
std::string file_safe(const std::string& id) {
    std::string out = id;
    for (auto& c : out) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '-' && c != '_' && c != '.') c = '_';
    }
    return out;
}

// Keeps jobs_in_flight accurate on every exit path, exceptions included
class InFlightGuard {
public:
    explicit InFlightGuard(MetricsExporter* metrics) : metrics_(metrics) {
        if (metrics_) metrics_->jobs_in_flight().Increment();
    }
    ~InFlightGuard() {
        if (metrics_) metrics_->jobs_in_flight().Decrement();
    }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    MetricsExporter* metrics_;
};

}  // namespace

std::string JobOutcome::describe() const {
    if (success) return artifact;
    return std::string(to_string(failure)) + ": " + error_message;
}

// ============================================================================
// Payloads
// ============================================================================

std::string format_video_prompt(const JobConfig& config) {
    // "5s" -> "5"
    std::string seconds = config.duration;
    if (!seconds.empty() && seconds.back() == 's') seconds.pop_back();

    std::string text = config.prompt;
    text += " --resolution " + config.resolution;
    text += " --duration " + seconds;
    text += " --camerafixed ";
    text += config.camera_fixed ? "true" : "false";
    if (config.seed >= 0) {
        text += " --seed " + std::to_string(config.seed);
    }
    return trim(text);
}

nlohmann::json build_video_payload(const JobConfig& config) {
    nlohmann::json content = nlohmann::json::array();
    content.push_back({{"type", "text"}, {"text", format_video_prompt(config)}});

    nlohmann::json first = {{"type", "image_url"}, {"image_url", {{"url", config.image_url}}}};
    if (config.frame_roles) first["role"] = "start";
    content.push_back(first);

    if (!config.end_image_url.empty()) {
        nlohmann::json last = {{"type", "image_url"}, {"image_url", {{"url", config.end_image_url}}}};
        if (config.frame_roles) last["role"] = "end";
        content.push_back(last);
    }

    return {{"model", config.model}, {"content", content}};
}

nlohmann::json build_identify_payload(const JobConfig& config) {
    return {{"req_key", constants::REQ_KEY_IDENTIFY}, {"image_url", config.image_url}};
}

nlohmann::json build_avatar_payload(const JobConfig& config) {
    return {{"req_key", constants::REQ_KEY_AVATAR},
            {"image_url", config.image_url},
            {"audio_url", config.audio_url}};
}

// ============================================================================
// JobRunner
// ============================================================================

JobRunner::JobRunner(const JobConfig& config, net::HttpTransport& transport,
                     MetricsExporter* metrics)
    : config_(config)
    , transport_(transport)
    , metrics_(metrics) {}

PollOptions JobRunner::poll_options() const {
    PollOptions options;
    options.max_attempts = config_.max_poll_attempts;
    options.interval = std::chrono::seconds(config_.poll_interval_secs);
    return options;
}

JobOutcome JobRunner::run(const CancellationToken& cancel) {
    return run(config_.mode, cancel);
}

JobOutcome JobRunner::run(JobKind kind, const CancellationToken& cancel) {
    InFlightGuard in_flight(metrics_);
    HistogramTimer timer(metrics_ ? &metrics_->job_duration() : nullptr);

    JobOutcome outcome;
    try {
        auto error = config_.validate_for(kind);
        if (!error.empty()) {
            throw ConfigurationError(error);
        }
        outcome = kind == JobKind::Video ? run_video(cancel) : run_signed(kind, cancel);
    } catch (const ConfigurationError&) {
        if (metrics_) metrics_->record_job(FailureKind::Configuration);
        throw;
    } catch (const net::SigningError&) {
        if (metrics_) metrics_->record_job(FailureKind::Signing);
        throw;
    }

    if (metrics_) metrics_->record_job(outcome.success ? FailureKind::None : outcome.failure);
    if (outcome.success) {
        log_info("%s job finished: %s", to_string(kind), outcome.artifact.c_str());
    } else {
        log_error("%s job failed (%s): %s", to_string(kind), to_string(outcome.failure),
                  outcome.error_message.c_str());
    }
    return outcome;
}

std::optional<std::string> JobRunner::submit_and_poll(JobOutcome& outcome,
                                                      TaskSubmitter& submitter,
                                                      const nlohmann::json& payload,
                                                      TaskPoller& poller,
                                                      const CancellationToken& cancel) {
    if (cancel.is_cancelled()) {
        outcome.failure = FailureKind::Cancelled;
        outcome.error_message = "cancelled before submission";
        return std::nullopt;
    }

    auto submitted = submitter.submit(payload);
    if (metrics_) metrics_->record_submission(submitter.family(), submitted.success);
    if (!submitted.success) {
        outcome.failure = submitted.failure;
        outcome.error_message = submitted.error_message;
        return std::nullopt;
    }

    if (submitted.handle.is_pending()) {
        outcome.task_id = submitted.handle.task_id();
        log_info("%s task created: %s", to_string(outcome.kind), outcome.task_id.c_str());
    } else {
        log_info("%s task resolved synchronously", to_string(outcome.kind));
    }

    if (metrics_) {
        poller.set_observer([this](TaskStatus status, bool transient) {
            metrics_->record_poll(status, transient);
        });
    }

    auto polled = poller.poll(submitted.handle, cancel);
    outcome.poll_attempts = polled.attempts;
    if (!polled.success) {
        outcome.failure = polled.failure;
        outcome.error_message = polled.error_message;
        return std::nullopt;
    }
    return polled.result;
}

void JobRunner::download_result(JobOutcome& outcome, const std::string& url,
                                const std::string& prefix) {
    std::string id = outcome.task_id.empty() ? "sync" : file_safe(outcome.task_id);
    auto destination = config_.output_dir / (prefix + "_" + id + ".mp4");

    ArtifactDownloader downloader(transport_);
    auto result = downloader.download(url, destination);
    if (metrics_) metrics_->record_download(result.success, result.bytes_written, result.elapsed);

    outcome.bytes_downloaded = result.bytes_written;
    if (!result.success) {
        outcome.failure = FailureKind::Download;
        outcome.error_message = result.error_message;
        return;
    }
    outcome.success = true;
    outcome.artifact = result.path.string();
}

JobOutcome JobRunner::run_video(const CancellationToken& cancel) {
    JobOutcome outcome;
    outcome.kind = JobKind::Video;

    const std::string& api_key = config_.require_api_key();
    const std::string tasks_url = config_.tasks_url();

    TokenTaskSubmitter submitter(transport_, tasks_url, api_key);
    TokenStatusEndpoint endpoint(tasks_url, api_key);
    TaskPoller poller(transport_, endpoint, token_video_descriptor(), poll_options());

    log_info("submitting video job: model=%s resolution=%s duration=%s", config_.model.c_str(),
             config_.resolution.c_str(), config_.duration.c_str());
    auto video_url = submit_and_poll(outcome, submitter, build_video_payload(config_), poller, cancel);
    if (!video_url) return outcome;

    download_result(outcome, *video_url, "video");
    return outcome;
}

JobOutcome JobRunner::run_signed(JobKind kind, const CancellationToken& cancel) {
    JobOutcome outcome;
    outcome.kind = kind;

    const bool identify = kind == JobKind::Identify;

    net::RequestSigner signer(config_.require_access_keys(), config_.region, config_.service);
    SignedTaskSubmitter submitter(transport_, signer, config_.submit_url(),
                                  identify ? "subject_id" : "video_url");
    SignedStatusEndpoint endpoint(signer, config_.result_url(),
                                  identify ? constants::REQ_KEY_IDENTIFY : constants::REQ_KEY_AVATAR);
    TaskPoller poller(transport_, endpoint,
                      identify ? signed_identification_descriptor() : signed_video_descriptor(),
                      poll_options());

    log_info("submitting %s job", to_string(kind));
    auto payload = identify ? build_identify_payload(config_) : build_avatar_payload(config_);
    auto result = submit_and_poll(outcome, submitter, payload, poller, cancel);
    if (!result) return outcome;

    if (identify) {
        outcome.success = true;
        outcome.artifact = *result;
        return outcome;
    }

    download_result(outcome, *result, "avatar");
    return outcome;
}

}  // namespace clipforge
