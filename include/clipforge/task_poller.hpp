#pragma once

#include "clipforge/net/http.hpp"
#include "clipforge/net/signing.hpp"
#include "clipforge/task.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clipforge {

// Pulls the result reference out of a Succeeded status body. Returns nullopt
// when the body does not carry a usable result.
using ResultExtractor =
    std::function<std::optional<std::string>(const nlohmann::json& body, const std::string& task_id)>;

/// Describes how one service family reports job status: where the status
/// string lives, how its vocabulary maps onto TaskStatus, how to find the
/// result and which fields explain a failure.
struct StatusDescriptor {
    ServiceFamily family = ServiceFamily::Signed;
    nlohmann::json::json_pointer status_path;
    std::map<std::string, TaskStatus> status_table;
    ResultExtractor result_extractor;
    std::vector<nlohmann::json::json_pointer> diagnostic_paths;
    std::optional<nlohmann::json::json_pointer> progress_path;

    // Unrecognized strings map to Unknown
    TaskStatus map_status(const std::string& raw) const;
};

// Signed visual service, video jobs: result at data.video_url
StatusDescriptor signed_video_descriptor();

// Signed visual service, subject identification: succeeds only when the
// JSON string at data.resp_data has status == 1; the task id is the subject id
StatusDescriptor signed_identification_descriptor();

// Token task service: result at content.video_url, progress reported in percent
StatusDescriptor token_video_descriptor();

// Builds the status request for one attempt
class StatusEndpoint {
public:
    virtual ~StatusEndpoint() = default;

    // May throw net::SigningError
    virtual net::HttpRequest build_request(const std::string& task_id) const = 0;
};

// POST {result_url} with {req_key, task_id}, re-signed with a fresh
// timestamp on every attempt
class SignedStatusEndpoint : public StatusEndpoint {
public:
    SignedStatusEndpoint(const net::RequestSigner& signer,
                         std::string result_url,
                         std::string req_key);

    net::HttpRequest build_request(const std::string& task_id) const override;

private:
    const net::RequestSigner& signer_;
    std::string result_url_;
    std::string req_key_;
};

// GET {tasks_url}/{task_id} with a bearer token
class TokenStatusEndpoint : public StatusEndpoint {
public:
    TokenStatusEndpoint(std::string tasks_url, std::string api_key);

    net::HttpRequest build_request(const std::string& task_id) const override;

private:
    std::string tasks_url_;
    std::string api_key_;
};

struct PollOptions {
    int max_attempts = 60;
    std::chrono::milliseconds interval{5000};
};

// Called once per attempt with the mapped status (Unknown with
// transient=true for failed requests)
using PollObserver = std::function<void(TaskStatus status, bool transient)>;

// Drives one pending TaskHandle to a terminal status. Transient request
// failures and unrecognized statuses never end the loop; only Succeeded,
// Failed, budget exhaustion or cancellation do. Never throws for service
// behavior: every outcome is reported in the PollOutcome.
class TaskPoller {
public:
    TaskPoller(net::HttpTransport& transport,
               const StatusEndpoint& endpoint,
               StatusDescriptor descriptor,
               PollOptions options = {});

    void set_observer(PollObserver observer) { observer_ = std::move(observer); }

    PollOutcome poll(const TaskHandle& handle, const CancellationToken& cancel);

private:
    // Result of a single status check
    struct Attempt {
        bool transient = false;
        TaskStatus status = TaskStatus::Unknown;
        std::string raw_status;
        nlohmann::json body;
        std::string error;
    };

    Attempt check_once(const std::string& task_id);
    void log_diagnostics(const std::string& task_id, const nlohmann::json& body) const;

    net::HttpTransport& transport_;
    const StatusEndpoint& endpoint_;
    StatusDescriptor descriptor_;
    PollOptions options_;
    PollObserver observer_;
};

} // namespace clipforge
