#include "clipforge/task_poller.hpp"
#include "clipforge/log.hpp"

#include <utility>

namespace clipforge {

using nlohmann::json;

namespace {

// Value at ptr, or nullptr if the path does not exist in body
const json* lookup(const json& body, const json::json_pointer& ptr) {
    try {
        if (!body.contains(ptr)) return nullptr;
        return &body.at(ptr);
    } catch (const json::exception&) {
        // Path crosses a value of the wrong type
        return nullptr;
    }
}

std::optional<std::string> string_at(const json& body, const json::json_pointer& ptr) {
    const json* value = lookup(body, ptr);
    if (!value || !value->is_string()) return std::nullopt;
    auto s = value->get<std::string>();
    if (s.empty()) return std::nullopt;
    return s;
}

std::string render(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

}  // namespace

// ============================================================================
// StatusDescriptor
// ============================================================================

TaskStatus StatusDescriptor::map_status(const std::string& raw) const {
    auto it = status_table.find(raw);
    return it != status_table.end() ? it->second : TaskStatus::Unknown;
}

static StatusDescriptor signed_base_descriptor() {
    StatusDescriptor d;
    d.family = ServiceFamily::Signed;
    d.status_path = json::json_pointer("/data/status");
    d.status_table = {
        {"in_queue", TaskStatus::Queued},
        {"generating", TaskStatus::Running},
        {"done", TaskStatus::Succeeded},
        {"failed", TaskStatus::Failed},
        {"not_found", TaskStatus::Failed},
        {"expired", TaskStatus::Failed},
    };
    d.diagnostic_paths = {
        json::json_pointer("/code"),
        json::json_pointer("/message"),
        json::json_pointer("/data/resp_data"),
    };
    return d;
}

StatusDescriptor signed_video_descriptor() {
    StatusDescriptor d = signed_base_descriptor();
    d.result_extractor = [](const json& body, const std::string&) {
        return string_at(body, json::json_pointer("/data/video_url"));
    };
    return d;
}

StatusDescriptor signed_identification_descriptor() {
    StatusDescriptor d = signed_base_descriptor();
    d.result_extractor = [](const json& body,
                            const std::string& task_id) -> std::optional<std::string> {
        const json* resp_data = lookup(body, json::json_pointer("/data/resp_data"));
        if (!resp_data) return std::nullopt;

        // resp_data is a JSON document encoded as a string
        json parsed = resp_data->is_string()
            ? json::parse(resp_data->get<std::string>(), nullptr, false)
            : *resp_data;
        if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;

        auto status = parsed.find("status");
        if (status == parsed.end() || !status->is_number_integer() || *status != 1) {
            log_warn("identification task %s finished without a human subject", task_id.c_str());
            return std::nullopt;
        }
        return task_id;
    };
    return d;
}

StatusDescriptor token_video_descriptor() {
    StatusDescriptor d;
    d.family = ServiceFamily::Token;
    d.status_path = json::json_pointer("/status");
    d.status_table = {
        {"queued", TaskStatus::Queued},
        {"pending", TaskStatus::Queued},
        {"running", TaskStatus::Running},
        {"processing", TaskStatus::Running},
        {"succeeded", TaskStatus::Succeeded},
        {"failed", TaskStatus::Failed},
        {"cancelled", TaskStatus::Failed},
    };
    d.result_extractor = [](const json& body, const std::string&) {
        return string_at(body, json::json_pointer("/content/video_url"));
    };
    d.diagnostic_paths = {
        json::json_pointer("/error"),
        json::json_pointer("/failure_reason"),
    };
    d.progress_path = json::json_pointer("/progress");
    return d;
}

// ============================================================================
// Status endpoints
// ============================================================================

SignedStatusEndpoint::SignedStatusEndpoint(const net::RequestSigner& signer,
                                           std::string result_url,
                                           std::string req_key)
    : signer_(signer)
    , result_url_(std::move(result_url))
    , req_key_(std::move(req_key)) {}

net::HttpRequest SignedStatusEndpoint::build_request(const std::string& task_id) const {
    json payload = {{"req_key", req_key_}, {"task_id", task_id}};
    auto request = net::HttpRequest::post(result_url_, payload.dump());
    signer_.sign(request);
    return request;
}

TokenStatusEndpoint::TokenStatusEndpoint(std::string tasks_url, std::string api_key)
    : tasks_url_(std::move(tasks_url))
    , api_key_(std::move(api_key)) {}

net::HttpRequest TokenStatusEndpoint::build_request(const std::string& task_id) const {
    auto request = net::HttpRequest::get(tasks_url_ + "/" + net::url_encode(task_id));
    request.headers.set_bearer_token(api_key_);
    return request;
}

// ============================================================================
// TaskPoller
// ============================================================================

TaskPoller::TaskPoller(net::HttpTransport& transport,
                       const StatusEndpoint& endpoint,
                       StatusDescriptor descriptor,
                       PollOptions options)
    : transport_(transport)
    , endpoint_(endpoint)
    , descriptor_(std::move(descriptor))
    , options_(options) {}

TaskPoller::Attempt TaskPoller::check_once(const std::string& task_id) {
    Attempt attempt;

    auto response = transport_.execute(endpoint_.build_request(task_id));
    if (!response.error.empty() || !response.ok()) {
        attempt.transient = true;
        attempt.error = response.error.empty()
            ? "HTTP " + std::to_string(response.status_code)
            : response.error;
        return attempt;
    }

    attempt.body = json::parse(response.body_string(), nullptr, false);
    if (attempt.body.is_discarded() || !attempt.body.is_object()) {
        attempt.transient = true;
        attempt.error = "status response is not a JSON object";
        return attempt;
    }

    if (auto raw = string_at(attempt.body, descriptor_.status_path)) {
        attempt.raw_status = *raw;
        attempt.status = descriptor_.map_status(*raw);
    }
    return attempt;
}

void TaskPoller::log_diagnostics(const std::string& task_id, const json& body) const {
    bool any = false;
    for (const auto& path : descriptor_.diagnostic_paths) {
        const json* value = lookup(body, path);
        if (!value || value->is_null()) continue;
        log_error("task %s %s: %s", task_id.c_str(), path.to_string().c_str(),
                  render(*value).c_str());
        any = true;
    }
    if (!any) {
        log_error("task %s failed without a reason", task_id.c_str());
    }
}

PollOutcome TaskPoller::poll(const TaskHandle& handle, const CancellationToken& cancel) {
    PollOutcome outcome;

    if (handle.is_resolved()) {
        outcome.success = true;
        outcome.final_status = TaskStatus::Succeeded;
        outcome.result = handle.result();
        return outcome;
    }

    const std::string& task_id = handle.task_id();
    std::string previous_raw;
    bool have_previous = false;

    for (int attempt = 1; attempt <= options_.max_attempts; ++attempt) {
        if (cancel.is_cancelled()) {
            outcome.failure = FailureKind::Cancelled;
            outcome.error_message = "polling cancelled for task " + task_id;
            return outcome;
        }

        outcome.attempts = attempt;

        Attempt result;
        try {
            result = check_once(task_id);
        } catch (const net::SigningError& e) {
            outcome.failure = FailureKind::Signing;
            outcome.error_message = std::string("cannot sign status request: ") + e.what();
            return outcome;
        }

        if (observer_) observer_(result.status, result.transient);

        if (result.transient) {
            ++outcome.transient_errors;
            log_warn("status check %d/%d for task %s failed: %s", attempt,
                     options_.max_attempts, task_id.c_str(), result.error.c_str());
        } else {
            outcome.final_status = result.status;

            // Only status changes are worth an info line
            if (!have_previous || result.raw_status != previous_raw) {
                log_info("task %s status: %s", task_id.c_str(),
                         result.raw_status.empty() ? "<missing>" : result.raw_status.c_str());
            }
            if (descriptor_.progress_path && !is_terminal(result.status)) {
                if (const json* progress = lookup(result.body, *descriptor_.progress_path)) {
                    log_debug("task %s progress: %s%%", task_id.c_str(), render(*progress).c_str());
                }
            }
            previous_raw = result.raw_status;
            have_previous = true;

            if (result.status == TaskStatus::Succeeded) {
                std::optional<std::string> reference;
                if (descriptor_.result_extractor) {
                    reference = descriptor_.result_extractor(result.body, task_id);
                }
                if (!reference) {
                    outcome.failure = FailureKind::TerminalFailure;
                    outcome.error_message = "task " + task_id + " succeeded but returned no result";
                    return outcome;
                }
                outcome.success = true;
                outcome.result = *reference;
                return outcome;
            }

            if (result.status == TaskStatus::Failed) {
                log_diagnostics(task_id, result.body);
                outcome.failure = FailureKind::TerminalFailure;
                outcome.error_message = "task " + task_id + " failed with status " + result.raw_status;
                return outcome;
            }

            if (result.status == TaskStatus::Unknown) {
                log_debug("task %s: unrecognized status '%s', continuing", task_id.c_str(),
                          result.raw_status.c_str());
            }
        }

        // No wait after the last attempt
        if (attempt < options_.max_attempts && cancel.wait_for(options_.interval)) {
            outcome.failure = FailureKind::Cancelled;
            outcome.error_message = "polling cancelled for task " + task_id;
            return outcome;
        }
    }

    outcome.failure = FailureKind::Timeout;
    outcome.error_message = "task " + task_id + " did not finish within " +
                            std::to_string(options_.max_attempts) + " status checks";
    return outcome;
}

} // namespace clipforge
