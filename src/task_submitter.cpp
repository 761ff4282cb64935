#include "clipforge/task_submitter.hpp"
#include "clipforge/log.hpp"

#include <optional>
#include <utility>

namespace clipforge {

namespace {

// String or numeric identifier as text; nullopt if absent, null or empty
std::optional<std::string> scalar_field(const nlohmann::json& obj, const std::string& name) {
    if (!obj.is_object() || !obj.contains(name)) return std::nullopt;
    const auto& value = obj[name];
    if (value.is_string()) {
        auto s = value.get<std::string>();
        if (s.empty()) return std::nullopt;
        return s;
    }
    // dump() keeps the exact digits of ids beyond the int64 range
    if (value.is_number_integer()) return value.dump();
    return std::nullopt;
}

// Visual responses put payload fields either at the top level or under "data"
std::optional<std::string> find_field(const nlohmann::json& body, const std::string& name) {
    if (auto v = scalar_field(body, name)) return v;
    if (body.is_object() && body.contains("data")) {
        return scalar_field(body["data"], name);
    }
    return std::nullopt;
}

SubmitResult submission_error(int status, std::string message) {
    SubmitResult result;
    result.success = false;
    result.http_status = status;
    result.failure = FailureKind::Submission;
    result.error_message = std::move(message);
    return result;
}

// Short excerpt of an error body for messages
std::string excerpt(const std::string& body) {
    constexpr size_t kMax = 256;
    if (body.size() <= kMax) return body;
    return body.substr(0, kMax) + "...";
}

// Shared response handling for both families. Returns the parsed body, or
// fills `error` and returns nullopt.
std::optional<nlohmann::json> parse_submit_response(const net::HttpResponse& response,
                                                    SubmitResult& error) {
    if (!response.error.empty()) {
        error = submission_error(response.status_code, "submit request failed: " + response.error);
        return std::nullopt;
    }
    if (!response.ok()) {
        error = submission_error(response.status_code,
                                 "submit returned HTTP " + std::to_string(response.status_code) +
                                 ": " + excerpt(response.body_string()));
        return std::nullopt;
    }

    auto body = nlohmann::json::parse(response.body_string(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        error = submission_error(response.status_code,
                                 "submit response is not a JSON object: " +
                                 excerpt(response.body_string()));
        return std::nullopt;
    }
    return body;
}

}  // namespace

// ============================================================================
// SignedTaskSubmitter
// ============================================================================

SignedTaskSubmitter::SignedTaskSubmitter(net::HttpTransport& transport,
                                         const net::RequestSigner& signer,
                                         std::string submit_url,
                                         std::string resolved_field)
    : transport_(transport)
    , signer_(signer)
    , submit_url_(std::move(submit_url))
    , resolved_field_(std::move(resolved_field)) {}

SubmitResult SignedTaskSubmitter::submit(const nlohmann::json& payload) {
    auto request = net::HttpRequest::post(submit_url_, payload.dump());
    signer_.sign(request);

    log_debug("submit (signed) POST %s", submit_url_.c_str());
    auto response = transport_.execute(request);
    log_debug("submit (signed) -> HTTP %d", response.status_code);

    SubmitResult result;
    auto body = parse_submit_response(response, result);
    if (!body) return result;

    result.http_status = response.status_code;

    if (auto task_id = find_field(*body, "task_id")) {
        result.success = true;
        result.handle = TaskHandle::pending(*task_id);
        return result;
    }
    if (!resolved_field_.empty()) {
        if (auto resolved = find_field(*body, resolved_field_)) {
            result.success = true;
            result.handle = TaskHandle::resolved(*resolved);
            return result;
        }
    }

    std::string message = "submit response has neither task_id nor " +
                          (resolved_field_.empty() ? std::string("a result") : resolved_field_);
    if (auto service_message = scalar_field(*body, "message")) {
        message += " (service message: " + *service_message + ")";
    }
    return submission_error(response.status_code, message);
}

// ============================================================================
// TokenTaskSubmitter
// ============================================================================

TokenTaskSubmitter::TokenTaskSubmitter(net::HttpTransport& transport,
                                       std::string tasks_url,
                                       std::string api_key)
    : transport_(transport)
    , tasks_url_(std::move(tasks_url))
    , api_key_(std::move(api_key)) {}

SubmitResult TokenTaskSubmitter::submit(const nlohmann::json& payload) {
    net::HttpRequest request;
    request.method = net::HttpMethod::POST;
    request.url = tasks_url_;
    request.set_json_body(payload.dump());
    request.headers.set_bearer_token(api_key_);

    log_debug("submit (token) POST %s", tasks_url_.c_str());
    auto response = transport_.execute(request);
    log_debug("submit (token) -> HTTP %d", response.status_code);

    SubmitResult result;
    auto body = parse_submit_response(response, result);
    if (!body) return result;

    result.http_status = response.status_code;

    if (auto id = scalar_field(*body, "id")) {
        result.success = true;
        result.handle = TaskHandle::pending(*id);
        return result;
    }

    std::string message = "submit response has no task id";
    if (body->contains("error") && (*body)["error"].is_object()) {
        message += " (error: " + (*body)["error"].dump() + ")";
    }
    return submission_error(response.status_code, message);
}

} // namespace clipforge
