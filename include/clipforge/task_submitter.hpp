#pragma once

#include "clipforge/net/http.hpp"
#include "clipforge/net/signing.hpp"
#include "clipforge/task.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace clipforge {

// Issues the job-creation request and turns the response into a TaskHandle.
// Failures are reported in the SubmitResult and never retried here;
// net::SigningError propagates before anything is sent.
class TaskSubmitter {
public:
    virtual ~TaskSubmitter() = default;

    virtual ServiceFamily family() const = 0;
    virtual SubmitResult submit(const nlohmann::json& payload) = 0;
};

// Signed visual service: POST {endpoint}?Action=...&Version=... with an
// HMAC-SHA256 Authorization header. The response carries either a task_id
// or, for synchronous deployments, resolved_field (video_url, subject_id),
// at the top level or under "data".
class SignedTaskSubmitter : public TaskSubmitter {
public:
    SignedTaskSubmitter(net::HttpTransport& transport,
                        const net::RequestSigner& signer,
                        std::string submit_url,
                        std::string resolved_field);

    ServiceFamily family() const override { return ServiceFamily::Signed; }
    SubmitResult submit(const nlohmann::json& payload) override;

private:
    net::HttpTransport& transport_;
    const net::RequestSigner& signer_;
    std::string submit_url_;
    std::string resolved_field_;
};

// Bearer-token task service: POST {endpoint}/contents/generations/tasks,
// response {"id": ...}.
class TokenTaskSubmitter : public TaskSubmitter {
public:
    TokenTaskSubmitter(net::HttpTransport& transport,
                       std::string tasks_url,
                       std::string api_key);

    ServiceFamily family() const override { return ServiceFamily::Token; }
    SubmitResult submit(const nlohmann::json& payload) override;

private:
    net::HttpTransport& transport_;
    std::string tasks_url_;
    std::string api_key_;
};

} // namespace clipforge
