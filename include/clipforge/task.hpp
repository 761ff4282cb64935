#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

namespace clipforge {

// Normalized job status across both service families
enum class TaskStatus {
    Queued,
    Running,
    Succeeded,
    Failed,
    Unknown
};

const char* to_string(TaskStatus status);
bool is_terminal(TaskStatus status);

// Why a job did not produce its artifact
enum class FailureKind {
    None,
    Configuration,
    Signing,
    Submission,
    TransientPoll,
    TerminalFailure,
    Timeout,
    Cancelled,
    Download
};

const char* to_string(FailureKind kind);

// Service family a submitter or poller talks to
enum class ServiceFamily {
    Signed,   // HMAC-SHA256 signed visual service
    Token     // bearer-token task service
};

const char* to_string(ServiceFamily family);

/// Reference to a remote job returned by a submitter. Either still pending
/// under a task id, or already resolved to a result reference (some
/// deployments answer synchronously).
class TaskHandle {
public:
    enum class State { Pending, Resolved };

    static TaskHandle pending(std::string task_id);
    static TaskHandle resolved(std::string result);

    State state() const { return state_; }
    bool is_pending() const { return state_ == State::Pending; }
    bool is_resolved() const { return state_ == State::Resolved; }

    // Empty unless pending
    const std::string& task_id() const { return task_id_; }
    // Empty unless resolved
    const std::string& result() const { return result_; }

private:
    TaskHandle() = default;

    State state_ = State::Pending;
    std::string task_id_;
    std::string result_;
};

struct SubmitResult {
    bool success = false;
    TaskHandle handle = TaskHandle::pending("");
    int http_status = 0;
    FailureKind failure = FailureKind::None;
    std::string error_message;
};

struct PollOutcome {
    bool success = false;
    TaskStatus final_status = TaskStatus::Unknown;
    std::string result;           // video URL or subject id
    int attempts = 0;
    int transient_errors = 0;
    FailureKind failure = FailureKind::None;
    std::string error_message;
};

// Cooperative cancellation for one job. cancel() may be called from any
// thread (the CLI calls it after SIGINT); waiters wake immediately.
class CancellationToken {
public:
    void cancel();
    bool is_cancelled() const;

    // Sleep up to timeout. Returns true if cancelled before or during the wait.
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool cancelled_ = false;
};

} // namespace clipforge
