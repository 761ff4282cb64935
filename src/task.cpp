#include "clipforge/task.hpp"

#include <utility>

namespace clipforge {

const char* to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Queued: return "queued";
        case TaskStatus::Running: return "running";
        case TaskStatus::Succeeded: return "succeeded";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Unknown: return "unknown";
    }
    return "unknown";
}

bool is_terminal(TaskStatus status) {
    return status == TaskStatus::Succeeded || status == TaskStatus::Failed;
}

const char* to_string(FailureKind kind) {
    switch (kind) {
        case FailureKind::None: return "none";
        case FailureKind::Configuration: return "configuration";
        case FailureKind::Signing: return "signing";
        case FailureKind::Submission: return "submission";
        case FailureKind::TransientPoll: return "transient_poll";
        case FailureKind::TerminalFailure: return "terminal_failure";
        case FailureKind::Timeout: return "timeout";
        case FailureKind::Cancelled: return "cancelled";
        case FailureKind::Download: return "download";
    }
    return "none";
}

const char* to_string(ServiceFamily family) {
    switch (family) {
        case ServiceFamily::Signed: return "signed";
        case ServiceFamily::Token: return "token";
    }
    return "signed";
}

TaskHandle TaskHandle::pending(std::string task_id) {
    TaskHandle handle;
    handle.state_ = State::Pending;
    handle.task_id_ = std::move(task_id);
    return handle;
}

TaskHandle TaskHandle::resolved(std::string result) {
    TaskHandle handle;
    handle.state_ = State::Resolved;
    handle.result_ = std::move(result);
    return handle;
}

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool CancellationToken::is_cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool CancellationToken::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return cancelled_; });
}

} // namespace clipforge
