#pragma once

#include "clipforge/constants.hpp"
#include "clipforge/net/signing.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace clipforge {

// Missing or malformed configuration (credentials included). Fatal, never retried.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class JobKind {
    Video,      // token service image-to-video
    Identify,   // signed service subject identification
    Avatar      // signed service image+audio avatar video
};

const char* to_string(JobKind kind);
std::optional<JobKind> parse_job_kind(const std::string& name);

/// Configuration for one clipforge run.
/// Built once at startup and passed by reference; nothing reads globals.
struct JobConfig {
    JobKind mode = JobKind::Video;

    // Inputs (already publicly reachable URLs)
    std::string image_url;
    std::string end_image_url;   // video: optional last frame
    std::string audio_url;       // avatar: required

    // Video generation parameters
    std::string prompt;
    std::string model = constants::DEFAULT_VIDEO_MODEL;
    std::string resolution = "720p";
    std::string duration = "5s";
    bool camera_fixed = false;
    int64_t seed = -1;           // -1 = service picks
    bool frame_roles = false;    // tag first/last frame items with role start/end

    // Credentials
    net::AccessKeyCredentials access_keys;
    std::string api_key;
    std::filesystem::path access_key_file;
    std::filesystem::path api_key_file;

    // Signed visual service
    std::string visual_endpoint = constants::DEFAULT_VISUAL_ENDPOINT;
    std::string visual_version = constants::DEFAULT_VISUAL_VERSION;
    std::string submit_action = constants::DEFAULT_SUBMIT_ACTION;
    std::string result_action = constants::DEFAULT_RESULT_ACTION;
    std::string region = constants::DEFAULT_SIGNING_REGION;
    std::string service = constants::DEFAULT_SIGNING_SERVICE;

    // Token task service
    std::string ark_endpoint = constants::DEFAULT_ARK_ENDPOINT;

    // Polling
    int max_poll_attempts = constants::DEFAULT_MAX_POLL_ATTEMPTS;
    int poll_interval_secs = constants::DEFAULT_POLL_INTERVAL_SECONDS;

    // Output
    std::filesystem::path output_dir = "output";

    // Runtime
    bool verbose = false;
    std::filesystem::path log_file;
    std::filesystem::path metrics_file;    // Prometheus textfile collector output
    size_t metrics_interval_secs = 15;

    // HTTP
    int connect_timeout_secs = constants::DEFAULT_CONNECT_TIMEOUT_SECONDS;
    int request_timeout_secs = constants::DEFAULT_REQUEST_TIMEOUT_SECONDS;
    std::string ca_cert;
    bool no_verify_ssl = false;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error or --help (prints usage to stderr).
    static std::optional<JobConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in credentials from key files, then from the environment.
    /// Throws ConfigurationError if a named key file cannot be read.
    void apply_defaults();

    /// Validate required fields and parameter ranges. Returns error message or empty string.
    std::string validate() const { return validate_for(mode); }
    std::string validate_for(JobKind kind) const;

    // Credential accessors for the two service families.
    // Throw ConfigurationError when the credentials are missing.
    const net::AccessKeyCredentials& require_access_keys() const;
    const std::string& require_api_key() const;

    // Endpoint URLs
    std::string submit_url() const;   // {visual}?Action={submit}&Version={v}
    std::string result_url() const;   // {visual}?Action={result}&Version={v}
    std::string tasks_url() const;    // {ark}/contents/generations/tasks
};

/// Parse an access key file: "AccessKeyId: ..." and "SecretAccessKey: ..."
/// lines. The secret may be base64-encoded. Throws ConfigurationError.
net::AccessKeyCredentials load_access_key_file(const std::filesystem::path& path);

/// First non-empty line of the file, trimmed. Throws ConfigurationError.
std::string load_api_key_file(const std::filesystem::path& path);

// Keep a short prefix for logs: "AKLTexam****"
std::string mask_secret(const std::string& secret);

}  // namespace clipforge
