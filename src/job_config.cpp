#include "clipforge/job_config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include <utility>

namespace clipforge {

// --- JobKind ---

const char* to_string(JobKind kind) {
    switch (kind) {
        case JobKind::Video: return "video";
        case JobKind::Identify: return "identify";
        case JobKind::Avatar: return "avatar";
    }
    return "video";
}

std::optional<JobKind> parse_job_kind(const std::string& name) {
    if (name == "video") return JobKind::Video;
    if (name == "identify") return JobKind::Identify;
    if (name == "avatar") return JobKind::Avatar;
    return std::nullopt;
}

// --- Key files ---

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// Secrets are stored either plain or base64-encoded. Use the decoded form
// only when it is well-formed base64 of printable text.
std::string decode_secret(const std::string& stored) {
    if (stored.empty() || stored.size() % 4 != 0) return stored;
    auto decoded = net::base64_decode(stored);
    if (!decoded || decoded->empty()) return stored;
    bool printable = std::all_of(decoded->begin(), decoded->end(),
                                 [](uint8_t c) { return std::isprint(c) != 0; });
    if (!printable) return stored;
    return std::string(decoded->begin(), decoded->end());
}

bool is_valid_url(const std::string& url) {
    auto parsed = net::ParsedUrl::parse(url);
    return parsed && (parsed->scheme == "http" || parsed->scheme == "https");
}

// Action and Version are appended as the whole query string
bool is_bare_endpoint(const std::string& url) {
    auto parsed = net::ParsedUrl::parse(url);
    return parsed && parsed->query.empty() && url.find_first_of("?#") == std::string::npos;
}

// Request payloads are serialized as JSON, which must be UTF-8
bool is_valid_utf8(const std::string& text) {
    try {
        (void)nlohmann::json(text).dump();
        return true;
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
}

}  // namespace

net::AccessKeyCredentials load_access_key_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw ConfigurationError("cannot open access key file: " + path.string());
    }

    net::AccessKeyCredentials creds;
    std::string line;
    while (std::getline(ifs, line)) {
        line = trim(line);
        if (line.starts_with("AccessKeyId:")) {
            creds.access_key = trim(line.substr(12));
        } else if (line.starts_with("SecretAccessKey:")) {
            creds.secret_key = decode_secret(trim(line.substr(16)));
        }
    }

    if (creds.empty()) {
        throw ConfigurationError("access key file " + path.string() +
                                 " must contain AccessKeyId: and SecretAccessKey: lines");
    }
    return creds;
}

std::string load_api_key_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw ConfigurationError("cannot open API key file: " + path.string());
    }

    std::string line;
    while (std::getline(ifs, line)) {
        line = trim(line);
        if (!line.empty()) return line;
    }
    throw ConfigurationError("API key file is empty: " + path.string());
}

std::string mask_secret(const std::string& secret) {
    if (secret.empty()) return "(unset)";
    if (secret.size() <= 8) return "****";
    return secret.substr(0, 8) + "****";
}

// --- JobConfig ---

std::optional<JobConfig> JobConfig::from_args(int argc, char* argv[]) {
    JobConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--mode") {
                auto* v = next_arg(i, "--mode");
                if (!v) return std::nullopt;
                auto kind = parse_job_kind(v);
                if (!kind) {
                    std::cerr << "Error: unknown mode: " << v << " (expected video, identify or avatar)\n";
                    return std::nullopt;
                }
                config.mode = *kind;
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--image-url") {
                auto* v = next_arg(i, "--image-url");
                if (!v) return std::nullopt;
                config.image_url = v;
            } else if (arg == "--end-image-url") {
                auto* v = next_arg(i, "--end-image-url");
                if (!v) return std::nullopt;
                config.end_image_url = v;
            } else if (arg == "--audio-url") {
                auto* v = next_arg(i, "--audio-url");
                if (!v) return std::nullopt;
                config.audio_url = v;
            } else if (arg == "--prompt") {
                auto* v = next_arg(i, "--prompt");
                if (!v) return std::nullopt;
                config.prompt = v;
            } else if (arg == "--model") {
                auto* v = next_arg(i, "--model");
                if (!v) return std::nullopt;
                config.model = v;
            } else if (arg == "--resolution") {
                auto* v = next_arg(i, "--resolution");
                if (!v) return std::nullopt;
                config.resolution = v;
            } else if (arg == "--duration") {
                auto* v = next_arg(i, "--duration");
                if (!v) return std::nullopt;
                config.duration = v;
            } else if (arg == "--camera-fixed") {
                config.camera_fixed = true;
            } else if (arg == "--seed") {
                auto* v = next_arg(i, "--seed");
                if (!v) return std::nullopt;
                config.seed = std::stoll(v);
            } else if (arg == "--frame-roles") {
                config.frame_roles = true;
            } else if (arg == "--access-key") {
                auto* v = next_arg(i, "--access-key");
                if (!v) return std::nullopt;
                config.access_keys.access_key = v;
            } else if (arg == "--secret-key") {
                auto* v = next_arg(i, "--secret-key");
                if (!v) return std::nullopt;
                config.access_keys.secret_key = v;
            } else if (arg == "--access-key-file") {
                auto* v = next_arg(i, "--access-key-file");
                if (!v) return std::nullopt;
                config.access_key_file = v;
            } else if (arg == "--api-key") {
                auto* v = next_arg(i, "--api-key");
                if (!v) return std::nullopt;
                config.api_key = v;
            } else if (arg == "--api-key-file") {
                auto* v = next_arg(i, "--api-key-file");
                if (!v) return std::nullopt;
                config.api_key_file = v;
            } else if (arg == "--visual-endpoint") {
                auto* v = next_arg(i, "--visual-endpoint");
                if (!v) return std::nullopt;
                config.visual_endpoint = v;
            } else if (arg == "--region") {
                auto* v = next_arg(i, "--region");
                if (!v) return std::nullopt;
                config.region = v;
            } else if (arg == "--service") {
                auto* v = next_arg(i, "--service");
                if (!v) return std::nullopt;
                config.service = v;
            } else if (arg == "--ark-endpoint") {
                auto* v = next_arg(i, "--ark-endpoint");
                if (!v) return std::nullopt;
                config.ark_endpoint = v;
            } else if (arg == "--max-poll-attempts") {
                auto* v = next_arg(i, "--max-poll-attempts");
                if (!v) return std::nullopt;
                config.max_poll_attempts = std::stoi(v);
            } else if (arg == "--poll-interval") {
                auto* v = next_arg(i, "--poll-interval");
                if (!v) return std::nullopt;
                config.poll_interval_secs = std::stoi(v);
            } else if (arg == "--output-dir") {
                auto* v = next_arg(i, "--output-dir");
                if (!v) return std::nullopt;
                config.output_dir = v;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--connect-timeout") {
                auto* v = next_arg(i, "--connect-timeout");
                if (!v) return std::nullopt;
                config.connect_timeout_secs = std::stoi(v);
            } else if (arg == "--request-timeout") {
                auto* v = next_arg(i, "--request-timeout");
                if (!v) return std::nullopt;
                config.request_timeout_secs = std::stoi(v);
            } else if (arg == "--ca-cert") {
                auto* v = next_arg(i, "--ca-cert");
                if (!v) return std::nullopt;
                config.ca_cert = v;
            } else if (arg == "--no-verify-ssl") {
                config.no_verify_ssl = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cerr <<
                    "Usage: clipforge --mode <video|identify|avatar> --image-url <url> [options]\n"
                    "\n"
                    "Modes:\n"
                    "  video                            Image-to-video on the token task service\n"
                    "  identify                         Subject identification on the signed visual service\n"
                    "  avatar                           Image+audio avatar video on the signed visual service\n"
                    "\n"
                    "Inputs:\n"
                    "  --image-url <url>                First frame / subject image (required)\n"
                    "  --end-image-url <url>            Last frame (video)\n"
                    "  --audio-url <url>                Driving audio (avatar, required)\n"
                    "\n"
                    "Video parameters:\n"
                    "  --prompt <text>                  Text prompt\n"
                    "  --model <id>                     doubao-seedance-1-0-pro-250528 (default) or\n"
                    "                                   doubao-seedance-1-0-lite-i2v-250428\n"
                    "  --resolution <r>                 480p, 720p (default), 1080p\n"
                    "  --duration <d>                   5s (default) or 10s\n"
                    "  --camera-fixed                   Keep the camera fixed\n"
                    "  --seed <N>                       -1 (default, random) to 2147483647\n"
                    "  --frame-roles                    Tag first/last frame with role start/end\n"
                    "\n"
                    "Credentials:\n"
                    "  --access-key <ak>                Access key (or VOLC_ACCESSKEY env)\n"
                    "  --secret-key <sk>                Secret key (or VOLC_SECRETKEY env)\n"
                    "  --access-key-file <path>         File with AccessKeyId:/SecretAccessKey: lines\n"
                    "  --api-key <token>                Bearer token (or ARK_API_KEY env)\n"
                    "  --api-key-file <path>            File holding the bearer token\n"
                    "\n"
                    "Services:\n"
                    "  --visual-endpoint <url>          Signed service (default: https://visual.volcengineapi.com)\n"
                    "  --region <region>                Signing region (default: cn-north-1)\n"
                    "  --service <name>                 Signing service (default: cv)\n"
                    "  --ark-endpoint <url>             Token service (default: https://ark.cn-beijing.volces.com/api/v3)\n"
                    "\n"
                    "Polling and output:\n"
                    "  --max-poll-attempts <N>          Status checks before giving up (default: 60)\n"
                    "  --poll-interval <secs>           Delay between status checks (default: 5)\n"
                    "  --output-dir <path>              Download directory (default: output)\n"
                    "\n"
                    "Runtime:\n"
                    "  --config <path>                  JSON config file\n"
                    "  --verbose                        Verbose output\n"
                    "  --log-file <path>                Log file path\n"
                    "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
                    "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
                    "  --connect-timeout <secs>         HTTP connect timeout (default: 30)\n"
                    "  --request-timeout <secs>         HTTP request timeout (default: 300)\n"
                    "  --ca-cert <path>                 CA certificate bundle\n"
                    "  --no-verify-ssl                  Skip SSL verification\n"
                    "  --help                           Show this help\n";
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }

        config.apply_defaults();
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return std::nullopt;
    } catch (const std::logic_error& e) {
        // std::stoi and friends on a malformed number
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return std::nullopt;
    }

    return config;
}

bool JobConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("mode")) {
            auto name = j["mode"].get<std::string>();
            auto kind = parse_job_kind(name);
            if (!kind) {
                std::cerr << "Error: unknown mode in config: " << name << "\n";
                return false;
            }
            mode = *kind;
        }
        if (j.contains("image_url")) image_url = j["image_url"].get<std::string>();
        if (j.contains("end_image_url")) end_image_url = j["end_image_url"].get<std::string>();
        if (j.contains("audio_url")) audio_url = j["audio_url"].get<std::string>();
        if (j.contains("prompt")) prompt = j["prompt"].get<std::string>();
        if (j.contains("model")) model = j["model"].get<std::string>();
        if (j.contains("resolution")) resolution = j["resolution"].get<std::string>();
        if (j.contains("duration")) duration = j["duration"].get<std::string>();
        if (j.contains("camera_fixed")) camera_fixed = j["camera_fixed"].get<bool>();
        if (j.contains("seed")) seed = j["seed"].get<int64_t>();
        if (j.contains("frame_roles")) frame_roles = j["frame_roles"].get<bool>();

        if (j.contains("access_key")) access_keys.access_key = j["access_key"].get<std::string>();
        if (j.contains("secret_key")) access_keys.secret_key = j["secret_key"].get<std::string>();
        if (j.contains("access_key_file")) access_key_file = j["access_key_file"].get<std::string>();
        if (j.contains("api_key")) api_key = j["api_key"].get<std::string>();
        if (j.contains("api_key_file")) api_key_file = j["api_key_file"].get<std::string>();

        if (j.contains("visual_endpoint")) visual_endpoint = j["visual_endpoint"].get<std::string>();
        if (j.contains("visual_version")) visual_version = j["visual_version"].get<std::string>();
        if (j.contains("submit_action")) submit_action = j["submit_action"].get<std::string>();
        if (j.contains("result_action")) result_action = j["result_action"].get<std::string>();
        if (j.contains("region")) region = j["region"].get<std::string>();
        if (j.contains("service")) service = j["service"].get<std::string>();
        if (j.contains("ark_endpoint")) ark_endpoint = j["ark_endpoint"].get<std::string>();

        if (j.contains("max_poll_attempts")) max_poll_attempts = j["max_poll_attempts"].get<int>();
        if (j.contains("poll_interval_secs")) poll_interval_secs = j["poll_interval_secs"].get<int>();
        if (j.contains("output_dir")) output_dir = j["output_dir"].get<std::string>();

        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval_secs"))
            metrics_interval_secs = j["metrics_interval_secs"].get<size_t>();
        if (j.contains("connect_timeout_secs"))
            connect_timeout_secs = j["connect_timeout_secs"].get<int>();
        if (j.contains("request_timeout_secs"))
            request_timeout_secs = j["request_timeout_secs"].get<int>();
        if (j.contains("ca_cert")) ca_cert = j["ca_cert"].get<std::string>();
        if (j.contains("no_verify_ssl")) no_verify_ssl = j["no_verify_ssl"].get<bool>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void JobConfig::apply_defaults() {
    // Key files fill only what was not given explicitly
    if (!access_key_file.empty() && access_keys.empty()) {
        auto from_file = load_access_key_file(access_key_file);
        if (access_keys.access_key.empty()) access_keys.access_key = from_file.access_key;
        if (access_keys.secret_key.empty()) access_keys.secret_key = from_file.secret_key;
    }
    if (!api_key_file.empty() && api_key.empty()) {
        api_key = load_api_key_file(api_key_file);
    }

    if (access_keys.access_key.empty()) {
        if (const char* v = std::getenv(constants::ENV_ACCESS_KEY)) access_keys.access_key = v;
    }
    if (access_keys.secret_key.empty()) {
        if (const char* v = std::getenv(constants::ENV_SECRET_KEY)) access_keys.secret_key = v;
    }
    if (api_key.empty()) {
        if (const char* v = std::getenv(constants::ENV_API_KEY)) api_key = v;
    }

    // Tolerate a trailing slash on the token endpoint
    while (ark_endpoint.size() > 1 && ark_endpoint.back() == '/') {
        ark_endpoint.pop_back();
    }
}

std::string JobConfig::validate_for(JobKind kind) const {
    const std::pair<const char*, const std::string*> text_fields[] = {
        {"prompt", &prompt},
        {"image_url", &image_url},
        {"end_image_url", &end_image_url},
        {"audio_url", &audio_url},
    };
    for (const auto& [name, value] : text_fields) {
        if (!is_valid_utf8(*value)) return std::string(name) + " is not valid UTF-8";
    }

    if (image_url.empty()) return "image_url is required (--image-url)";
    if (!is_valid_url(image_url)) return "image_url is not an http(s) URL: " + image_url;

    switch (kind) {
        case JobKind::Video: {
            if (!end_image_url.empty() && !is_valid_url(end_image_url))
                return "end_image_url is not an http(s) URL: " + end_image_url;
            if (model != "doubao-seedance-1-0-pro-250528" &&
                model != "doubao-seedance-1-0-lite-i2v-250428")
                return "unsupported model: " + model;
            if (resolution != "480p" && resolution != "720p" && resolution != "1080p")
                return "resolution must be 480p, 720p or 1080p";
            if (duration != "5s" && duration != "10s")
                return "duration must be 5s or 10s";
            if (seed < constants::MIN_SEED || seed > constants::MAX_SEED)
                return "seed must be in [-1, 2147483647]";
            if (!is_valid_url(ark_endpoint)) return "ark_endpoint is not an http(s) URL: " + ark_endpoint;
            break;
        }
        case JobKind::Avatar:
            if (audio_url.empty()) return "audio_url is required for avatar jobs (--audio-url)";
            if (!is_valid_url(audio_url)) return "audio_url is not an http(s) URL: " + audio_url;
            [[fallthrough]];
        case JobKind::Identify:
            if (!is_valid_url(visual_endpoint))
                return "visual_endpoint is not an http(s) URL: " + visual_endpoint;
            if (!is_bare_endpoint(visual_endpoint))
                return "visual_endpoint must not carry a query or fragment: " + visual_endpoint;
            if (visual_version.empty()) return "visual_version is required";
            if (submit_action.empty() || result_action.empty())
                return "submit_action and result_action are required";
            if (region.empty() || service.empty()) return "region and service are required";
            break;
    }

    if (max_poll_attempts <= 0) return "max_poll_attempts must be > 0";
    if (poll_interval_secs < 0) return "poll_interval_secs must be >= 0";
    if (output_dir.empty()) return "output_dir is required";
    if (connect_timeout_secs <= 0 || request_timeout_secs <= 0) return "timeouts must be > 0";
    return {};
}

const net::AccessKeyCredentials& JobConfig::require_access_keys() const {
    if (access_keys.empty()) {
        throw ConfigurationError(
            "access key and secret key are required (--access-key/--secret-key, "
            "--access-key-file, or VOLC_ACCESSKEY/VOLC_SECRETKEY)");
    }
    return access_keys;
}

const std::string& JobConfig::require_api_key() const {
    if (api_key.empty()) {
        throw ConfigurationError("API key is required (--api-key, --api-key-file, or ARK_API_KEY)");
    }
    return api_key;
}

std::string JobConfig::submit_url() const {
    return visual_endpoint + "?Action=" + net::url_encode(submit_action) +
           "&Version=" + net::url_encode(visual_version);
}

std::string JobConfig::result_url() const {
    return visual_endpoint + "?Action=" + net::url_encode(result_action) +
           "&Version=" + net::url_encode(visual_version);
}

std::string JobConfig::tasks_url() const {
    return ark_endpoint + constants::ARK_TASKS_PATH;
}

}  // namespace clipforge
