#include "clipforge/net/http.hpp"
#include "clipforge/log.hpp"

#include <curl/curl.h>

#include <array>
#include <cctype>
#include <cstdlib>
#include <mutex>

namespace clipforge::net {

// ============================================================================
// Helpers
// ============================================================================

const char* to_string(HttpMethod method) {
    return method == HttpMethod::POST ? "POST" : "GET";
}

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

static std::string lower(const std::string& s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::string url_encode(const std::string& str) {
    static const char* kHex = "0123456789ABCDEF";
    std::string out;
    out.reserve(str.size() * 3);
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::string url_decode(const std::string& str) {
    std::string out;
    out.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%' && i + 2 < str.size() &&
                   hex_value(str[i + 1]) >= 0 && hex_value(str[i + 2]) >= 0) {
            out += static_cast<char>((hex_value(str[i + 1]) << 4) | hex_value(str[i + 2]));
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& encoded) {
    static const std::array<int8_t, 256> table = [] {
        std::array<int8_t, 256> t{};
        t.fill(-1);
        const char* alphabet =
            "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        for (int i = 0; i < 64; ++i) t[static_cast<unsigned char>(alphabet[i])] = static_cast<int8_t>(i);
        return t;
    }();

    std::vector<uint8_t> out;
    out.reserve(encoded.size() * 3 / 4);

    uint32_t acc = 0;
    int bits = 0;
    bool padded = false;
    for (char c : encoded) {
        if (c == '\r' || c == '\n') continue;
        if (c == '=') {
            padded = true;
            continue;
        }
        int v = table[static_cast<unsigned char>(c)];
        if (padded || v < 0) return std::nullopt;

        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }
    return out;
}

// ============================================================================
// HttpHeaders
// ============================================================================

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[lower(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[lower(name)].push_back(value);
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(lower(name));
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(lower(name));
    if (it == headers_.end() || it->second.empty()) return std::nullopt;
    return it->second.front();
}

std::vector<std::string> HttpHeaders::get_all(const std::string& name) const {
    auto it = headers_.find(lower(name));
    return it == headers_.end() ? std::vector<std::string>{} : it->second;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.count(lower(name)) > 0;
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> out;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) out.emplace_back(name, value);
    }
    return out;
}

void HttpHeaders::set_bearer_token(const std::string& token) {
    set("Authorization", "Bearer " + token);
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto value = get("Content-Length");
    if (!value || value->empty()) return std::nullopt;
    uint64_t n = 0;
    for (char c : *value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        n = n * 10 + static_cast<uint64_t>(c - '0');
    }
    return n;
}

// ============================================================================
// HttpRequest / HttpResponse
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = url;
    req.body.assign(body.begin(), body.end());
    return req;
}

void HttpRequest::set_json_body(const std::string& json) {
    body.assign(json.begin(), json.end());
    headers.set("Content-Type", "application/json");
}

std::string HttpRequest::body_string() const {
    return std::string(body.begin(), body.end());
}

std::string HttpResponse::body_string() const {
    return std::string(body.begin(), body.end());
}

// ============================================================================
// ParsedUrl
// ============================================================================

std::optional<ParsedUrl> ParsedUrl::parse(const std::string& url) {
    size_t sep = url.find("://");
    if (sep == std::string::npos || sep == 0) return std::nullopt;

    ParsedUrl out;
    out.scheme = lower(url.substr(0, sep));
    for (char c : out.scheme) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') {
            return std::nullopt;
        }
    }

    size_t start = sep + 3;
    size_t end = url.find_first_of("/?#", start);
    std::string authority = url.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (authority.empty() || authority.find('@') != std::string::npos ||
        authority.find(' ') != std::string::npos) {
        return std::nullopt;
    }

    std::string port_text;
    if (authority.front() == '[') {
        size_t close = authority.find(']');
        if (close == std::string::npos) return std::nullopt;
        out.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') return std::nullopt;
            port_text = authority.substr(close + 2);
        }
    } else {
        size_t colon = authority.rfind(':');
        out.host = authority.substr(0, colon);
        if (colon != std::string::npos) port_text = authority.substr(colon + 1);
    }
    if (out.host.empty()) return std::nullopt;

    if (!port_text.empty()) {
        if (port_text.size() > 5) return std::nullopt;
        for (char c : port_text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        }
        out.port = std::stoi(port_text);
        if (out.port == 0 || out.port > 65535) return std::nullopt;
    }

    if (end == std::string::npos) return out;

    std::string rest = url.substr(end);
    rest = rest.substr(0, rest.find('#'));
    size_t q = rest.find('?');
    out.path = rest.substr(0, q);
    if (q != std::string::npos) out.query = rest.substr(q + 1);
    return out;
}

std::string ParsedUrl::authority() const {
    std::string out = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (port != 0) out += ":" + std::to_string(port);
    return out;
}

// ============================================================================
// libcurl callbacks
// ============================================================================

namespace {

struct BufferSink {
    std::vector<uint8_t>* body;
    size_t limit;           // 0 = unlimited
    bool overflow = false;
};

size_t buffer_write(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<BufferSink*>(userdata);
    size_t bytes = size * nmemb;
    if (sink->limit > 0 && sink->body->size() + bytes > sink->limit) {
        sink->overflow = true;
        return 0;   // aborts the transfer
    }
    sink->body->insert(sink->body->end(), ptr, ptr + bytes);
    return bytes;
}

struct ChunkSink {
    const HttpChunkCallback* on_chunk;
    CURL* curl;
    uint64_t bytes = 0;
    bool aborted = false;
};

size_t chunk_write(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* sink = static_cast<ChunkSink*>(userdata);
    size_t bytes = size * nmemb;

    long status = 0;
    curl_easy_getinfo(sink->curl, CURLINFO_RESPONSE_CODE, &status);
    if (!is_success_status(static_cast<int>(status))) {
        return bytes;
    }

    if (!(*sink->on_chunk)(reinterpret_cast<const uint8_t*>(ptr), bytes)) {
        sink->aborted = true;
        return 0;
    }
    sink->bytes += bytes;
    return bytes;
}

size_t header_write(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) line.pop_back();
    if (line.empty()) return bytes;

    // Each status line (one per redirect hop) starts a fresh header set
    if (line.starts_with("HTTP/")) {
        headers->clear();
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon == std::string::npos) return bytes;
    size_t value_start = line.find_first_not_of(" \t", colon + 1);
    headers->add(line.substr(0, colon),
                 value_start == std::string::npos ? std::string() : line.substr(value_start));
    return bytes;
}

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};
using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using CurlSlist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

std::optional<std::chrono::milliseconds> env_request_timeout() {
    const char* env = std::getenv("CLIPFORGE_REQUEST_TIMEOUT");
    if (!env) return std::nullopt;
    char* end = nullptr;
    long secs = std::strtol(env, &end, 10);
    if (end == env || *end != '\0' || secs < 5 || secs > 3600) {
        log_warn("ignoring CLIPFORGE_REQUEST_TIMEOUT=%s (expected 5..3600 seconds)", env);
        return std::nullopt;
    }
    return std::chrono::seconds(secs);
}

}  // namespace

// ============================================================================
// HttpClient
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() { curl_global_init(CURL_GLOBAL_ALL); });

        if (auto timeout = env_request_timeout()) {
            config_.request_timeout = *timeout;
        }
        if (!config_.verify_ssl) {
            log_warn("TLS certificate verification is disabled");
        }
    }

    const HttpClientConfig& config() const { return config_; }

    HttpResponse execute(const HttpRequest& request) {
        std::vector<uint8_t> body;
        BufferSink sink{&body, config_.max_response_size};
        auto response = perform(request, buffer_write, &sink);

        if (sink.overflow) {
            response.error = "response body larger than " +
                             std::to_string(config_.max_response_size) + " bytes";
            response.is_network_error = false;
        } else if (response.error.empty()) {
            response.body = std::move(body);
        }
        return response;
    }

    HttpResponse stream(const HttpRequest& request, const HttpChunkCallback& on_chunk) {
        ChunkSink sink{&on_chunk, nullptr};
        auto response = perform(request, chunk_write, &sink, &sink.curl);
        response.bytes_streamed = sink.bytes;
        if (sink.aborted) {
            response.error = "Transfer aborted by receiver";
            response.is_network_error = false;
        }
        return response;
    }

private:
    using WriteFn = size_t (*)(char*, size_t, size_t, void*);

    // Runs one transfer on a fresh easy handle. curl_out, when given, receives
    // the handle before the transfer starts so the write sink can query it.
    HttpResponse perform(const HttpRequest& request, WriteFn write_fn, void* write_data,
                         CURL** curl_out = nullptr) {
        HttpResponse response;

        CurlHandle curl(curl_easy_init());
        if (!curl) {
            response.error = "curl_easy_init failed";
            response.is_network_error = true;
            return response;
        }
        if (curl_out) *curl_out = curl.get();
        CURL* h = curl.get();

        curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
        if (request.method == HttpMethod::POST) {
            curl_easy_setopt(h, CURLOPT_POST, 1L);
            // POSTFIELDS is not copied; request outlives the transfer
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(request.body.size()));
        } else {
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
        }

        // Signed requests must go out with exactly the headers that were signed
        curl_slist* raw_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            raw_list = curl_slist_append(raw_list, (name + ": " + value).c_str());
        }
        raw_list = curl_slist_append(raw_list, "Expect:");
        CurlSlist header_list(raw_list);
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());

        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_fn);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, write_data);
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_write);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &response.headers);
        if (config_.stream_buffer_size > 0) {
            curl_easy_setopt(h, CURLOPT_BUFFERSIZE, static_cast<long>(config_.stream_buffer_size));
        }

        curl_easy_setopt(h, CURLOPT_USERAGENT, config_.user_agent.c_str());
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config_.connect_timeout.count()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(config_.request_timeout.count()));

        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, config_.verify_ssl ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, config_.verify_ssl ? 2L : 0L);
        if (!config_.ca_bundle.empty()) {
            curl_easy_setopt(h, CURLOPT_CAINFO, config_.ca_bundle.c_str());
        }

        // Artifact URLs are commonly pre-signed redirects
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(h, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        if (config_.verbose) {
            curl_easy_setopt(h, CURLOPT_VERBOSE, 1L);
        }

        auto start = std::chrono::steady_clock::now();
        CURLcode rc = curl_easy_perform(h);
        response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);

        long status = 0;
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
        response.status_code = static_cast<int>(status);

        if (rc != CURLE_OK) {
            response.error = curl_easy_strerror(rc);
            response.is_network_error = response.status_code == 0;
        }
        return response;
    }

    HttpClientConfig config_;
};

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return impl_->execute(request);
}

HttpResponse HttpClient::stream(const HttpRequest& request, const HttpChunkCallback& on_chunk) {
    return impl_->stream(request, on_chunk);
}

const HttpClientConfig& HttpClient::config() const {
    return impl_->config();
}

}  // namespace clipforge::net
