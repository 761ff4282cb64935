#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clipforge::net {

// Both media services only need these two
enum class HttpMethod {
    GET,
    POST
};

const char* to_string(HttpMethod method);

bool is_success_status(int status);

/// Header multimap keyed by lower-cased name. Lookups are case-insensitive;
/// all() yields entries sorted by name, which request signing relies on.
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void remove(const std::string& name);
    void clear() { headers_.clear(); }

    std::optional<std::string> get(const std::string& name) const;
    std::vector<std::string> get_all(const std::string& name) const;
    bool has(const std::string& name) const;
    bool empty() const { return headers_.empty(); }

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_bearer_token(const std::string& token);

    // Parsed Content-Length, nullopt when absent or malformed
    std::optional<uint64_t> content_length() const;

private:
    std::map<std::string, std::vector<std::string>> headers_;
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    static HttpRequest get(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);

    // Body plus Content-Type: application/json
    void set_json_body(const std::string& json);
    std::string body_string() const;
};

struct HttpResponse {
    int status_code = 0;         // 0 when no response arrived
    HttpHeaders headers;
    std::vector<uint8_t> body;   // empty for streamed responses

    // Bytes handed to the chunk callback of a streamed request
    uint64_t bytes_streamed = 0;

    std::chrono::milliseconds total_time{0};

    std::string error;
    bool is_network_error = false;   // no usable HTTP exchange took place

    bool ok() const { return is_success_status(status_code); }
    std::string body_string() const;
};

// Receives one chunk of a streamed response body. Return false to abort the transfer.
using HttpChunkCallback = std::function<bool(const uint8_t* data, size_t size)>;

// Abstract request executor. HttpClient is the libcurl implementation;
// tests substitute scripted transports.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    // Execute a request and buffer the whole response body
    virtual HttpResponse execute(const HttpRequest& request) = 0;

    // Execute a request and hand the 2xx body to on_chunk as it arrives.
    // Error bodies are discarded.
    virtual HttpResponse stream(const HttpRequest& request,
                                const HttpChunkCallback& on_chunk) = 0;
};

// CLIPFORGE_REQUEST_TIMEOUT (seconds, 5..3600) overrides request_timeout.
struct HttpClientConfig {
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds request_timeout{300000};

    // Cap for buffered (execute) bodies; status responses are small
    size_t max_response_size = 4 * 1024 * 1024;

    // Receive buffer for streamed requests; bounds the chunk size handed to callbacks
    size_t stream_buffer_size = 8192;

    bool verify_ssl = true;
    std::string ca_bundle;   // empty = system default

    std::string user_agent = "clipforge/0.1";
    bool verbose = false;    // libcurl wire trace
};

// libcurl-backed transport. One easy handle per request, so a client may be
// shared between threads.
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request) override;
    HttpResponse stream(const HttpRequest& request,
                        const HttpChunkCallback& on_chunk) override;

    const HttpClientConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

// scheme://host[:port][/path][?query]; a fragment is dropped
struct ParsedUrl {
    std::string scheme;
    std::string host;     // IPv6 literals without brackets
    int port = 0;         // 0 = scheme default
    std::string path;
    std::string query;

    // host[:port] as it belongs in a Host header
    std::string authority() const;

    static std::optional<ParsedUrl> parse(const std::string& url);
};

// Percent-encoding over the RFC 3986 unreserved set, upper-case hex
std::string url_encode(const std::string& str);
// Inverse of url_encode; '+' decodes to a space, bad escapes stay literal
std::string url_decode(const std::string& str);

// Standard alphabet. nullopt on characters outside it or data after padding.
std::optional<std::vector<uint8_t>> base64_decode(const std::string& encoded);

} // namespace clipforge::net
