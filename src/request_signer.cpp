#include "clipforge/net/signing.hpp"

#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace clipforge::net {

namespace {

constexpr const char* kAlgorithm = "HMAC-SHA256";
constexpr const char* kScopeTerminator = "request";

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

}  // namespace

std::string SigningScope::to_string() const {
    return date + "/" + region + "/" + service + "/" + kScopeTerminator;
}

std::string hex_encode(const std::vector<uint8_t>& bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (const auto b : bytes) {
        oss << std::setw(2) << static_cast<int>(b);
    }
    return oss.str();
}

std::string sha256_hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);
    return hex_encode(std::vector<uint8_t>(hash, hash + SHA256_DIGEST_LENGTH));
}

std::string sha256_hex(const std::vector<uint8_t>& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(data.data(), data.size(), hash);
    return hex_encode(std::vector<uint8_t>(hash, hash + SHA256_DIGEST_LENGTH));
}

std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& data) {
    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;

    if (!HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
              reinterpret_cast<const unsigned char*>(data.data()), data.size(),
              hash, &hash_len)) {
        throw SigningError("HMAC-SHA256 computation failed");
    }

    return std::vector<uint8_t>(hash, hash + hash_len);
}

std::string canonical_query_string(const std::string& query) {
    if (query.empty()) {
        return "";
    }

    // Decode then re-encode so "a%20b" and "a+b" land on the same form
    std::vector<std::pair<std::string, std::string>> params;
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();

        std::string param = query.substr(pos, amp - pos);
        if (!param.empty()) {
            size_t eq = param.find('=');
            if (eq != std::string::npos) {
                params.emplace_back(url_encode(url_decode(param.substr(0, eq))),
                                    url_encode(url_decode(param.substr(eq + 1))));
            } else {
                // Bare key: empty value
                params.emplace_back(url_encode(url_decode(param)), "");
            }
        }
        pos = amp + 1;
    }

    // Duplicate keys sort by value
    std::sort(params.begin(), params.end());

    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) oss << "&";
        oss << key << "=" << value;
        first = false;
    }
    return oss.str();
}

CanonicalRequest build_canonical_request(const HttpRequest& request) {
    auto url = ParsedUrl::parse(request.url);
    if (!url) {
        throw SigningError("cannot parse request URL: " + request.url);
    }

    CanonicalRequest result;
    std::ostringstream oss;

    // Method
    oss << to_string(request.method) << "\n";

    // Canonical URI
    oss << (url->path.empty() ? "/" : url->path) << "\n";

    // Canonical query string
    oss << canonical_query_string(url->query) << "\n";

    // Canonical headers: all() is already sorted by lower-cased name.
    // Repeated headers are folded into one comma-separated value.
    std::string current_name;
    std::string current_value;
    bool have_header = false;
    auto flush = [&]() {
        if (!have_header) return;
        oss << current_name << ":" << current_value << "\n";
        if (!result.signed_headers.empty()) result.signed_headers += ";";
        result.signed_headers += current_name;
    };
    for (const auto& [name, value] : request.headers.all()) {
        if (have_header && name == current_name) {
            current_value += "," + trim(value);
            continue;
        }
        flush();
        current_name = name;
        current_value = trim(value);
        have_header = true;
    }
    flush();
    oss << "\n";

    // Signed headers
    oss << result.signed_headers << "\n";

    // Payload hash
    oss << sha256_hex(request.body);

    result.text = oss.str();
    return result;
}

std::vector<uint8_t> derive_signing_key(const std::string& secret_key,
                                        const SigningScope& scope) {
    auto k_date = hmac_sha256(std::vector<uint8_t>(secret_key.begin(), secret_key.end()),
                              scope.date);
    auto k_region = hmac_sha256(k_date, scope.region);
    auto k_service = hmac_sha256(k_region, scope.service);
    return hmac_sha256(k_service, kScopeTerminator);
}

std::string build_string_to_sign(const std::string& timestamp,
                                 const SigningScope& scope,
                                 const std::string& canonical_request) {
    std::ostringstream oss;
    oss << kAlgorithm << "\n";
    oss << timestamp << "\n";
    oss << scope.to_string() << "\n";
    oss << sha256_hex(canonical_request);
    return oss.str();
}

std::string format_timestamp(std::chrono::system_clock::time_point when) {
    auto time = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&time, &tm);

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

// ============================================================================
// RequestSigner
// ============================================================================

RequestSigner::RequestSigner(AccessKeyCredentials credentials,
                             std::string region,
                             std::string service)
    : credentials_(std::move(credentials))
    , region_(std::move(region))
    , service_(std::move(service)) {}

void RequestSigner::sign(HttpRequest& request) const {
    sign(request, std::chrono::system_clock::now());
}

void RequestSigner::sign(HttpRequest& request,
                         std::chrono::system_clock::time_point when) const {
    if (credentials_.empty()) {
        throw SigningError("access key and secret key are required to sign requests");
    }
    if (region_.empty() || service_.empty()) {
        throw SigningError("signing region and service must be set");
    }

    auto url = ParsedUrl::parse(request.url);
    if (!url) {
        throw SigningError("cannot parse request URL: " + request.url);
    }

    std::string timestamp = format_timestamp(when);
    SigningScope scope{timestamp.substr(0, 8), region_, service_};

    // Stale signatures from an earlier attempt must not be signed over
    request.headers.remove("Authorization");
    request.headers.set("Host", url->authority());
    request.headers.set("X-Date", timestamp);
    request.headers.set("Content-Type", "application/json");

    CanonicalRequest canonical = build_canonical_request(request);
    std::string string_to_sign = build_string_to_sign(timestamp, scope, canonical.text);
    std::string signature =
        hex_encode(hmac_sha256(derive_signing_key(credentials_.secret_key, scope), string_to_sign));

    std::ostringstream auth;
    auth << kAlgorithm << " ";
    auth << "Credential=" << credentials_.access_key << "/" << scope.to_string() << ", ";
    auth << "SignedHeaders=" << canonical.signed_headers << ", ";
    auth << "Signature=" << signature;

    request.headers.set("Authorization", auth.str());
}

} // namespace clipforge::net
