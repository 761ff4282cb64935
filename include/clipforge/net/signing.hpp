#pragma once

#include "clipforge/net/http.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace clipforge::net {

// Malformed input to the signer. The request must not be sent.
class SigningError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct AccessKeyCredentials {
    std::string access_key;
    std::string secret_key;

    bool empty() const { return access_key.empty() || secret_key.empty(); }
};

/// Binds a derived key to one day, region and service.
struct SigningScope {
    std::string date;     // YYYYMMDD
    std::string region;
    std::string service;

    // "{date}/{region}/{service}/request"
    std::string to_string() const;
};

struct CanonicalRequest {
    std::string text;
    std::string signed_headers;  // sorted, ';'-joined lower-case names
};

// Digest helpers (OpenSSL)
std::string hex_encode(const std::vector<uint8_t>& bytes);
std::string sha256_hex(const std::string& data);
std::string sha256_hex(const std::vector<uint8_t>& data);
std::vector<uint8_t> hmac_sha256(const std::vector<uint8_t>& key, const std::string& data);

/// Sorted, re-encoded query string. Pairs are percent-decoded and then
/// encoded with url_encode so equivalent queries canonicalize identically.
std::string canonical_query_string(const std::string& query);

/// Normalize a request into the byte-exact string that gets hashed.
/// Throws SigningError if the URL cannot be parsed.
CanonicalRequest build_canonical_request(const HttpRequest& request);

/// Four-stage HMAC-SHA256 chain: date, region, service, then "request".
std::vector<uint8_t> derive_signing_key(const std::string& secret_key,
                                        const SigningScope& scope);

std::string build_string_to_sign(const std::string& timestamp,
                                 const SigningScope& scope,
                                 const std::string& canonical_request);

// YYYYMMDDTHHMMSSZ in UTC
std::string format_timestamp(std::chrono::system_clock::time_point when);

// HMAC-SHA256 request signer for the visual service.
// Adds Host, X-Date, Content-Type and Authorization to the request; other
// caller headers are kept and signed as well.
class RequestSigner {
public:
    RequestSigner(AccessKeyCredentials credentials,
                  std::string region,
                  std::string service);

    void sign(HttpRequest& request) const;
    void sign(HttpRequest& request, std::chrono::system_clock::time_point when) const;

    const std::string& region() const { return region_; }
    const std::string& service() const { return service_; }

private:
    AccessKeyCredentials credentials_;
    std::string region_;
    std::string service_;
};

} // namespace clipforge::net
