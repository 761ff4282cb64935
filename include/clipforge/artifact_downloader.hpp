#pragma once

#include "clipforge/net/http.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace clipforge {

struct DownloadResult {
    bool success = false;
    std::filesystem::path path;
    uint64_t bytes_written = 0;
    int http_status = 0;
    std::chrono::milliseconds elapsed{0};
    std::string error_message;
};

// Streams a result artifact to local storage. Bytes are written to
// "{destination}.part" and renamed onto the destination only after the
// transfer completed and, when the server declared one, the length matches
// Content-Length. The partial file is removed on any failure.
class ArtifactDownloader {
public:
    explicit ArtifactDownloader(net::HttpTransport& transport);

    DownloadResult download(const std::string& url, const std::filesystem::path& destination);

private:
    net::HttpTransport& transport_;
};

} // namespace clipforge
