#include "clipforge/artifact_downloader.hpp"
#include "clipforge/log.hpp"

#include <fstream>
#include <system_error>
#include <utility>

namespace clipforge {

ArtifactDownloader::ArtifactDownloader(net::HttpTransport& transport)
    : transport_(transport) {}

DownloadResult ArtifactDownloader::download(const std::string& url,
                                            const std::filesystem::path& destination) {
    DownloadResult result;
    result.path = destination;

    auto start = std::chrono::steady_clock::now();
    auto finish = [&](DownloadResult& r) -> DownloadResult& {
        r.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return r;
    };

    std::error_code ec;
    if (destination.has_parent_path()) {
        std::filesystem::create_directories(destination.parent_path(), ec);
        if (ec) {
            result.error_message = "Failed to create output directory: " + ec.message();
            return finish(result);
        }
    }

    std::filesystem::path part_path = destination;
    part_path += ".part";

    std::ofstream file(part_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        result.error_message = "Failed to open file for writing: " + part_path.string();
        return finish(result);
    }

    bool write_failed = false;
    auto on_chunk = [&](const uint8_t* data, size_t size) {
        file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
        if (!file) {
            write_failed = true;
            return false;
        }
        result.bytes_written += size;
        return true;
    };

    log_info("downloading %s", url.c_str());
    auto response = transport_.stream(net::HttpRequest::get(url), on_chunk);
    result.http_status = response.status_code;
    file.close();
    if (!file) {
        write_failed = true;
    }

    auto fail = [&](std::string message) -> DownloadResult& {
        std::error_code remove_ec;
        std::filesystem::remove(part_path, remove_ec);
        result.success = false;
        result.error_message = std::move(message);
        return finish(result);
    };

    if (write_failed) {
        return fail("Failed to write " + part_path.string());
    }
    if (!response.error.empty()) {
        return fail("Download failed: " + response.error);
    }
    if (!response.ok()) {
        return fail("Download returned HTTP " + std::to_string(response.status_code));
    }
    if (auto declared = response.headers.content_length()) {
        if (*declared != result.bytes_written) {
            return fail("Download truncated: expected " + std::to_string(*declared) +
                        " bytes, received " + std::to_string(result.bytes_written));
        }
    }

    std::filesystem::rename(part_path, destination, ec);
    if (ec) {
        return fail("Failed to rename file: " + ec.message());
    }

    result.success = true;
    log_info("saved %s (%llu bytes)", destination.c_str(),
             static_cast<unsigned long long>(result.bytes_written));
    return finish(result);
}

} // namespace clipforge
