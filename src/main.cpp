#include "clipforge/job_config.hpp"
#include "clipforge/job_runner.hpp"
#include "clipforge/log.hpp"
#include "clipforge/metrics.hpp"
#include "clipforge/net/http.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = clipforge::JobConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        } else {
            clipforge::log_warn("cannot open log file %s, logging to console",
                                config.log_file.c_str());
        }
    }

    clipforge::set_verbose(config.verbose);

    clipforge::log_info("clipforge starting...");
    clipforge::log_info("  mode: %s", clipforge::to_string(config.mode));
    clipforge::log_info("  image-url: %s", config.image_url.c_str());
    if (config.mode == clipforge::JobKind::Video) {
        clipforge::log_info("  ark-endpoint: %s", config.ark_endpoint.c_str());
        clipforge::log_info("  api-key: %s", clipforge::mask_secret(config.api_key).c_str());
        clipforge::log_info("  model: %s", config.model.c_str());
        if (!config.end_image_url.empty()) {
            clipforge::log_info("  end-image-url: %s", config.end_image_url.c_str());
        }
    } else {
        clipforge::log_info("  visual-endpoint: %s", config.visual_endpoint.c_str());
        clipforge::log_info("  region/service: %s/%s", config.region.c_str(), config.service.c_str());
        // Mask secrets in log output
        clipforge::log_info("  access-key: %s",
                            clipforge::mask_secret(config.access_keys.access_key).c_str());
        clipforge::log_info("  secret-key: %s",
                            config.access_keys.secret_key.empty() ? "(unset)" : "****");
        if (!config.audio_url.empty()) {
            clipforge::log_info("  audio-url: %s", config.audio_url.c_str());
        }
    }
    clipforge::log_info("  polling: %d attempts every %ds", config.max_poll_attempts,
                        config.poll_interval_secs);
    clipforge::log_info("  output-dir: %s", config.output_dir.c_str());

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    clipforge::net::HttpClientConfig http_config;
    http_config.connect_timeout = std::chrono::seconds(config.connect_timeout_secs);
    http_config.request_timeout = std::chrono::seconds(config.request_timeout_secs);
    http_config.verify_ssl = !config.no_verify_ssl;
    http_config.ca_bundle = config.ca_cert;
    http_config.verbose = config.verbose;
    clipforge::net::HttpClient http(http_config);

    std::unique_ptr<clipforge::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<clipforge::MetricsExporter>(
            config.metrics_file,
            std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"mode", clipforge::to_string(config.mode)}});
        metrics->start();
    }

    // Run the job on a worker so the main thread can turn signals into cancellation
    clipforge::CancellationToken cancel;
    clipforge::JobRunner runner(config, http, metrics.get());
    clipforge::JobOutcome outcome;
    std::string fatal_error;
    std::atomic<bool> done{false};

    std::thread worker([&]() {
        try {
            outcome = runner.run(cancel);
        } catch (const clipforge::ConfigurationError& e) {
            fatal_error = std::string("configuration: ") + e.what();
        } catch (const clipforge::net::SigningError& e) {
            fatal_error = std::string("signing: ") + e.what();
        } catch (const std::exception& e) {
            fatal_error = std::string("unexpected error: ") + e.what();
        }
        done = true;
    });

    // Wait until the job ends or a shutdown signal arrives
    bool cancel_sent = false;
    while (!done) {
        if (g_shutdown_requested && !cancel_sent) {
            clipforge::log_warn("shutdown requested, cancelling job");
            cancel.cancel();
            cancel_sent = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    worker.join();

    if (metrics) {
        metrics->stop();
    }

    if (!fatal_error.empty()) {
        clipforge::log_error("%s", fatal_error.c_str());
        return 1;
    }
    if (!outcome.success) {
        clipforge::log_error("%s", outcome.describe().c_str());
        return 1;
    }

    // The artifact path (or subject id) is the program's output
    std::cout << outcome.artifact << std::endl;
    return 0;
}
