#include <chrono>
#include <curl/curl.h>
#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include "core/config/config.hpp"
#include "core/logger/logger.hpp"
#include "engine/fetcher/fetcher.hpp"
#include "network/http/curl_client.hpp"
#include "proxy/pool/rotation_manager.hpp"

using namespace Rotor::Core;
using namespace Rotor::Engine;
using namespace Rotor::Proxy::Pool;

namespace {

void log_stats(const PoolStats& stats) {
    Logger::info("Proxy pool: " + std::to_string(stats.total) + " total, "
                 + std::to_string(stats.healthy) + " healthy, "
                 + std::to_string(stats.unhealthy) + " unhealthy");
    const auto now = SteadyClock::now();
    for (const auto& [index, failures] : stats.failure_counts) {
        std::string line = "  #" + std::to_string(index) + " failures=" + std::to_string(failures);
        const auto& last = stats.last_used.at(index);
        if (last) {
            auto ago = std::chrono::duration_cast<std::chrono::milliseconds>(now - *last);
            line += " last_used=" + std::to_string(ago.count()) + "ms ago";
        }
        else {
            line += " last_used=never";
        }
        Logger::info(line);
    }
}

int run(const Config& config) {
    ProxyRotationManager pool(config.proxies);
    if (pool.empty())
        Logger::warn("No proxies configured, fetching directly.");
    else
        Logger::info("Proxy pool initialized with " + std::to_string(pool.size()) + " proxies");

    FetcherConfig fetcher_config;
    fetcher_config.threads  = config.threads;
    fetcher_config.attempts = config.attempts;

    Fetcher fetcher(
        pool,
        []() { return std::make_unique<Rotor::Network::Http::CurlClient>(); },
        fetcher_config);

    FetchSummary summary = fetcher.run(config.urls);
    log_stats(pool.stats());

    Logger::info("Done: " + std::to_string(summary.succeeded) + " succeeded, "
                 + std::to_string(summary.failed) + " failed");
    return summary.failed == 0 ? 0 : 2;
}

}  // namespace

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::parse(argc, argv);
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }

    if (config.quiet)
        Logger::set_level(LOG_ERROR);

    if (config.urls.empty()) {
        Logger::error("No URLs provided. Use --help for usage.");
        return 1;
    }

    curl_global_init(CURL_GLOBAL_ALL);
    int rc = 1;
    try {
        rc = run(config);
    } catch (const std::invalid_argument& e) {
        Logger::error(std::string("Invalid proxy configuration: ") + e.what());
    }
    curl_global_cleanup();
    return rc;
}
