#include "fetcher.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <stdexcept>
#include <thread>
#include <utility>
#include "../../core/logger/logger.hpp"

namespace Rotor {
namespace Engine {

using namespace Rotor::Core;
using namespace Rotor::Network::Http;
using Rotor::Proxy::Uri::ProxyUri;

Fetcher::Fetcher(Proxy::Pool::ProxyRotationManager& pool,
                 ClientFactory                      client_factory,
                 FetcherConfig                      config)
    : pool_(pool), client_factory_(std::move(client_factory)), config_(std::move(config)) {
    if (!client_factory_)
        throw std::invalid_argument("Fetcher requires a client factory");
    if (config_.threads < 1)
        config_.threads = 1;
    if (config_.attempts < 1)
        config_.attempts = 1;
}

bool Fetcher::is_proxy_failure(const Response& res) {
    if (res.error_type == ErrorType::Other)
        return false;
    if (res.error_type == ErrorType::Proxy || res.error_type == ErrorType::Timeout)
        return true;
    if (res.status_code == static_cast<long>(HTTPCode::NetworkError))
        return true;
    return res.status_code == static_cast<long>(HTTPCode::Forbidden)
           || res.status_code == static_cast<long>(HTTPCode::ProxyAuthRequired)
           || res.status_code == static_cast<long>(HTTPCode::TooManyRequests);
}

bool Fetcher::fetch(HttpClient& client, const std::string& url) {
    for (int attempt = 1; attempt <= config_.attempts; ++attempt) {
        auto selection = pool_.select();
        if (selection) {
            client.set_proxy(selection->uri());
            client.set_timeout(std::chrono::seconds(selection->timeout_seconds));
        }
        else {
            client.set_proxy("");
        }

        std::string log_msg = "Fetching: " + url;
        if (attempt > 1)
            log_msg += " [Retry " + std::to_string(attempt) + "]";
        log_msg += selection ? " [" + ProxyUri::redact(selection->uri()) + "]" : " [direct]";
        Logger::info(log_msg);

        Response res = client.get(url);

        if (selection) {
            if (is_proxy_failure(res))
                pool_.report_failure(*selection);
            else
                pool_.report_success(*selection);
        }

        if (res.success) {
            Logger::success("HTTP " + std::to_string(res.status_code) + ": " + url);
            return true;
        }

        if (attempt == config_.attempts) {
            std::string err_msg = "Failed: " + url + " (" + res.error + ")";
            if (res.error_type == ErrorType::Proxy)
                err_msg += " [Proxy Error]";
            else if (res.error_type == ErrorType::Timeout)
                err_msg += " [Timeout]";
            Logger::error(err_msg + " - Max attempts reached");
        }
        else if (config_.backoff) {
            std::this_thread::sleep_for(config_.backoff(attempt));
        }
    }
    return false;
}

FetchSummary Fetcher::run(const std::vector<std::string>& urls) {
    std::atomic<size_t> succeeded{0};
    std::atomic<size_t> failed{0};

    boost::asio::thread_pool workers(static_cast<size_t>(config_.threads));
    for (const auto& url : urls) {
        boost::asio::post(workers, [this, url, &succeeded, &failed]() {
            auto client = client_factory_();
            if (client && fetch(*client, url))
                succeeded++;
            else
                failed++;
        });
    }
    workers.join();

    FetchSummary summary;
    summary.succeeded = succeeded.load();
    summary.failed    = failed.load();
    return summary;
}

}  // namespace Engine
}  // namespace Rotor
