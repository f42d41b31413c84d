#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../../core/types/constants.hpp"
#include "../../network/http/http_client.hpp"
#include "../../proxy/pool/rotation_manager.hpp"

namespace Rotor {
namespace Engine {

using ClientFactory = std::function<std::unique_ptr<Network::Http::HttpClient>()>;
using BackoffPolicy = std::function<std::chrono::milliseconds(int attempt)>;

struct FetcherConfig {
    int           threads  = Core::Constants::DEFAULT_THREADS;
    int           attempts = Core::Constants::DEFAULT_ATTEMPTS;
    BackoffPolicy backoff  = Core::get_backoff_time;
};

struct FetchSummary {
    size_t succeeded = 0;
    size_t failed    = 0;
};

/**
 * Fetches URLs concurrently through a shared ProxyRotationManager.
 * Every attempt selects a proxy, performs the request and reports the outcome
 * back to the pool through the selection handle.
 */
class Fetcher {
public:
    Fetcher(Proxy::Pool::ProxyRotationManager& pool,
            ClientFactory                      client_factory,
            FetcherConfig                      config = {});

    FetchSummary run(const std::vector<std::string>& urls);

    // Single URL on the calling thread. Returns true when a 2xx/3xx was received.
    bool fetch(Network::Http::HttpClient& client, const std::string& url);

    // Whether a response means the proxy itself misbehaved.
    static bool is_proxy_failure(const Network::Http::Response& res);

private:
    Proxy::Pool::ProxyRotationManager& pool_;
    ClientFactory                      client_factory_;
    FetcherConfig                      config_;
};

}  // namespace Engine
}  // namespace Rotor
