#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "../uri/proxy_uri.hpp"
#include "proxy_descriptor.hpp"

namespace Rotor {
namespace Proxy {
namespace Pool {

using SteadyClock = std::chrono::steady_clock;
using TimePoint   = SteadyClock::time_point;

struct ProxySelection {
    size_t             index = 0;  // Handle for report_success / report_failure
    Uri::ProxySettings proxies;
    int                timeout_seconds = Core::Constants::DEFAULT_TIMEOUT_SECONDS;

    const std::string& uri() const {
        return proxies.http;
    }
};

struct PoolStats {
    size_t                                     total     = 0;
    size_t                                     healthy   = 0;
    size_t                                     unhealthy = 0;
    std::map<size_t, int>                      failure_counts;
    std::map<size_t, std::optional<TimePoint>> last_used;  // nullopt: never handed out
};

/**
 * Round-robin proxy selection with per-proxy failure accounting and a
 * one second reuse interval. Every public method holds mutex_ for its whole body.
 *
 * When a full scan finds no proxy that is both healthy and idle, all failure
 * counters are cleared and index 0 is handed out, so a nonempty pool always
 * yields a proxy.
 */
class ProxyRotationManager {
public:
    using Clock = std::function<TimePoint()>;

    // Throws std::invalid_argument if any descriptor fails validation.
    explicit ProxyRotationManager(std::vector<ProxyDescriptor> descriptors,
                                  Clock                        clock = SteadyClock::now);

    ProxyRotationManager(const ProxyRotationManager&)            = delete;
    ProxyRotationManager& operator=(const ProxyRotationManager&) = delete;

    std::optional<ProxySelection> select();

    void report_failure(const std::string& uri);
    void report_success(const std::string& uri);
    void report_failure(const ProxySelection& selection);
    void report_success(const ProxySelection& selection);

    PoolStats stats() const;

    size_t size() const;
    bool   empty() const;

private:
    bool is_unhealthy(size_t index) const;
    bool is_cooling_down(size_t index, TimePoint now) const;

    ProxySelection          make_selection(size_t index) const;
    std::optional<size_t>   find_index(const std::string& uri) const;
    void                    record_failure(size_t index);
    void                    record_success(size_t index);

    const std::vector<ProxyDescriptor>    descriptors_;
    std::vector<int>                      failure_counts_;
    std::vector<std::optional<TimePoint>> last_used_;
    size_t                                cursor_ = 0;
    Clock                                 clock_;
    mutable std::mutex                    mutex_;
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Rotor
