#include "rotation_manager.hpp"
#include <algorithm>
#include <stdexcept>
#include <utility>
#include "../../core/logger/logger.hpp"

namespace Rotor {
namespace Proxy {
namespace Pool {

using namespace Rotor::Core;
using Rotor::Proxy::Uri::ProxyUri;

namespace {

std::vector<ProxyDescriptor> validated(std::vector<ProxyDescriptor> descriptors) {
    for (size_t i = 0; i < descriptors.size(); ++i) {
        try {
            descriptors[i].validate();
        } catch (const std::invalid_argument& e) {
            throw std::invalid_argument("proxy #" + std::to_string(i) + ": " + e.what());
        }
    }
    return descriptors;
}

}  // namespace

ProxyRotationManager::ProxyRotationManager(std::vector<ProxyDescriptor> descriptors, Clock clock)
    : descriptors_(validated(std::move(descriptors))),
      failure_counts_(descriptors_.size(), 0),
      last_used_(descriptors_.size()),
      clock_(std::move(clock)) {
    if (!clock_)
        clock_ = SteadyClock::now;
}

bool ProxyRotationManager::is_unhealthy(size_t index) const {
    return failure_counts_[index] >= descriptors_[index].failure_threshold;
}

bool ProxyRotationManager::is_cooling_down(size_t index, TimePoint now) const {
    const auto& last = last_used_[index];
    return last && now - *last < MIN_REUSE_INTERVAL;
}

ProxySelection ProxyRotationManager::make_selection(size_t index) const {
    ProxySelection selection;
    selection.index           = index;
    selection.proxies         = ProxyUri::settings(descriptors_[index]);
    selection.timeout_seconds = descriptors_[index].timeout_seconds;
    return selection;
}

std::optional<ProxySelection> ProxyRotationManager::select() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (descriptors_.empty())
        return std::nullopt;

    const size_t    pool_size = descriptors_.size();
    const TimePoint now       = clock_();

    for (size_t attempt = 0; attempt < pool_size; ++attempt) {
        size_t index = cursor_;
        cursor_      = (cursor_ + 1) % pool_size;

        if (is_unhealthy(index) || is_cooling_down(index, now))
            continue;

        last_used_[index] = now;
        return make_selection(index);
    }

    // Every proxy is unhealthy or cooling down. Clear the failure history
    // (cooldown stamps stay) and fall back to the first proxy.
    Logger::warn("No usable proxy among " + std::to_string(pool_size)
                 + ", resetting failure counters");
    std::fill(failure_counts_.begin(), failure_counts_.end(), 0);
    last_used_[0] = now;
    return make_selection(0);
}

std::optional<size_t> ProxyRotationManager::find_index(const std::string& uri) const {
    for (size_t i = 0; i < descriptors_.size(); ++i) {
        if (ProxyUri::format(descriptors_[i]) == uri)
            return i;
    }
    return std::nullopt;
}

void ProxyRotationManager::record_failure(size_t index) {
    failure_counts_[index]++;
    Logger::warn("Proxy " + std::to_string(index) + " failed ("
                 + std::to_string(failure_counts_[index]) + "/"
                 + std::to_string(descriptors_[index].failure_threshold)
                 + " failures): " + ProxyUri::redact(ProxyUri::format(descriptors_[index])));
}

void ProxyRotationManager::record_success(size_t index) {
    if (failure_counts_[index] == 0)
        return;
    failure_counts_[index] = 0;
    Logger::success("Proxy " + std::to_string(index) + " recovered, failure count reset");
}

void ProxyRotationManager::report_failure(const std::string& uri) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto index = find_index(uri))
        record_failure(*index);
}

void ProxyRotationManager::report_success(const std::string& uri) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto index = find_index(uri))
        record_success(*index);
}

void ProxyRotationManager::report_failure(const ProxySelection& selection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (selection.index < descriptors_.size())
        record_failure(selection.index);
}

void ProxyRotationManager::report_success(const ProxySelection& selection) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (selection.index < descriptors_.size())
        record_success(selection.index);
}

PoolStats ProxyRotationManager::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PoolStats stats;
    stats.total = descriptors_.size();
    for (size_t i = 0; i < descriptors_.size(); ++i) {
        if (is_unhealthy(i))
            stats.unhealthy++;
        else
            stats.healthy++;
        stats.failure_counts[i] = failure_counts_[i];
        stats.last_used[i]      = last_used_[i];
    }
    return stats;
}

size_t ProxyRotationManager::size() const {
    return descriptors_.size();
}

bool ProxyRotationManager::empty() const {
    return descriptors_.empty();
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Rotor
