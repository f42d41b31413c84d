#pragma once
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>

namespace Rotor {
namespace Core {

struct Constants {
    static constexpr int         DEFAULT_THREADS           = 4;
    static constexpr int         DEFAULT_ATTEMPTS          = 3;
    static constexpr const char* VERSION                   = "0.1.0";
    static constexpr const char* USER_AGENT                = "Rotor/0.1";

    static constexpr int         DEFAULT_FAILURE_THRESHOLD = 3;
    static constexpr int         DEFAULT_TIMEOUT_SECONDS   = 30;
    static constexpr const char* DEFAULT_PROXY_SCHEME      = "http";
};

// Minimum interval between two handouts of the same proxy.
inline constexpr std::chrono::seconds MIN_REUSE_INTERVAL{1};

// 1s, 2s, 4s, ... capped at MAX_BACKOFF_SHIFT doublings.
inline constexpr int MAX_BACKOFF_SHIFT = 6;

inline std::chrono::milliseconds get_backoff_time(int attempt) {
    if (attempt <= 0)
        return std::chrono::milliseconds(0);
    int shift = std::min(attempt - 1, MAX_BACKOFF_SHIFT);
    return std::chrono::milliseconds(int64_t{1000} << shift);
}

}  // namespace Core
}  // namespace Rotor
