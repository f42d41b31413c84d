#pragma once
#include <optional>
#include <string>

#include "../../core/types/constants.hpp"

namespace Rotor {
namespace Proxy {
namespace Pool {

struct ProxyDescriptor {
    std::string                endpoint;  // host:port or scheme://[user:pass@]host:port
    std::optional<std::string> username;
    std::optional<std::string> password;
    int                        failure_threshold = Core::Constants::DEFAULT_FAILURE_THRESHOLD;
    int                        timeout_seconds   = Core::Constants::DEFAULT_TIMEOUT_SECONDS;

    // Throws std::invalid_argument on an empty endpoint, a threshold below 1
    // or a non-positive timeout.
    void validate() const;

    bool has_credentials() const;
};

}  // namespace Pool
}  // namespace Proxy
}  // namespace Rotor
