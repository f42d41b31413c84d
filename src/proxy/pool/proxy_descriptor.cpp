#include "proxy_descriptor.hpp"
#include <stdexcept>
#include "../../utils/text/string_utils.hpp"

namespace Rotor {
namespace Proxy {
namespace Pool {

void ProxyDescriptor::validate() const {
    if (Utils::Text::trim(endpoint).empty()) {
        throw std::invalid_argument("proxy endpoint must not be empty");
    }
    if (failure_threshold < 1) {
        throw std::invalid_argument("failure threshold must be at least 1 (got "
                                    + std::to_string(failure_threshold) + ") for " + endpoint);
    }
    if (timeout_seconds <= 0) {
        throw std::invalid_argument("timeout must be positive (got "
                                    + std::to_string(timeout_seconds) + ") for " + endpoint);
    }
}

bool ProxyDescriptor::has_credentials() const {
    return username && password && !username->empty() && !password->empty();
}

}  // namespace Pool
}  // namespace Proxy
}  // namespace Rotor
