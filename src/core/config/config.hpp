#pragma once
#include <string>
#include <vector>

#include "../../proxy/pool/proxy_descriptor.hpp"
#include "../types/constants.hpp"

namespace Rotor {
namespace Core {

struct Config {
    int                                       threads      = Constants::DEFAULT_THREADS;
    int                                       attempts     = Constants::DEFAULT_ATTEMPTS;
    int                                       max_failures = Constants::DEFAULT_FAILURE_THRESHOLD;
    int                                       timeout      = Constants::DEFAULT_TIMEOUT_SECONDS;
    std::vector<Proxy::Pool::ProxyDescriptor> proxies;
    std::vector<std::string>                  urls;
    std::string                               config_path;
    std::string                               proxy_username;  // for --proxy / --proxy-list entries
    std::string                               proxy_password;
    bool                                      quiet = false;

    static Config parse(int argc, char* argv[]);

    // One endpoint per line; blank lines and '#' comments are skipped.
    static std::vector<std::string> load_proxy_list(const std::string& path);
};

}  // namespace Core
}  // namespace Rotor
