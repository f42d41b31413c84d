#pragma once
#include <string>

#include "../pool/proxy_descriptor.hpp"

namespace Rotor {
namespace Proxy {
namespace Uri {

// Proxy configuration handed to an HTTP client. The proxy protocol does not
// depend on the scheme of the tunneled request, so both entries hold the same URI.
struct ProxySettings {
    std::string http;
    std::string https;

    bool operator==(const ProxySettings& other) const {
        return http == other.http && https == other.https;
    }
    bool operator!=(const ProxySettings& other) const {
        return !(*this == other);
    }
};

class ProxyUri {
public:
    // Deterministic: the same descriptor always yields the same string.
    static std::string   format(const Pool::ProxyDescriptor& descriptor);
    static ProxySettings settings(const Pool::ProxyDescriptor& descriptor);

    static bool has_scheme(const std::string& endpoint);

    // True when the authority carries a "user:pass@" prefix.
    static bool has_embedded_credentials(const std::string& endpoint);

    // Replaces the password of a formatted URI with "***" for log output.
    static std::string redact(const std::string& uri);

private:
    static std::string with_scheme(const std::string& endpoint);
};

}  // namespace Uri
}  // namespace Proxy
}  // namespace Rotor
