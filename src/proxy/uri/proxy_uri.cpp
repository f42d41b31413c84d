#include "proxy_uri.hpp"
#include "../../core/types/constants.hpp"

namespace Rotor {
namespace Proxy {
namespace Uri {

namespace {

constexpr const char* SCHEME_SEPARATOR = "://";

// Offset of the authority section (past "scheme://" if present).
size_t authority_offset(const std::string& endpoint) {
    size_t sep = endpoint.find(SCHEME_SEPARATOR);
    return sep == std::string::npos ? 0 : sep + 3;
}

// Position of the last '@' after the scheme separator, or npos. Passwords
// may contain '/', '?' or '#', so the search is not bounded by a path.
size_t userinfo_end(const std::string& endpoint) {
    size_t at = endpoint.rfind('@');
    if (at == std::string::npos || at < authority_offset(endpoint))
        return std::string::npos;
    return at;
}

}  // namespace

bool ProxyUri::has_scheme(const std::string& endpoint) {
    size_t sep = endpoint.find(SCHEME_SEPARATOR);
    return sep != std::string::npos && sep > 0;
}

bool ProxyUri::has_embedded_credentials(const std::string& endpoint) {
    size_t at = userinfo_end(endpoint);
    if (at == std::string::npos)
        return false;
    size_t colon = endpoint.find(':', authority_offset(endpoint));
    return colon != std::string::npos && colon < at;
}

std::string ProxyUri::with_scheme(const std::string& endpoint) {
    if (has_scheme(endpoint))
        return endpoint;
    return std::string(Core::Constants::DEFAULT_PROXY_SCHEME) + SCHEME_SEPARATOR + endpoint;
}

std::string ProxyUri::format(const Pool::ProxyDescriptor& descriptor) {
    const std::string& endpoint = descriptor.endpoint;

    if (has_embedded_credentials(endpoint))
        return with_scheme(endpoint);

    // A bare "user@host" already names a user; do not stack a second one on it.
    if (descriptor.has_credentials() && userinfo_end(endpoint) == std::string::npos) {
        std::string uri    = with_scheme(endpoint);
        size_t      offset = authority_offset(uri);
        uri.insert(offset, *descriptor.username + ":" + *descriptor.password + "@");
        return uri;
    }

    return with_scheme(endpoint);
}

ProxySettings ProxyUri::settings(const Pool::ProxyDescriptor& descriptor) {
    std::string uri = format(descriptor);
    return ProxySettings{uri, uri};
}

std::string ProxyUri::redact(const std::string& uri) {
    if (!has_embedded_credentials(uri))
        return uri;
    size_t at    = userinfo_end(uri);
    size_t colon = uri.find(':', authority_offset(uri));
    return uri.substr(0, colon + 1) + "***" + uri.substr(at);
}

}  // namespace Uri
}  // namespace Proxy
}  // namespace Rotor
