#pragma once

#include <chrono>
#include <string>

namespace Rotor {
namespace Network {
namespace Http {

// Other: failure on the local side, before any connection was attempted.
enum class ErrorType { None, Network, Proxy, Timeout, Other };

enum class HTTPCode {
    NetworkError      = 0,
    Forbidden         = 403,
    ProxyAuthRequired = 407,
    TooManyRequests   = 429
};

enum class MaxCode { ClientError = 400 };

struct Response {
    long        status_code = 0;
    std::string body;
    std::string error;
    bool        success    = false;
    ErrorType   error_type = ErrorType::None;
};

class HttpClient {
public:
    virtual ~HttpClient() = default;

    // Empty string means a direct connection.
    virtual void     set_proxy(const std::string& proxy)      = 0;
    virtual void     set_timeout(std::chrono::seconds timeout) = 0;
    virtual Response get(const std::string& url)               = 0;
};

}  // namespace Http
}  // namespace Network
}  // namespace Rotor
