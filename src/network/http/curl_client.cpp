#include "curl_client.hpp"
#include <utility>
#include "../../core/types/constants.hpp"

namespace Rotor {
namespace Network {
namespace Http {

namespace {

ErrorType map_curl_code_to_error_type(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_RECV_ERROR:
            return ErrorType::Proxy;
        case CURLE_OPERATION_TIMEDOUT:
            return ErrorType::Timeout;
        default:
            return ErrorType::Network;
    }
}

}  // namespace

size_t CurlClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    if (!body)
        return 0;
    size_t total = size * nmemb;
    body->append(static_cast<const char*>(contents), total);
    return total;
}

CurlClient::CurlClient()
    : curl_(curl_easy_init()),
      user_agent_(Core::Constants::USER_AGENT),
      timeout_seconds_(Core::Constants::DEFAULT_TIMEOUT_SECONDS) {
}

void CurlClient::set_proxy(const std::string& proxy) {
    proxy_ = proxy;
}

void CurlClient::set_timeout(std::chrono::seconds timeout) {
    timeout_seconds_ = static_cast<long>(timeout.count());
}

Response CurlClient::create_error_response(const std::string& msg) const {
    Response r;
    r.success     = false;
    r.error       = msg;
    r.error_type  = ErrorType::Other;
    r.status_code = static_cast<long>(HTTPCode::NetworkError);
    return r;
}

void CurlClient::setup_curl_options(CURL* curl, const std::string& url, std::string& body) const {
    curl_easy_reset(curl);
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, timeout_seconds_);

    if (!user_agent_.empty())
        curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    // The proxy URI carries its own scheme and credentials.
    if (!proxy_.empty())
        curl_easy_setopt(curl, CURLOPT_PROXY, proxy_.c_str());
}

Response CurlClient::get(const std::string& url) {
    if (!curl_)
        return create_error_response("Failed to initialize CURL handle");

    std::string body;
    setup_curl_options(curl_.get(), url, body);
    CURLcode res = curl_easy_perform(curl_.get());

    Response response;
    curl_easy_getinfo(curl_.get(), CURLINFO_RESPONSE_CODE, &response.status_code);

    if (res != CURLE_OK) {
        response.error       = curl_easy_strerror(res);
        response.error_type  = map_curl_code_to_error_type(res);
        response.status_code = static_cast<long>(HTTPCode::NetworkError);
        return response;
    }

    response.body    = std::move(body);
    response.success = response.status_code >= 200
                       && response.status_code < static_cast<long>(MaxCode::ClientError);
    if (!response.success)
        response.error = "HTTP " + std::to_string(response.status_code);
    return response;
}

}  // namespace Http
}  // namespace Network
}  // namespace Rotor
