#pragma once
#include <curl/curl.h>
#include <memory>
#include <string>
#include "http_client.hpp"

namespace Rotor {
namespace Network {
namespace Http {

class CurlClient : public HttpClient {
public:
    CurlClient();
    ~CurlClient() override = default;
    CurlClient(const CurlClient&)            = delete;
    CurlClient& operator=(const CurlClient&) = delete;

    void     set_proxy(const std::string& proxy) override;
    void     set_timeout(std::chrono::seconds timeout) override;
    Response get(const std::string& url) override;

private:
    struct CurlDeleter {
        void operator()(CURL* curl) const noexcept {
            if (curl)
                curl_easy_cleanup(curl);
        }
    };

    std::unique_ptr<CURL, CurlDeleter> curl_;
    std::string                        proxy_;
    std::string                        user_agent_;
    long                               timeout_seconds_;

    Response create_error_response(const std::string& msg) const;
    void     setup_curl_options(CURL* curl, const std::string& url, std::string& body) const;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};

}  // namespace Http
}  // namespace Network
}  // namespace Rotor
