#include <atomic>
#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include "../../src/core/logger/logger.hpp"
#include "../../src/engine/fetcher/fetcher.hpp"

using namespace Rotor::Engine;
using namespace Rotor::Network::Http;
using namespace Rotor::Proxy::Pool;

namespace {

// Shared script: responses keyed by proxy URI ("" for direct), plus a log of
// every request that was issued.
struct Script {
    std::mutex                                mutex;
    std::map<std::string, Response>           by_proxy;
    std::vector<std::pair<std::string, long>> requests;  // proxy, timeout seconds

    Response respond(const std::string& proxy, long timeout) {
        std::lock_guard<std::mutex> lock(mutex);
        requests.emplace_back(proxy, timeout);
        auto it = by_proxy.find(proxy);
        if (it != by_proxy.end())
            return it->second;
        Response ok;
        ok.success     = true;
        ok.status_code = 200;
        return ok;
    }
};

class FakeClient : public HttpClient {
public:
    explicit FakeClient(Script& script) : script_(script) {
    }

    void set_proxy(const std::string& proxy) override {
        proxy_ = proxy;
    }
    void set_timeout(std::chrono::seconds timeout) override {
        timeout_ = timeout.count();
    }
    Response get(const std::string& /*url*/) override {
        return script_.respond(proxy_, timeout_);
    }

private:
    Script&     script_;
    std::string proxy_;
    long        timeout_ = 0;
};

Response proxy_error() {
    Response r;
    r.error_type  = ErrorType::Proxy;
    r.error       = "Couldn't connect to server";
    r.status_code = 0;
    return r;
}

Response http_status(long code) {
    Response r;
    r.status_code = code;
    r.success     = code >= 200 && code < 400;
    return r;
}

ProxyDescriptor make(const std::string& endpoint, int threshold = 3, int timeout = 30) {
    ProxyDescriptor d;
    d.endpoint          = endpoint;
    d.failure_threshold = threshold;
    d.timeout_seconds   = timeout;
    return d;
}

class FetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        Rotor::Core::Logger::set_level(Rotor::Core::LOG_NONE);
        config.backoff = [](int) { return std::chrono::milliseconds(0); };
    }
    void TearDown() override {
        Rotor::Core::Logger::set_level(Rotor::Core::LOG_ALL);
    }

    ClientFactory factory() {
        return [this]() { return std::make_unique<FakeClient>(script); };
    }

    Script        script;
    FetcherConfig config;
    TimePoint     now{};
};

}  // namespace

TEST_F(FetcherTest, ClassifiesProxyFailures) {
    EXPECT_TRUE(Fetcher::is_proxy_failure(proxy_error()));
    EXPECT_TRUE(Fetcher::is_proxy_failure(http_status(403)));
    EXPECT_TRUE(Fetcher::is_proxy_failure(http_status(407)));
    EXPECT_TRUE(Fetcher::is_proxy_failure(http_status(429)));

    Response timeout;
    timeout.error_type = ErrorType::Timeout;
    EXPECT_TRUE(Fetcher::is_proxy_failure(timeout));

    // Client-side setup failures are not the proxy's fault.
    Response local;
    local.error_type  = ErrorType::Other;
    local.status_code = 0;
    EXPECT_FALSE(Fetcher::is_proxy_failure(local));

    EXPECT_FALSE(Fetcher::is_proxy_failure(http_status(200)));
    EXPECT_FALSE(Fetcher::is_proxy_failure(http_status(404)));
    EXPECT_FALSE(Fetcher::is_proxy_failure(http_status(500)));
}

TEST_F(FetcherTest, BackoffDoublesAndSaturates) {
    using std::chrono::milliseconds;
    EXPECT_EQ(Rotor::Core::get_backoff_time(0), milliseconds(0));
    EXPECT_EQ(Rotor::Core::get_backoff_time(1), milliseconds(1000));
    EXPECT_EQ(Rotor::Core::get_backoff_time(2), milliseconds(2000));
    EXPECT_EQ(Rotor::Core::get_backoff_time(3), milliseconds(4000));
    EXPECT_EQ(Rotor::Core::get_backoff_time(7), milliseconds(64000));
    EXPECT_EQ(Rotor::Core::get_backoff_time(23), milliseconds(64000));
    EXPECT_EQ(Rotor::Core::get_backoff_time(1000), milliseconds(64000));
}

TEST_F(FetcherTest, LocalClientFailureDoesNotPenalizeProxy) {
    Response local;
    local.error_type              = ErrorType::Other;
    local.error                   = "Failed to initialize CURL handle";
    script.by_proxy["http://p:1"] = local;
    config.attempts               = 1;
    ProxyRotationManager pool({make("p:1", 1)}, [this]() { return now; });
    Fetcher              fetcher(pool, factory(), config);

    FakeClient client(script);
    EXPECT_FALSE(fetcher.fetch(client, "https://example.com/"));
    EXPECT_EQ(pool.stats().failure_counts.at(0), 0);
}

TEST_F(FetcherTest, UsesSelectedProxyAndTimeout) {
    ProxyDescriptor d = make("10.0.0.1:8080", 3, 7);
    d.username        = "a";
    d.password        = "b";
    ProxyRotationManager pool({d}, [this]() { return now; });
    Fetcher              fetcher(pool, factory(), config);

    FakeClient client(script);
    EXPECT_TRUE(fetcher.fetch(client, "https://example.com/"));

    ASSERT_EQ(script.requests.size(), 1u);
    EXPECT_EQ(script.requests[0].first, "http://a:b@10.0.0.1:8080");
    EXPECT_EQ(script.requests[0].second, 7);
}

TEST_F(FetcherTest, DirectWhenPoolIsEmpty) {
    ProxyRotationManager pool(std::vector<ProxyDescriptor>{});
    Fetcher              fetcher(pool, factory(), config);

    FakeClient client(script);
    EXPECT_TRUE(fetcher.fetch(client, "https://example.com/"));
    ASSERT_EQ(script.requests.size(), 1u);
    EXPECT_EQ(script.requests[0].first, "");
}

TEST_F(FetcherTest, RetriesOnNextProxyAndReportsOutcome) {
    script.by_proxy["http://bad:1"] = proxy_error();
    ProxyRotationManager pool({make("bad:1", 2), make("good:2", 2)}, [this]() { return now; });
    Fetcher              fetcher(pool, factory(), config);

    FakeClient client(script);
    EXPECT_TRUE(fetcher.fetch(client, "https://example.com/"));

    ASSERT_EQ(script.requests.size(), 2u);
    EXPECT_EQ(script.requests[0].first, "http://bad:1");
    EXPECT_EQ(script.requests[1].first, "http://good:2");

    auto stats = pool.stats();
    EXPECT_EQ(stats.failure_counts.at(0), 1);
    EXPECT_EQ(stats.failure_counts.at(1), 0);
}

TEST_F(FetcherTest, GivesUpAfterConfiguredAttempts) {
    script.by_proxy["http://bad:1"] = http_status(429);
    config.attempts                 = 2;
    // Each select sees a clock one second later, so the proxy is never cooling down.
    ProxyRotationManager pool({make("bad:1", 5)}, [this]() {
        now += std::chrono::seconds(1);
        return now;
    });
    Fetcher              fetcher(pool, factory(), config);

    FakeClient client(script);
    EXPECT_FALSE(fetcher.fetch(client, "https://example.com/"));
    EXPECT_EQ(script.requests.size(), 2u);
    EXPECT_EQ(pool.stats().failure_counts.at(0), 2);
}

TEST_F(FetcherTest, OriginErrorsDoNotPenalizeProxy) {
    script.by_proxy["http://p:1"] = http_status(500);
    config.attempts               = 1;
    ProxyRotationManager pool({make("p:1", 1)}, [this]() { return now; });
    Fetcher              fetcher(pool, factory(), config);

    FakeClient client(script);
    EXPECT_FALSE(fetcher.fetch(client, "https://example.com/"));
    EXPECT_EQ(pool.stats().unhealthy, 0u);
}

TEST_F(FetcherTest, RunFetchesEveryUrlConcurrently) {
    script.by_proxy["http://p3:3"] = proxy_error();
    std::vector<ProxyDescriptor> descriptors = {make("p1:1"), make("p2:2"), make("p3:3")};
    ProxyRotationManager         pool(descriptors);
    config.threads  = 4;
    config.attempts = 5;
    Fetcher fetcher(pool, factory(), config);

    std::vector<std::string> urls;
    for (int i = 0; i < 24; ++i)
        urls.push_back("https://example.com/" + std::to_string(i));

    FetchSummary summary = fetcher.run(urls);
    EXPECT_EQ(summary.succeeded + summary.failed, urls.size());
    EXPECT_GE(script.requests.size(), urls.size());
    EXPECT_EQ(pool.stats().total, 3u);
}

TEST_F(FetcherTest, RequiresClientFactory) {
    ProxyRotationManager pool(std::vector<ProxyDescriptor>{});
    EXPECT_THROW(Fetcher(pool, ClientFactory{}, config), std::invalid_argument);
}
