#include "talkbar/assistant/utils/HttpClient.h"
#include "talkbar/assistant/utils/HttpTypes.h"

#include "LoopbackServer.h"

#include <gtest/gtest.h>

#include <atomic>

using namespace talkbar::assistant::utils;

// 辅助：构造简单HttpRequest
static HttpRequest makeRequest(HttpMethod method, const std::string& url) {
    HttpRequest req;
    req.method = method;
    req.url = url;
    return req;
}

// 快速重试，避免测试等待
static RetryConfig fastRetry(int maxRetries) {
    RetryConfig cfg;
    cfg.maxRetries = maxRetries;
    cfg.initialDelay = std::chrono::milliseconds(1);
    cfg.maxDelay = std::chrono::milliseconds(2);
    cfg.enableJitter = false;
    return cfg;
}

namespace talkbar::assistant::utils {
class HttpClientTestAccessor {
public:
    static bool IsRetryable(HttpClient& c, const HttpResponse& r) {
        return c.isRetryableError(r);
    }
    static std::map<std::string, std::string> Merge(HttpClient& c,
        const std::map<std::string, std::string>& h) {
        return c.mergeHeaders(h);
    }
    static std::string FullUrl(HttpClient& c, const std::string& path) {
        return c.buildFullUrl(path);
    }
    static std::pair<std::string, std::string> Split(const std::string& url) {
        return HttpClient::splitUrl(url);
    }
    static std::string Multipart(const std::map<std::string, std::string>& fields,
                                 const std::map<std::string, HttpClient::MultipartFile>& files,
                                 const std::string& boundary) {
        return HttpClient::buildMultipartBody(fields, files, boundary);
    }
    static HttpResponse ExecOnce(HttpClient& c, const HttpRequest& r) {
        return c.executeOnce(r);
    }
};
} // namespace talkbar::assistant::utils

TEST(HttpClientTests, RetryClassification) {
    HttpClient client("https://example.com");

    HttpResponse resp0;  // statusCode 默认0 -> Network
    EXPECT_TRUE(HttpClientTestAccessor::IsRetryable(client, resp0));

    HttpResponse resp408; resp408.statusCode = 408;
    EXPECT_FALSE(HttpClientTestAccessor::IsRetryable(client, resp408));

    HttpResponse resp429; resp429.statusCode = 429;
    EXPECT_TRUE(HttpClientTestAccessor::IsRetryable(client, resp429));

    HttpResponse resp500; resp500.statusCode = 500;
    EXPECT_TRUE(HttpClientTestAccessor::IsRetryable(client, resp500));

    HttpResponse resp400; resp400.statusCode = 400;
    EXPECT_FALSE(HttpClientTestAccessor::IsRetryable(client, resp400));
}

TEST(HttpClientTests, TransportTimeoutFollowsRetryOnTimeout) {
    HttpClient client("https://example.com");
    HttpResponse timedOut;
    timedOut.error = "Request failed: error_code=4 (timeout after 3000ms)";
    EXPECT_FALSE(HttpClientTestAccessor::IsRetryable(client, timedOut));

    RetryConfig cfg = client.getRetryConfig();
    cfg.retryOnTimeout = true;
    client.setRetryConfig(cfg);
    EXPECT_TRUE(HttpClientTestAccessor::IsRetryable(client, timedOut));
}

TEST(HttpClientTests, MergeHeadersPrefersRequest) {
    HttpClient client("https://example.com");
    client.setDefaultHeader("User-Agent", "UA1");
    client.setDefaultHeader("X-Default", "d");
    std::map<std::string, std::string> reqHeaders = {{"User-Agent", "UA2"}, {"X-Test", "1"}};
    auto merged = HttpClientTestAccessor::Merge(client, reqHeaders);
    EXPECT_EQ(merged.at("User-Agent"), "UA2");
    EXPECT_EQ(merged.at("X-Test"), "1");
    EXPECT_EQ(merged.at("X-Default"), "d");
}

TEST(HttpClientTests, BuildFullUrlJoinsSlashes) {
    HttpClient slash("http://localhost:4000/v1/");
    EXPECT_EQ(HttpClientTestAccessor::FullUrl(slash, "/chat/completions"), "http://localhost:4000/v1/chat/completions");

    HttpClient plain("http://localhost:4000/v1");
    EXPECT_EQ(HttpClientTestAccessor::FullUrl(plain, "chat/completions"), "http://localhost:4000/v1/chat/completions");
    EXPECT_EQ(HttpClientTestAccessor::FullUrl(plain, "http://other:1/x"), "http://other:1/x");
    EXPECT_EQ(HttpClientTestAccessor::FullUrl(plain, ""), "http://localhost:4000/v1");
}

TEST(HttpClientTests, SplitUrlSeparatesOriginAndPath) {
    auto [o1, p1] = HttpClientTestAccessor::Split("http://127.0.0.1:4000/v1/audio/speech?x=1");
    EXPECT_EQ(o1, "http://127.0.0.1:4000");
    EXPECT_EQ(p1, "/v1/audio/speech?x=1");

    auto [o2, p2] = HttpClientTestAccessor::Split("https://example.com");
    EXPECT_EQ(o2, "https://example.com");
    EXPECT_EQ(p2, "/");

    auto [o3, p3] = HttpClientTestAccessor::Split("not a url");
    EXPECT_TRUE(o3.empty());
    EXPECT_TRUE(p3.empty());
}

TEST(HttpClientTests, MultipartBodyLayout) {
    HttpClient::MultipartFile file{"speech.wav", "audio/wav", "RIFF"};
    const auto body = HttpClientTestAccessor::Multipart({{"model", "whisper-1"}}, {{"file", file}}, "BOUND");
    EXPECT_EQ(body.rfind("--BOUND\r\nContent-Disposition: form-data; name=\"model\"\r\n\r\nwhisper-1\r\n", 0), 0u);
    EXPECT_NE(body.find("name=\"file\"; filename=\"speech.wav\"\r\nContent-Type: audio/wav\r\n\r\nRIFF\r\n"),
              std::string::npos);
    EXPECT_EQ(body.substr(body.size() - 11), "--BOUND--\r\n");
}

TEST(HttpClientTests, RetryDelayBacksOffAndClamps) {
    RetryConfig cfg;
    cfg.enableJitter = false;
    EXPECT_EQ(cfg.getRetryDelay(0).count(), 500);
    EXPECT_EQ(cfg.getRetryDelay(1).count(), 1000);
    EXPECT_EQ(cfg.getRetryDelay(3).count(), 4000);
    EXPECT_EQ(cfg.getRetryDelay(10).count(), 8000);
}

TEST(HttpClientTests, InvalidUrlFailsWithoutNetwork) {
    HttpClient client;
    auto resp = HttpClientTestAccessor::ExecOnce(client, makeRequest(HttpMethod::GET, "localhost/no-scheme"));
    EXPECT_EQ(resp.statusCode, 0);
    EXPECT_NE(resp.error.find("Invalid URL"), std::string::npos);
}

TEST(HttpClientTests, ServerErrorsAreRetriedUntilSuccess) {
    std::atomic<int> calls{0};
    mini_test::LoopbackServer srv;
    srv.server().Get("/v1/flaky", [&](const httplib::Request&, httplib::Response& res) {
        if (calls.fetch_add(1) < 2) {
            res.status = 503;
            res.set_content("busy", "text/plain");
            return;
        }
        res.set_content(R"({"ok":true})", "application/json");
    });
    ASSERT_TRUE(srv.start());

    HttpClient client(srv.baseUrl());
    client.setRetryConfig(fastRetry(2));
    auto resp = client.get("/flaky");
    EXPECT_EQ(resp.statusCode, 200);
    EXPECT_TRUE(resp.isJson());
    EXPECT_EQ(calls.load(), 3);

    auto stats = client.getRetryStats();
    EXPECT_EQ(stats.totalAttempts, 1);
    EXPECT_EQ(stats.totalRetries, 2);
    EXPECT_EQ(stats.totalSuccessAfterRetry, 1);
}

TEST(HttpClientTests, ClientErrorIsNotRetried) {
    std::atomic<int> calls{0};
    mini_test::LoopbackServer srv;
    srv.server().Post("/v1/bad", [&](const httplib::Request&, httplib::Response& res) {
        calls.fetch_add(1);
        res.status = 400;
        res.set_content(R"({"error":{"message":"bad"}})", "application/json");
    });
    ASSERT_TRUE(srv.start());

    HttpClient client(srv.baseUrl());
    client.setRetryConfig(fastRetry(3));
    auto resp = client.postJson("/bad", "{}");
    EXPECT_EQ(resp.statusCode, 400);
    EXPECT_FALSE(resp.isSuccess());
    EXPECT_EQ(calls.load(), 1);
}

TEST(HttpClientTests, DefaultHeadersAndContentTypeReachServer) {
    std::string agent;
    std::string contentType;
    mini_test::LoopbackServer srv;
    srv.server().Post("/v1/echo", [&](const httplib::Request& req, httplib::Response& res) {
        agent = req.get_header_value("User-Agent");
        contentType = req.get_header_value("Content-Type");
        res.set_content(req.body, "text/plain");
    });
    ASSERT_TRUE(srv.start());

    HttpClient client(srv.baseUrl());
    client.setDefaultHeader("User-Agent", "talkbar-test");
    auto resp = client.postJson("/echo", R"({"a":1})");
    ASSERT_EQ(resp.statusCode, 200);
    EXPECT_EQ(resp.body, R"({"a":1})");
    EXPECT_EQ(resp.getHeader("content-type").value_or(""), "text/plain");
    EXPECT_EQ(agent, "talkbar-test");
    EXPECT_EQ(contentType, "application/json");
}

TEST(HttpClientTests, ConnectionRefusedHasStatusZero) {
    int closedPort = 0;
    {
        mini_test::LoopbackServer srv;
        ASSERT_TRUE(srv.start());
        closedPort = srv.port();
    }
    HttpClient client("http://127.0.0.1:" + std::to_string(closedPort));
    client.setRetryConfig(fastRetry(0));
    client.setTimeout(1000);
    auto resp = client.get("/nothing");
    EXPECT_EQ(resp.statusCode, 0);
    EXPECT_FALSE(resp.error.empty());
}
