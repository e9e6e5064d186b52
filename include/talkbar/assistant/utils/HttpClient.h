#pragma once

#include "HttpTypes.h"

#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace talkbar::assistant::utils {

/**
 * @brief HTTP客户端封装类
 *
 * 同步请求 + 指数退避重试，基于cpp-httplib实现。
 * 每次请求按URL的 scheme://host:port 创建连接；助手场景请求稀疏，不做连接池。
 *
 * ```
 * HttpClient client("http://localhost:4000/v1");
 * auto resp = client.postJson("/chat/completions", body.dump());
 * if (!resp.isSuccess()) { ... resp.error / resp.statusCode ... }
 * ```
 */
class HttpClient {
public:
    explicit HttpClient(const std::string& baseUrl = "");
    ~HttpClient() = default;

    // 禁止拷贝与移动（含mutex，不可安全移动）
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) = delete;
    HttpClient& operator=(HttpClient&&) = delete;

    void setDefaultHeader(const std::string& key, const std::string& value);

    void setRetryConfig(const RetryConfig& config);
    RetryConfig getRetryConfig() const { return m_retryConfig; }

    /**
     * @brief 设置超时时间（毫秒），同时作用于连接与读取
     */
    void setTimeout(int timeoutMs);
    int getTimeout() const { return m_timeoutMs; }

    HttpResponse get(const std::string& path,
                     const std::map<std::string, std::string>& headers = {});

    HttpResponse post(const std::string& path,
                      const std::string& body,
                      const std::string& contentType = "application/json",
                      const std::map<std::string, std::string>& headers = {});

    HttpResponse postJson(const std::string& path,
                          const std::string& jsonBody,
                          const std::map<std::string, std::string>& headers = {});

    struct MultipartFile {
        std::string filename;
        std::string contentType;
        std::string data; // 内存数据
    };

    /**
     * @brief multipart/form-data POST
     */
    HttpResponse postMultipart(const std::string& path,
                               const std::map<std::string, std::string>& fields,
                               const std::map<std::string, MultipartFile>& files,
                               const std::map<std::string, std::string>& headers = {});

    /**
     * @brief 通用请求方法（带重试）
     */
    HttpResponse execute(const HttpRequest& request);

    RetryStatsSnapshot getRetryStats() const;

    // 测试辅助访问（gtest友元）
    friend class HttpClientTestAccessor;

private:
    HttpResponse executeWithRetry(const HttpRequest& request);
    HttpResponse executeOnce(const HttpRequest& request);

    std::string buildFullUrl(const std::string& path) const;
    bool isRetryableError(const HttpResponse& response) const;
    std::map<std::string, std::string> mergeHeaders(
        const std::map<std::string, std::string>& requestHeaders) const;

    // "http://host:port/a/b?x" -> {"http://host:port", "/a/b?x"}
    static std::pair<std::string, std::string> splitUrl(const std::string& url);
    static std::string buildMultipartBody(const std::map<std::string, std::string>& fields,
                                          const std::map<std::string, MultipartFile>& files,
                                          const std::string& boundary);
    static HttpErrorType classifyStatus(int statusCode);

    std::string m_baseUrl;
    mutable std::mutex m_headerMutex;
    std::map<std::string, std::string> m_defaultHeaders;
    RetryConfig m_retryConfig;
    int m_timeoutMs;
    RetryStats m_retryStats;
};

} // namespace talkbar::assistant::utils
