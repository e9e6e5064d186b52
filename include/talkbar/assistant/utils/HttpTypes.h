#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <map>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace talkbar::assistant::utils {

/**
 * @brief 助手用到的HTTP请求方法
 */
enum class HttpMethod {
    GET,
    POST
};

/**
 * @brief HTTP请求结构
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    std::map<std::string, std::string> headers;
    std::string body;
    int timeoutMs = 30000;

    void setHeader(const std::string& key, const std::string& value) {
        headers[key] = value;
    }

    std::optional<std::string> getHeader(const std::string& key) const {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }
        return std::nullopt;
    }
};

/**
 * @brief HTTP错误/状态分类
 */
enum class HttpErrorType {
    None,
    Network,       // statusCode == 0 or transport error
    Timeout,       // 408 or超时
    RateLimit,     // 429
    Client,        // 4xx
    Server,        // 5xx
};

inline std::string toLowerAscii(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

/**
 * @brief HTTP响应结构
 */
struct HttpResponse {
    int statusCode = 0;
    std::map<std::string, std::string> headers; // 小写键 -> 首值
    std::string body;
    std::string error;  // 传输层错误信息（如果有）

    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }

    /**
     * @brief 获取响应头（不区分大小写）
     */
    std::optional<std::string> getHeader(const std::string& key) const {
        auto it = headers.find(toLowerAscii(key));
        if (it != headers.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    bool isJson() const {
        auto ct = getHeader("Content-Type");
        return ct.has_value() && ct->find("application/json") != std::string::npos;
    }

    /**
     * @brief 按JSON解析body；失败返回 nullopt，并可写入错误信息
     */
    std::optional<nlohmann::json> asJson(std::string* parseError = nullptr) const {
        try {
            return nlohmann::json::parse(body);
        } catch (const nlohmann::json::parse_error& e) {
            if (parseError) *parseError = e.what();
            return std::nullopt;
        }
    }
};

/**
 * @brief 重试配置
 */
struct RetryConfig {
    int maxRetries = 2;                               // 最大重试次数
    std::chrono::milliseconds initialDelay{500};      // 初始延迟
    double backoffMultiplier = 2.0;                   // 退避倍数
    std::chrono::milliseconds maxDelay{8000};         // 最大延迟
    bool enableJitter = true;                         // 是否启用随机抖动
    bool retryOnRateLimit = true;                     // 是否对429重试
    bool retryOnServerError = true;                   // 是否对5xx重试
    bool retryOnTimeout = false;                      // 本地超时通常已等待很久，默认不重试

    /**
     * @brief 计算重试延迟
     * @param attempt 当前重试次数（从0开始）
     */
    std::chrono::milliseconds getRetryDelay(int attempt) const {
        const double scaled = static_cast<double>(initialDelay.count()) *
                              std::pow(backoffMultiplier, attempt);
        const auto clamped = std::min(scaled, static_cast<double>(maxDelay.count()));

        double withJitter = clamped;
        if (enableJitter) {
            const double jitterRange = clamped * 0.2;  // ±20%
            const double randomFactor = (std::rand() % 200 - 100) / 100.0; // -1..1
            withJitter += jitterRange * randomFactor;
        }

        const auto millis = static_cast<std::chrono::milliseconds::rep>(std::max(0.0, withJitter));
        return std::chrono::milliseconds{millis};
    }
};

struct RetryStatsSnapshot {
    int totalAttempts{0};
    int totalRetries{0};
    int totalSuccessAfterRetry{0};
};

struct RetryStats {
    std::atomic<int> totalAttempts{0};
    std::atomic<int> totalRetries{0};
    std::atomic<int> totalSuccessAfterRetry{0};

    RetryStats() = default;
    RetryStats(const RetryStats&) = delete;
    RetryStats& operator=(const RetryStats&) = delete;

    RetryStatsSnapshot snapshot() const {
        RetryStatsSnapshot snap;
        snap.totalAttempts = totalAttempts.load(std::memory_order_relaxed);
        snap.totalRetries = totalRetries.load(std::memory_order_relaxed);
        snap.totalSuccessAfterRetry = totalSuccessAfterRetry.load(std::memory_order_relaxed);
        return snap;
    }
};

} // namespace talkbar::assistant::utils
