#pragma once

#include "talkbar/assistant/ConfigManager.h"
#include "talkbar/assistant/ErrorTypes.h"
#include "talkbar/assistant/types/RequestResponse.h"

#include <stdexcept>
#include <string>

namespace talkbar::assistant {

/**
 * @brief OpenAI 兼容的 Chat Completions 客户端（同步）
 *
 * 读取 llm.base_url / llm.api_key / llm.timeout_ms / llm.max_retries；
 * 非 2xx 或响应无法解析时抛 ApiClientError。
 */
class APIClient {
public:
    class ApiClientError : public std::runtime_error {
    public:
        explicit ApiClientError(const ErrorInfo& info);
        const ErrorInfo& errorInfo() const { return m_info; }

    private:
        ErrorInfo m_info;
    };

    explicit APIClient(const ConfigManager& cfg);
    ~APIClient() = default;

    // 禁止拷贝/移动
    APIClient(const APIClient&) = delete;
    APIClient& operator=(const APIClient&) = delete;
    APIClient(APIClient&&) = delete;
    APIClient& operator=(APIClient&&) = delete;

    types::ChatResponse chat(const types::ChatRequest& req);

    // ========== 便于测试/诊断 ==========
    std::string getBaseUrl() const { return m_baseUrl; }
    std::string getApiKeyRedacted() const;
    int getTimeoutMs() const { return m_timeoutMs; }
    int getMaxRetries() const { return m_maxRetries; }

private:
    std::string m_baseUrl;
    std::string m_apiKey;
    int m_timeoutMs{60000};
    int m_maxRetries{1};
};

} // namespace talkbar::assistant
