#include "talkbar/assistant/APIClient.h"

#include "talkbar/assistant/ErrorHandler.h"
#include "talkbar/assistant/utils/HttpClient.h"
#include "talkbar/assistant/utils/HttpTypes.h"

#include <optional>
#include <string>

namespace talkbar::assistant {

using talkbar::assistant::types::ChatRequest;
using talkbar::assistant::types::ChatResponse;
using talkbar::assistant::utils::HttpClient;
using talkbar::assistant::utils::HttpMethod;
using talkbar::assistant::utils::HttpRequest;

static std::string joinUrl(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;
    if (base.back() == '/' && path.front() == '/') return base.substr(0, base.size() - 1) + path;
    if (base.back() != '/' && path.front() != '/') return base + "/" + path;
    return base + path;
}

static void enrichErrorInfoContext(ErrorInfo& info, const std::string& model, const std::string& endpoint) {
    // 不写入 api_key / Authorization
    info.addContext("model", model);
    info.addContext("endpoint", endpoint);
}

APIClient::ApiClientError::ApiClientError(const ErrorInfo& info)
    : std::runtime_error(info.message)
    , m_info(info)
{}

APIClient::APIClient(const ConfigManager& cfg) {
    m_baseUrl = cfg.getString("llm.base_url", "http://localhost:4000/v1");
    if (m_baseUrl.empty()) m_baseUrl = "http://localhost:4000/v1";

    m_apiKey = cfg.getString("llm.api_key");
    // 未解析的占位符视为未配置
    if (ConfigManager::looksLikeEnvPlaceholder(m_apiKey)) m_apiKey.clear();

    m_timeoutMs = cfg.getInt("llm.timeout_ms", 60000);
    if (m_timeoutMs <= 0) m_timeoutMs = 60000;
    m_maxRetries = cfg.getInt("llm.max_retries", 1);
    if (m_maxRetries < 0) m_maxRetries = 0;
}

std::string APIClient::getApiKeyRedacted() const {
    return ConfigManager::redactSensitive("llm.api_key", m_apiKey);
}

ChatResponse APIClient::chat(const ChatRequest& req) {
    HttpClient client(m_baseUrl);
    client.setTimeout(m_timeoutMs);

    auto retry = client.getRetryConfig();
    retry.maxRetries = m_maxRetries;
    client.setRetryConfig(retry);

    const std::string endpoint = "/chat/completions";

    HttpRequest hreq;
    hreq.method = HttpMethod::POST;
    hreq.url = joinUrl(m_baseUrl, endpoint);
    hreq.body = req.toJson().dump();
    hreq.timeoutMs = m_timeoutMs;
    // execute() 不合并默认头，这里显式设置
    if (!m_apiKey.empty()) hreq.setHeader("Authorization", "Bearer " + m_apiKey);
    hreq.setHeader("Content-Type", "application/json");
    hreq.setHeader("Accept", "application/json");

    const auto resp = client.execute(hreq);
    if (!resp.isSuccess()) {
        auto info = ErrorHandler::fromHttpResponse(resp, std::optional<HttpRequest>{hreq});
        enrichErrorInfoContext(info, req.model, endpoint);
        throw ApiClientError(info);
    }

    auto parsed = resp.asJson();
    if (!parsed.has_value()) {
        ErrorInfo info;
        info.errorType = ErrorType::ServerError;
        info.errorCode = resp.statusCode;
        info.message = "Invalid JSON response";
        info.details = nlohmann::json{{"body_snippet", resp.body.substr(0, 1024)}};
        enrichErrorInfoContext(info, req.model, endpoint);
        throw ApiClientError(info);
    }

    auto r = ChatResponse::fromJson(*parsed);
    if (!r.has_value()) {
        ErrorInfo info;
        info.errorType = ErrorType::ServerError;
        info.errorCode = resp.statusCode;
        info.message = "Failed to parse ChatResponse";
        info.details = *parsed;
        enrichErrorInfoContext(info, req.model, endpoint);
        throw ApiClientError(info);
    }
    return *r;
}

} // namespace talkbar::assistant
