#include "talkbar/assistant/ChatInferencer.h"

#include "talkbar/assistant/utils/StringUtils.h"

#include <algorithm>

namespace talkbar::assistant {

using types::ChatMessage;
using types::ChatRequest;
using types::MessageRole;

// ========== ConversationHistory ==========

ConversationHistory::ConversationHistory(size_t maxMessages)
    : m_maxMessages(maxMessages)
{}

void ConversationHistory::appendTurn(const std::string& user, const std::string& assistant) {
    std::lock_guard<std::mutex> lk(m_mu);
    if (m_maxMessages == 0) return;
    m_messages.emplace_back(MessageRole::User, user);
    m_messages.emplace_back(MessageRole::Assistant, assistant);
    if (m_messages.size() > m_maxMessages) {
        const auto drop = m_messages.size() - m_maxMessages;
        m_messages.erase(m_messages.begin(), m_messages.begin() + static_cast<std::ptrdiff_t>(drop));
    }
}

std::vector<ChatMessage> ConversationHistory::snapshot() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_messages;
}

size_t ConversationHistory::size() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_messages.size();
}

void ConversationHistory::clear() {
    std::lock_guard<std::mutex> lk(m_mu);
    m_messages.clear();
}

// ========== ChatInferencer ==========

ChatInferencer::ChatInferencer(const ConfigManager& cfg)
    : m_client(cfg)
    , m_model(cfg.getString("llm.model", "openclaw"))
    , m_systemPrompt(cfg.getString("llm.system_prompt"))
    , m_history(static_cast<size_t>(std::max(0, cfg.getInt("llm.history_messages", 40))))
{
    if (auto t = cfg.get("llm.temperature"); t.has_value() && t->is_number()) {
        m_temperature = t->get<float>();
    }
    const int maxTokens = cfg.getInt("llm.max_tokens", 1024);
    if (maxTokens > 0) m_maxTokens = static_cast<uint32_t>(maxTokens);
}

ChatRequest ChatInferencer::buildRequest(const std::string& transcript) const {
    ChatRequest req;
    req.model = m_model;
    req.temperature = m_temperature;
    req.maxTokens = m_maxTokens;
    if (!m_systemPrompt.empty()) {
        req.messages.emplace_back(MessageRole::System, m_systemPrompt);
    }
    for (auto& m : m_history.snapshot()) {
        req.messages.push_back(std::move(m));
    }
    req.messages.emplace_back(MessageRole::User, transcript);
    return req;
}

InferenceError ChatInferencer::toInferenceError(const ErrorInfo& info) {
    ErrorInfo mapped = info;
    switch (info.errorType) {
        case ErrorType::NetworkError:
        case ErrorType::TimeoutError:
            break;
        case ErrorType::RateLimitError:
        case ErrorType::InvalidRequest:
        case ErrorType::ServerError:
            // 后端错误响应：message 带上 HTTP 状态便于展示
            if (info.errorCode > 0) {
                mapped.message = "HTTP " + std::to_string(info.errorCode) + ": " + info.message;
            }
            break;
        default:
            break;
    }
    return InferenceError(std::move(mapped));
}

void ChatInferencer::interrupt(GenerationToken token) {
    auto current = m_interruptedUpTo.load();
    while (current < token && !m_interruptedUpTo.compare_exchange_weak(current, token)) {
    }
}

std::string ChatInferencer::query(const std::string& transcript, GenerationToken token) {
    if (token <= m_interruptedUpTo.load()) {
        throw InferenceError(ErrorInfo::make(ErrorType::UnknownError, "query abandoned before sending"));
    }
    const auto req = buildRequest(transcript);

    types::ChatResponse resp;
    try {
        resp = m_client.chat(req);
    } catch (const APIClient::ApiClientError& e) {
        throw toInferenceError(e.errorInfo());
    }

    auto reply = utils::trimCopy(resp.content);
    if (reply.empty()) {
        auto info = ErrorInfo::make(ErrorType::ServerError, "Empty reply from model");
        info.addContext("finish_reason", resp.finishReason.value_or(""));
        throw InferenceError(std::move(info));
    }

    // 请求期间被取消：回复照常返回（会被丢弃），但不进入历史
    if (token > m_interruptedUpTo.load()) {
        m_history.appendTurn(transcript, reply);
    }
    return reply;
}

} // namespace talkbar::assistant
