#pragma once

#include "talkbar/assistant/APIClient.h"
#include "talkbar/assistant/Collaborators.h"
#include "talkbar/assistant/ConfigManager.h"
#include "talkbar/assistant/types/ChatMessage.h"
#include "talkbar/assistant/types/RequestResponse.h"

#include <atomic>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace talkbar::assistant {

/**
 * @brief 滚动对话历史：按 user/assistant 成对追加，超出上限时丢弃最早的消息
 */
class ConversationHistory {
public:
    explicit ConversationHistory(size_t maxMessages = 40);

    void appendTurn(const std::string& user, const std::string& assistant);
    std::vector<types::ChatMessage> snapshot() const;
    size_t size() const;
    void clear();

    size_t maxMessages() const { return m_maxMessages; }

private:
    mutable std::mutex m_mu;
    size_t m_maxMessages;
    std::vector<types::ChatMessage> m_messages;
};

/**
 * @brief 基于 APIClient 的推理协作者
 *
 * 请求 = [system_prompt] + 历史 + 本轮用户输入；成功后把本轮写入历史。
 * 已被 interrupt 覆盖的 token 不写入历史（用户取消的轮次不进入上下文）。
 * 失败统一转换为 InferenceError。
 */
class ChatInferencer : public Inferencer {
public:
    explicit ChatInferencer(const ConfigManager& cfg);

    std::string query(const std::string& transcript, GenerationToken token) override;
    void interrupt(GenerationToken token) override;

    types::ChatRequest buildRequest(const std::string& transcript) const;

    // 将 APIClient 错误映射为阶段错误；不可达/超时保留类型供文案选择
    static InferenceError toInferenceError(const ErrorInfo& info);

    ConversationHistory& history() { return m_history; }

private:
    APIClient m_client;
    std::string m_model;
    std::optional<float> m_temperature;
    std::optional<uint32_t> m_maxTokens;
    std::string m_systemPrompt;
    ConversationHistory m_history;
    std::atomic<GenerationToken> m_interruptedUpTo{0};
};

} // namespace talkbar::assistant
