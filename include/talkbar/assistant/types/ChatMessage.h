#pragma once

#include <string>
#include <utility>

#include "nlohmann/json.hpp"

namespace talkbar::assistant::types {

enum class MessageRole {
    System,
    User,
    Assistant
};

inline std::string roleToString(MessageRole r) {
    switch (r) {
        case MessageRole::System: return "system";
        case MessageRole::User: return "user";
        case MessageRole::Assistant: return "assistant";
    }
    return "user";
}

/**
 * @brief 纯文本对话消息（OpenAI 兼容 {role, content}）
 */
struct ChatMessage {
    MessageRole role{MessageRole::User};
    std::string content;

    ChatMessage() = default;
    ChatMessage(MessageRole r, std::string text) : role(r), content(std::move(text)) {}

    nlohmann::json toJson() const {
        return nlohmann::json{
            {"role", roleToString(role)},
            {"content", content},
        };
    }
};

} // namespace talkbar::assistant::types
