#pragma once

#include "talkbar/assistant/types/ChatMessage.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace talkbar::assistant::types {

struct ChatRequest {
    std::string model;
    std::vector<ChatMessage> messages;
    std::optional<float> temperature;
    std::optional<uint32_t> maxTokens;

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["model"] = model;
        nlohmann::json ms = nlohmann::json::array();
        for (const auto& m : messages) ms.push_back(m.toJson());
        j["messages"] = std::move(ms);
        if (temperature.has_value()) j["temperature"] = *temperature;
        if (maxTokens.has_value()) j["max_tokens"] = *maxTokens;
        return j;
    }
};

struct ChatResponse {
    std::string content;
    std::optional<std::string> finishReason;

    // choices[0].message.content；没有 choices 时返回 nullopt
    static std::optional<ChatResponse> fromJson(const nlohmann::json& j) {
        if (!j.is_object()) return std::nullopt;
        if (!j.contains("choices") || !j["choices"].is_array() || j["choices"].empty() ||
            !j["choices"][0].is_object()) {
            return std::nullopt;
        }

        ChatResponse r;
        const auto& c0 = j["choices"][0];
        if (c0.contains("finish_reason") && c0["finish_reason"].is_string())
            r.finishReason = c0["finish_reason"].get<std::string>();
        if (c0.contains("message") && c0["message"].is_object()) {
            const auto& msg = c0["message"];
            if (msg.contains("content") && msg["content"].is_string())
                r.content = msg["content"].get<std::string>();
        }
        return r;
    }
};

} // namespace talkbar::assistant::types
