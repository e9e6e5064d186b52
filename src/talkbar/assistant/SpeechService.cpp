#include "talkbar/assistant/SpeechService.h"

#include "talkbar/assistant/ErrorHandler.h"
#include "talkbar/assistant/utils/HttpClient.h"
#include "talkbar/assistant/utils/HttpTypes.h"

#include <map>
#include <utility>

#include "nlohmann/json.hpp"

namespace talkbar::assistant {

namespace {

const char* const kDefaultBaseUrl = "http://localhost:4000/v1";

std::string joinUrl(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;
    if (base.back() == '/' && path.front() == '/') return base + path.substr(1);
    if (base.back() != '/' && path.front() != '/') return base + "/" + path;
    return base + path;
}

// 未配置或仍为占位符时回退到 llm.*
std::string resolveBaseUrl(const ConfigManager& cfg, const std::string& keyPath) {
    auto url = cfg.getString(keyPath);
    if (url.empty() || ConfigManager::looksLikeEnvPlaceholder(url)) {
        url = cfg.getString("llm.base_url", kDefaultBaseUrl);
    }
    if (url.empty()) url = kDefaultBaseUrl;
    return url;
}

std::string resolveApiKey(const ConfigManager& cfg, const std::string& keyPath) {
    auto key = cfg.getString(keyPath);
    if (key.empty() || ConfigManager::looksLikeEnvPlaceholder(key)) {
        key = cfg.getString("llm.api_key");
    }
    if (ConfigManager::looksLikeEnvPlaceholder(key)) key.clear();
    return key;
}

void fail(ErrorInfo* err, ErrorInfo info) {
    if (err != nullptr) *err = std::move(info);
}

} // namespace

SpeechService::SpeechService(const ConfigManager& cfg)
    : stt_(loadSTTConfig(cfg))
    , tts_(loadTTSConfig(cfg))
{}

SpeechService::STTConfig SpeechService::loadSTTConfig(const ConfigManager& cfg) {
    STTConfig config;
    config.baseUrl = resolveBaseUrl(cfg, "stt.base_url");
    config.apiKey = resolveApiKey(cfg, "stt.api_key");
    config.modelId = cfg.getString("stt.model", "whisper-1");
    const auto language = cfg.getString("stt.language", "th");
    if (!language.empty()) config.language = language;
    config.timeoutMs = cfg.getInt("stt.timeout_ms", 30000);
    if (config.timeoutMs <= 0) config.timeoutMs = 30000;
    return config;
}

SpeechService::TTSConfig SpeechService::loadTTSConfig(const ConfigManager& cfg) {
    TTSConfig config;
    config.baseUrl = resolveBaseUrl(cfg, "tts.base_url");
    config.apiKey = resolveApiKey(cfg, "tts.api_key");
    config.modelId = cfg.getString("tts.model", "tts-1");
    config.voice = cfg.getString("tts.voice", "th-TH-PremwadeeNeural");
    config.responseFormat = cfg.getString("tts.response_format", "mp3");
    if (auto j = cfg.get("tts.speed"); j && j->is_number()) {
        config.speed = j->get<float>();
    }
    config.timeoutMs = cfg.getInt("tts.timeout_ms", 30000);
    if (config.timeoutMs <= 0) config.timeoutMs = 30000;
    return config;
}

std::optional<SpeechService::STTResult> SpeechService::speechToText(const std::vector<std::uint8_t>& wavData,
                                                                    ErrorInfo* err) const {
    if (wavData.empty()) {
        fail(err, ErrorInfo::make(ErrorType::InvalidRequest, "STT: empty audio"));
        return std::nullopt;
    }

    utils::HttpClient client(stt_.baseUrl);
    client.setTimeout(stt_.timeoutMs);

    std::map<std::string, std::string> headers;
    if (!stt_.apiKey.empty()) headers["Authorization"] = "Bearer " + stt_.apiKey;

    std::map<std::string, std::string> fields;
    fields["model"] = stt_.modelId;
    if (stt_.language.has_value() && !stt_.language->empty()) {
        fields["language"] = *stt_.language;
    }

    utils::HttpClient::MultipartFile filePart;
    filePart.filename = "speech.wav";
    filePart.contentType = "audio/wav";
    filePart.data.assign(reinterpret_cast<const char*>(wavData.data()), wavData.size());

    std::map<std::string, utils::HttpClient::MultipartFile> files;
    files["file"] = std::move(filePart);

    const std::string endpoint = "/audio/transcriptions";
    const auto resp = client.postMultipart(joinUrl(stt_.baseUrl, endpoint), fields, files, headers);
    if (!resp.isSuccess()) {
        auto info = ErrorHandler::fromHttpResponse(resp);
        info.addContext("endpoint", endpoint);
        info.addContext("model", stt_.modelId);
        fail(err, std::move(info));
        return std::nullopt;
    }

    auto result = parseSTTResponse(resp.body);
    if (!result.has_value()) {
        auto info = ErrorInfo::make(ErrorType::ServerError, "Invalid STT response", resp.statusCode);
        info.details = nlohmann::json{{"body_snippet", resp.body.substr(0, 1024)}};
        info.addContext("endpoint", endpoint);
        fail(err, std::move(info));
        return std::nullopt;
    }
    return result;
}

std::optional<SpeechService::TTSResult> SpeechService::textToSpeech(const std::string& text, ErrorInfo* err) const {
    if (text.empty()) {
        fail(err, ErrorInfo::make(ErrorType::InvalidRequest, "TTS: empty text"));
        return std::nullopt;
    }

    utils::HttpClient client(tts_.baseUrl);
    client.setTimeout(tts_.timeoutMs);

    std::map<std::string, std::string> headers;
    if (!tts_.apiKey.empty()) headers["Authorization"] = "Bearer " + tts_.apiKey;
    headers["Accept"] = "audio/*";

    nlohmann::json body;
    body["model"] = tts_.modelId;
    body["input"] = text;
    if (!tts_.responseFormat.empty()) {
        body["response_format"] = tts_.responseFormat;
    }
    if (tts_.speed.has_value()) {
        body["speed"] = *tts_.speed;
    }
    if (!tts_.voice.empty()) {
        body["voice"] = tts_.voice;
    }
    body["stream"] = false;

    const std::string endpoint = "/audio/speech";
    const auto resp = client.post(joinUrl(tts_.baseUrl, endpoint), body.dump(), "application/json", headers);
    if (!resp.isSuccess()) {
        auto info = ErrorHandler::fromHttpResponse(resp);
        info.addContext("endpoint", endpoint);
        info.addContext("voice", tts_.voice);
        fail(err, std::move(info));
        return std::nullopt;
    }
    if (resp.body.empty() || resp.isJson()) {
        // 2xx 但返回 JSON 或空体，视为服务端异常
        auto info = ErrorInfo::make(ErrorType::ServerError, "TTS response carries no audio", resp.statusCode);
        info.details = nlohmann::json{{"body_snippet", resp.body.substr(0, 1024)}};
        info.addContext("endpoint", endpoint);
        fail(err, std::move(info));
        return std::nullopt;
    }

    TTSResult result;
    result.audioData.assign(reinterpret_cast<const std::uint8_t*>(resp.body.data()),
                            reinterpret_cast<const std::uint8_t*>(resp.body.data()) + resp.body.size());
    result.format = tts_.responseFormat;
    return result;
}

std::optional<SpeechService::STTResult> SpeechService::parseSTTResponse(const std::string& jsonResponse) {
    auto j = nlohmann::json::parse(jsonResponse, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    STTResult result;
    bool hasText = false;

    // OpenAI 兼容格式：{"text":"..."}
    if (j.contains("text") && j["text"].is_string()) {
        result.text = j["text"].get<std::string>();
        hasText = true;
    }

    // 嵌套格式：{"data":{"text":"..."}}
    if (!hasText && j.contains("data") && j["data"].is_object()) {
        const auto& d = j["data"];
        if (d.contains("text") && d["text"].is_string()) {
            result.text = d["text"].get<std::string>();
            hasText = true;
        }
    }
    if (!hasText) {
        return std::nullopt;
    }

    if (j.contains("duration") && j["duration"].is_number()) {
        result.duration = j["duration"].get<double>();
    }
    if (j.contains("language") && j["language"].is_string()) {
        result.language = j["language"].get<std::string>();
    }
    return result;
}

} // namespace talkbar::assistant
