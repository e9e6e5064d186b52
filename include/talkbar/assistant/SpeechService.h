#pragma once

#include "talkbar/assistant/ConfigManager.h"
#include "talkbar/assistant/ErrorTypes.h"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace talkbar::assistant {

/**
 * @brief 语音服务：STT（语音转文本）与 TTS（文本转语音），均为同步 HTTP 调用
 *
 * STT：multipart/form-data 上传 WAV 到 /audio/transcriptions，响应 {"text": "..."}
 * TTS：JSON POST 到 /audio/speech，响应体即音频字节
 *
 * 失败返回 std::nullopt，若传入 err 则写入 ErrorInfo。
 */
class SpeechService {
public:
    struct STTConfig {
        std::string baseUrl;
        std::string apiKey;
        std::string modelId{"whisper-1"};
        std::optional<std::string> language; // 语言代码，如"th"、"en"
        int timeoutMs{30000};
    };

    struct STTResult {
        std::string text;                    // 识别文本，可能为空（听不懂）
        std::optional<double> duration;      // 音频时长（秒）
        std::optional<std::string> language; // 检测到的语言
    };

    struct TTSConfig {
        std::string baseUrl;
        std::string apiKey;
        std::string modelId{"tts-1"};
        std::string voice;
        std::string responseFormat{"mp3"}; // mp3/wav/flac
        std::optional<float> speed;        // 0.25-4.0
        int timeoutMs{30000};
    };

    struct TTSResult {
        std::vector<std::uint8_t> audioData;
        std::string format;
    };

    explicit SpeechService(const ConfigManager& cfg);
    ~SpeechService() = default;

    // 禁止拷贝/移动
    SpeechService(const SpeechService&) = delete;
    SpeechService& operator=(const SpeechService&) = delete;
    SpeechService(SpeechService&&) = delete;
    SpeechService& operator=(SpeechService&&) = delete;

    std::optional<STTResult> speechToText(const std::vector<std::uint8_t>& wavData, ErrorInfo* err = nullptr) const;
    std::optional<TTSResult> textToSpeech(const std::string& text, ErrorInfo* err = nullptr) const;

    const STTConfig& sttConfig() const { return stt_; }
    const TTSConfig& ttsConfig() const { return tts_; }

    /**
     * @brief 解析 STT 响应：{"text":"..."} 或 {"data":{"text":"..."}}
     * @return JSON 非法或缺少 text 字段时返回 std::nullopt；text 为空串时正常返回
     */
    static std::optional<STTResult> parseSTTResponse(const std::string& jsonResponse);

    static STTConfig loadSTTConfig(const ConfigManager& cfg);
    static TTSConfig loadTTSConfig(const ConfigManager& cfg);

private:
    STTConfig stt_;
    TTSConfig tts_;
};

} // namespace talkbar::assistant
