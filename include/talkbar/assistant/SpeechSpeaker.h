#pragma once

#include "talkbar/assistant/Collaborators.h"
#include "talkbar/assistant/ConfigManager.h"
#include "talkbar/assistant/ErrorHandler.h"
#include "talkbar/assistant/SpeechService.h"
#include "talkbar/assistant/utils/AudioProcessor.h"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace talkbar::assistant {

/**
 * @brief TTS 合成 + 本地播放的 Speaker 实现
 *
 * speak() 阻塞到播放结束或被 interrupt()；播放引擎在首次使用时初始化。
 */
class SpeechSpeaker : public Speaker {
public:
    SpeechSpeaker(const ConfigManager& cfg, const SpeechService& speech, const ErrorHandler& logger);
    ~SpeechSpeaker() override;

    // 禁止拷贝/移动
    SpeechSpeaker(const SpeechSpeaker&) = delete;
    SpeechSpeaker& operator=(const SpeechSpeaker&) = delete;

    void speak(const std::string& reply, GenerationToken token) override;
    void interrupt(GenerationToken token) override;

private:
    bool ensureEngine();

    const SpeechService& m_speech;
    const ErrorHandler& m_logger;
    std::chrono::milliseconds m_maxPlayback;

    std::mutex m_mu;
    utils::AudioProcessor m_audio;
    // 当前播放：soundId 与所属 token
    std::optional<std::uint32_t> m_soundId;
    GenerationToken m_soundToken{0};
    // interrupt() 记下的最高 token，<= 它的播放都应停止
    GenerationToken m_interruptedUpTo{0};
};

} // namespace talkbar::assistant
