#include "talkbar/assistant/SpeechSpeaker.h"

#include <algorithm>
#include <thread>
#include <utility>

namespace talkbar::assistant {

using LogLevel = ErrorHandler::LogLevel;

namespace {
constexpr auto kPollInterval = std::chrono::milliseconds(20);
}

SpeechSpeaker::SpeechSpeaker(const ConfigManager& cfg, const SpeechService& speech, const ErrorHandler& logger)
    : m_speech(speech)
    , m_logger(logger)
    , m_maxPlayback(std::chrono::milliseconds(std::max(1000, cfg.getInt("tts.max_playback_ms", 180000))))
{}

SpeechSpeaker::~SpeechSpeaker() {
    std::lock_guard<std::mutex> lk(m_mu);
    m_audio.shutdown();
}

bool SpeechSpeaker::ensureEngine() {
    if (m_audio.isInitialized()) {
        return true;
    }
    utils::AudioStreamConfig playback;
    playback.format = utils::AudioFormat::F32;
    return m_audio.initialize(playback);
}

void SpeechSpeaker::speak(const std::string& reply, GenerationToken token) {
    ErrorInfo err;
    const auto tts = m_speech.textToSpeech(reply, &err);
    if (!tts.has_value()) {
        throw PlaybackError(std::move(err));
    }

    std::uint32_t soundId = 0;
    {
        std::lock_guard<std::mutex> lk(m_mu);
        if (token <= m_interruptedUpTo) {
            m_logger.log(LogLevel::Debug, "Playback " + std::to_string(token) + " interrupted before start");
            return;
        }
        if (!ensureEngine()) {
            const auto audioErr = m_audio.lastError();
            throw PlaybackError(ErrorInfo::make(ErrorType::DeviceError,
                                                audioErr.has_value() ? audioErr->message : "audio output unavailable"));
        }
        const auto id = m_audio.playMemory(tts->audioData.data(), tts->audioData.size());
        if (!id.has_value()) {
            const auto audioErr = m_audio.lastError();
            auto info = ErrorInfo::make(ErrorType::AudioError,
                                        audioErr.has_value() ? audioErr->message : "playback failed");
            info.addContext("format", tts->format);
            throw PlaybackError(std::move(info));
        }
        soundId = *id;
        m_soundId = soundId;
        m_soundToken = token;
    }

    const auto deadline = std::chrono::steady_clock::now() + m_maxPlayback;
    for (;;) {
        std::this_thread::sleep_for(kPollInterval);
        std::lock_guard<std::mutex> lk(m_mu);
        if (!m_soundId.has_value() || *m_soundId != soundId) {
            return; // 已被 interrupt()
        }
        if (!m_audio.isPlaying(soundId)) {
            m_audio.stop(soundId);
            m_soundId.reset();
            return;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            m_audio.stop(soundId);
            m_soundId.reset();
            m_logger.log(LogLevel::Warning, "Playback " + std::to_string(token) + " cut at max_playback_ms");
            return;
        }
    }
}

void SpeechSpeaker::interrupt(GenerationToken token) {
    std::lock_guard<std::mutex> lk(m_mu);
    m_interruptedUpTo = std::max(m_interruptedUpTo, token);
    if (m_soundId.has_value() && m_soundToken <= token) {
        m_audio.stop(*m_soundId);
        m_soundId.reset();
        m_logger.log(LogLevel::Debug, "Playback " + std::to_string(m_soundToken) + " interrupted");
    }
}

} // namespace talkbar::assistant
