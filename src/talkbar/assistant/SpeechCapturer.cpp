#include "talkbar/assistant/SpeechCapturer.h"

#include "talkbar/assistant/utils/AudioProcessor.h"
#include "talkbar/assistant/utils/StringUtils.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace talkbar::assistant {

using LogLevel = ErrorHandler::LogLevel;

namespace {

// 语音起点之前保留的片段，避免吞掉首音
constexpr std::uint32_t kPreRollMs = 300;
// 设备一直不回调数据时判定为设备故障
constexpr auto kNoDataTimeout = std::chrono::milliseconds(3000);
constexpr auto kPollInterval = std::chrono::milliseconds(50);

std::uint32_t nonNegative(int v) {
    return v < 0 ? 0u : static_cast<std::uint32_t>(v);
}

} // namespace

// ========== EndpointerConfig ==========

EndpointerConfig EndpointerConfig::fromConfig(const ConfigManager& cfg) {
    EndpointerConfig c;
    c.startThresholdDb = static_cast<float>(cfg.getDouble("stt.start_threshold_db", c.startThresholdDb));
    c.startHoldMs = nonNegative(cfg.getInt("stt.start_hold_ms", static_cast<int>(c.startHoldMs)));
    c.pauseMs = nonNegative(cfg.getInt("stt.pause_ms", static_cast<int>(c.pauseMs)));
    c.listenTimeoutMs = nonNegative(cfg.getInt("stt.listen_timeout_ms", static_cast<int>(c.listenTimeoutMs)));
    c.phraseTimeLimitMs = nonNegative(cfg.getInt("stt.phrase_time_limit_ms", static_cast<int>(c.phraseTimeLimitMs)));
    c.calibrationMs = nonNegative(cfg.getInt("stt.calibration_ms", static_cast<int>(c.calibrationMs)));
    return c;
}

// ========== Endpointer ==========

Endpointer::Endpointer(const EndpointerConfig& cfg, std::uint32_t sampleRate)
    : m_cfg(cfg)
    , m_sampleRate(sampleRate == 0 ? 16000 : sampleRate)
    , m_threshold(cfg.startThresholdDb)
{
    reset();
}

void Endpointer::reset() {
    m_state = m_cfg.calibrationMs > 0 ? State::Calibrating : State::Waiting;
    m_endReason = EndReason::None;
    m_threshold = m_cfg.startThresholdDb;
    m_totalFrames = 0;
    m_calibFrames = 0;
    m_calibDbSum = 0.0;
    m_calibChunks = 0;
    m_waitFrames = 0;
    m_aboveFrames = 0;
    m_speechFrames = 0;
    m_silentFrames = 0;
    m_speechStartFrame = 0;
}

std::uint64_t Endpointer::msToFrames(std::uint32_t ms) const {
    return static_cast<std::uint64_t>(ms) * m_sampleRate / 1000ULL;
}

Endpointer::State Endpointer::feed(float dbfs, std::uint32_t frames) {
    if (m_state == State::Ended || frames == 0) {
        return m_state;
    }
    m_totalFrames += frames;

    switch (m_state) {
    case State::Calibrating:
        m_calibFrames += frames;
        m_calibDbSum += dbfs;
        ++m_calibChunks;
        if (m_calibFrames >= msToFrames(m_cfg.calibrationMs)) {
            const float ambient = static_cast<float>(m_calibDbSum / static_cast<double>(m_calibChunks));
            m_threshold = std::max(m_cfg.startThresholdDb, ambient + m_cfg.noiseMarginDb);
            m_state = State::Waiting;
        }
        break;

    case State::Waiting:
        m_waitFrames += frames;
        if (dbfs >= m_threshold) {
            m_aboveFrames += frames;
            if (m_aboveFrames >= msToFrames(m_cfg.startHoldMs)) {
                m_state = State::Speaking;
                m_speechStartFrame = m_totalFrames - m_aboveFrames;
                m_speechFrames = m_aboveFrames;
                m_silentFrames = 0;
                break;
            }
        } else {
            m_aboveFrames = 0;
        }
        if (m_cfg.listenTimeoutMs > 0 && m_waitFrames >= msToFrames(m_cfg.listenTimeoutMs)) {
            m_state = State::Ended;
            m_endReason = EndReason::ListenTimeout;
        }
        break;

    case State::Speaking:
        m_speechFrames += frames;
        if (dbfs < m_threshold) {
            m_silentFrames += frames;
        } else {
            m_silentFrames = 0;
        }
        if (m_silentFrames >= msToFrames(m_cfg.pauseMs)) {
            m_state = State::Ended;
            m_endReason = EndReason::Pause;
        } else if (m_cfg.phraseTimeLimitMs > 0 && m_speechFrames >= msToFrames(m_cfg.phraseTimeLimitMs)) {
            m_state = State::Ended;
            m_endReason = EndReason::PhraseLimit;
        }
        break;

    case State::Ended:
        break;
    }
    return m_state;
}

// ========== SpeechCapturer ==========

SpeechCapturer::SpeechCapturer(const ConfigManager& cfg, const SpeechService& speech, const ErrorHandler& logger)
    : m_speech(speech)
    , m_logger(logger)
    , m_endpointCfg(EndpointerConfig::fromConfig(cfg))
    , m_sampleRate(nonNegative(cfg.getInt("stt.sample_rate", 16000)))
{
    if (m_sampleRate == 0) m_sampleRate = 16000;
}

bool SpeechCapturer::abandoned(GenerationToken token) const {
    return m_latest.load() != token || token <= m_interruptedUpTo.load();
}

void SpeechCapturer::interrupt(GenerationToken token) {
    auto current = m_interruptedUpTo.load();
    while (current < token && !m_interruptedUpTo.compare_exchange_weak(current, token)) {
    }
    m_logger.log(LogLevel::Debug, "Capture interrupted up to token " + std::to_string(token));
}

std::vector<std::uint8_t> SpeechCapturer::recordUtterance(GenerationToken token,
                                                         const ListeningCallback& onListening) {
    utils::AudioStreamConfig stream;
    stream.format = utils::AudioFormat::S16;
    stream.sampleRate = m_sampleRate;
    stream.channels = 1;

    // 回调引用以下局部对象，必须先于 audio 构造、晚于 audio 析构
    std::mutex mu;
    std::condition_variable cv;
    Endpointer endpointer(m_endpointCfg, m_sampleRate);

    const std::uint64_t budgetMs = static_cast<std::uint64_t>(m_endpointCfg.calibrationMs) +
                                   m_endpointCfg.listenTimeoutMs + m_endpointCfg.phraseTimeLimitMs + 1000;

    utils::CaptureOptions opts;
    opts.stream = stream;
    opts.useDeviceDefault = false;
    opts.storeInMemory = true;
    opts.maxFramesInBuffer = static_cast<std::size_t>(budgetMs * m_sampleRate / 1000ULL);
    opts.onData = [&](const void* pcm, std::size_t bytes, std::uint32_t frames) {
        const auto st = utils::AudioProcessor::analyzePcm(stream, pcm, bytes);
        std::lock_guard<std::mutex> lk(mu);
        if (endpointer.feed(st.dbfs, frames) == Endpointer::State::Ended) {
            cv.notify_all();
        }
    };

    utils::AudioProcessor audio;
    if (!audio.startCapture(opts)) {
        const auto err = audio.lastError();
        const bool denied = err.has_value() && err->code == utils::AudioErrorCode::PermissionDenied;
        auto info = ErrorInfo::make(denied ? ErrorType::PermissionDenied : ErrorType::DeviceError,
                                    err.has_value() ? err->message : "microphone unavailable");
        throw CaptureError(std::move(info));
    }
    m_logger.log(LogLevel::Debug, "Capture " + std::to_string(token) + ": microphone open");

    const auto startedAt = std::chrono::steady_clock::now();
    bool abandonedEarly = false;
    bool noData = false;
    bool announced = false;
    Endpointer::EndReason reason = Endpointer::EndReason::None;
    std::uint64_t speechStart = 0;
    float threshold = 0.0f;
    {
        std::unique_lock<std::mutex> lk(mu);
        while (endpointer.state() != Endpointer::State::Ended) {
            if (abandoned(token)) {
                abandonedEarly = true;
                break;
            }
            if (!announced && endpointer.state() != Endpointer::State::Calibrating) {
                announced = true;
                if (onListening) {
                    lk.unlock();
                    onListening();
                    lk.lock();
                    continue;
                }
            }
            if (endpointer.totalFrames() == 0 && std::chrono::steady_clock::now() - startedAt >= kNoDataTimeout) {
                noData = true;
                break;
            }
            cv.wait_for(lk, kPollInterval);
        }
        reason = endpointer.endReason();
        speechStart = endpointer.speechStartFrame();
        threshold = endpointer.threshold();
    }
    audio.stopCapture();

    if (abandonedEarly) {
        throw CaptureError(ErrorInfo::make(ErrorType::UnknownError, "capture abandoned by cancel or a newer activation"));
    }
    if (noData) {
        throw CaptureError(ErrorInfo::make(ErrorType::DeviceError, "microphone delivered no audio"));
    }
    if (reason == Endpointer::EndReason::ListenTimeout) {
        auto info = ErrorInfo::make(ErrorType::NoSpeech, "no speech before listen timeout");
        info.addContext("threshold_db", std::to_string(threshold));
        throw CaptureError(std::move(info));
    }

    const auto captured = audio.capturedBuffer();
    const std::size_t bytesPerFrame = sizeof(std::int16_t) * std::max<std::uint32_t>(1, captured.stream.channels);
    const std::uint64_t preRoll = static_cast<std::uint64_t>(kPreRollMs) * m_sampleRate / 1000ULL;
    const std::uint64_t fromFrame = speechStart > preRoll ? speechStart - preRoll : 0;
    const std::size_t offset = std::min(captured.data.size(), static_cast<std::size_t>(fromFrame) * bytesPerFrame);
    std::vector<std::uint8_t> utterance(captured.data.begin() + static_cast<std::ptrdiff_t>(offset), captured.data.end());

    auto wav = utils::AudioProcessor::encodeWav(captured.stream, utterance);
    if (!wav.has_value()) {
        throw CaptureError(ErrorInfo::make(ErrorType::AudioError, "failed to encode captured audio"));
    }
    m_logger.log(LogLevel::Debug, "Capture " + std::to_string(token) + ": " + std::to_string(utterance.size()) +
                                      " bytes of speech, end reason " +
                                      (reason == Endpointer::EndReason::PhraseLimit ? "phrase_limit" : "pause"));
    return std::move(*wav);
}

std::string SpeechCapturer::capture(GenerationToken token, const ListeningCallback& onListening) {
    m_latest.store(token);
    // 派发之前就已被取消：不打开麦克风
    if (abandoned(token)) {
        throw CaptureError(ErrorInfo::make(ErrorType::UnknownError, "capture abandoned before recording"));
    }
    const auto wav = recordUtterance(token, onListening);
    if (abandoned(token)) {
        throw CaptureError(ErrorInfo::make(ErrorType::UnknownError, "capture abandoned before transcription"));
    }

    ErrorInfo err;
    const auto result = m_speech.speechToText(wav, &err);
    if (!result.has_value()) {
        throw CaptureError(std::move(err));
    }

    auto text = utils::trimCopy(result->text);
    if (text.empty()) {
        throw CaptureError(ErrorInfo::make(ErrorType::NoSpeech, "speech was not understood"));
    }
    return text;
}

} // namespace talkbar::assistant
