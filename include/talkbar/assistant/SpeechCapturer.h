#pragma once

#include "talkbar/assistant/Collaborators.h"
#include "talkbar/assistant/ConfigManager.h"
#include "talkbar/assistant/ErrorHandler.h"
#include "talkbar/assistant/SpeechService.h"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace talkbar::assistant {

struct EndpointerConfig {
    float startThresholdDb{-41.0f};    // 低于该能量视为静音
    std::uint32_t startHoldMs{120};    // 超过阈值需持续多久才算开口
    std::uint32_t pauseMs{1500};       // 开口后静音多久结束一句
    std::uint32_t listenTimeoutMs{10000}; // 等待开口的上限，0 表示不限
    std::uint32_t phraseTimeLimitMs{30000}; // 单句时长上限，0 表示不限
    std::uint32_t calibrationMs{500};  // 启动时采样环境噪声
    float noiseMarginDb{6.0f};         // 环境噪声之上的余量

    static EndpointerConfig fromConfig(const ConfigManager& cfg);
};

/**
 * @brief 基于能量的语音端点检测（纯计算，不接触设备）
 *
 * Calibrating -> Waiting -> Speaking -> Ended
 * 校准期结束后阈值取 max(startThresholdDb, 环境均值 + noiseMarginDb)。
 */
class Endpointer {
public:
    enum class State {
        Calibrating,
        Waiting,
        Speaking,
        Ended,
    };

    enum class EndReason {
        None,
        Pause,         // 说完后停顿
        PhraseLimit,   // 达到单句上限
        ListenTimeout, // 一直没开口
    };

    Endpointer(const EndpointerConfig& cfg, std::uint32_t sampleRate);

    /**
     * @brief 喂入一块音频的能量
     * @param dbfs 该块的 dBFS
     * @param frames 该块帧数
     */
    State feed(float dbfs, std::uint32_t frames);
    void reset();

    State state() const { return m_state; }
    EndReason endReason() const { return m_endReason; }
    float threshold() const { return m_threshold; }
    // 语音起点（相对开始的帧偏移），未开口时为 0
    std::uint64_t speechStartFrame() const { return m_speechStartFrame; }
    std::uint64_t totalFrames() const { return m_totalFrames; }

private:
    std::uint64_t msToFrames(std::uint32_t ms) const;

    EndpointerConfig m_cfg;
    std::uint32_t m_sampleRate;
    State m_state{State::Waiting};
    EndReason m_endReason{EndReason::None};
    float m_threshold;

    std::uint64_t m_totalFrames{0};
    std::uint64_t m_calibFrames{0};
    double m_calibDbSum{0.0};
    std::uint64_t m_calibChunks{0};
    std::uint64_t m_waitFrames{0};
    std::uint64_t m_aboveFrames{0};
    std::uint64_t m_speechFrames{0};
    std::uint64_t m_silentFrames{0};
    std::uint64_t m_speechStartFrame{0};
};

/**
 * @brief 麦克风采集 + STT 的 Capturer 实现
 *
 * 每次 capture 打开默认输入设备（16kHz/S16/单声道），端点检测结束后编码 WAV 上传识别。
 * 新的 token 开始采集或 interrupt 覆盖该 token 时，采集尽快放弃，且不再上传识别。
 */
class SpeechCapturer : public Capturer {
public:
    SpeechCapturer(const ConfigManager& cfg, const SpeechService& speech, const ErrorHandler& logger);

    std::string capture(GenerationToken token, const ListeningCallback& onListening) override;
    void interrupt(GenerationToken token) override;

    const EndpointerConfig& endpointerConfig() const { return m_endpointCfg; }

private:
    std::vector<std::uint8_t> recordUtterance(GenerationToken token, const ListeningCallback& onListening);
    bool abandoned(GenerationToken token) const;

    const SpeechService& m_speech;
    const ErrorHandler& m_logger;
    EndpointerConfig m_endpointCfg;
    std::uint32_t m_sampleRate;
    std::atomic<GenerationToken> m_latest{0};
    std::atomic<GenerationToken> m_interruptedUpTo{0};
};

} // namespace talkbar::assistant
