#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <miniaudio.h>

namespace talkbar::assistant::utils {

enum class AudioFormat {
    F32,
    S16,
};

enum class AudioErrorCode : std::uint8_t {
    None = 0,
    NotInitialized,
    InvalidArgs,
    DeviceInitFailed,
    DeviceStartFailed,
    DeviceStopFailed,
    PermissionDenied,
    DecoderFailed,
    EncoderFailed,
};

struct AudioError {
    AudioErrorCode code{AudioErrorCode::None};
    std::string message{};
};

struct AudioStats {
    double durationSeconds{0.0};
    std::uint64_t frames{0};
    std::uint32_t sampleRate{0};
    std::uint32_t channels{0};
    AudioFormat format{AudioFormat::S16};

    float peakAbs{0.0f}; // [0,1]
    float rms{0.0f};     // [0,1]
    float dbfs{-90.0f};

    bool isSilent{false};
};

struct AudioStreamConfig {
    AudioFormat format{AudioFormat::S16};
    std::uint32_t sampleRate{0};         // 0 表示使用设备默认采样率
    std::uint32_t channels{0};           // 0 表示使用设备默认声道数
    std::uint32_t periodSizeInFrames{0}; // 0 表示使用 miniaudio 默认值
};

struct PlaybackOptions {
    float volume{1.0f};
};

struct CaptureOptions {
    AudioStreamConfig stream{};
    bool useDeviceDefault{false}; // 若为 true，则忽略 stream 中的 rate/通道/format
    bool storeInMemory{true};
    std::size_t maxFramesInBuffer{16000 * 30};
    // 在音频线程中调用，回调内不得阻塞
    std::function<void(const void* pcm, std::size_t bytes, std::uint32_t frames)> onData;
    std::function<void(const AudioError& err)> onError;
};

struct CapturedBuffer {
    AudioStreamConfig stream{};
    std::vector<std::uint8_t> data;
};

/**
 * @brief 基于 miniaudio 的轻量音频处理器
 * - 内存播放：播放、查询、停止（TTS 返回的 mp3/wav 字节）
 * - 录音：启动/停止录音，数据回调，内存缓存
 * - 纯内存分析与 WAV 编码，便于测试
 */
class AudioProcessor {
public:
    AudioProcessor();
    ~AudioProcessor();

    AudioProcessor(const AudioProcessor&) = delete;
    AudioProcessor& operator=(const AudioProcessor&) = delete;

    bool initialize(const AudioStreamConfig& playbackConfig = {});
    void shutdown();
    bool isInitialized() const { return initialized_; }

    // ---- 错误观测 ----
    std::optional<AudioError> lastError() const;
    void clearLastError();

    // ---- 播放 ----
    /**
     * @brief 播放内存中的编码音频（内部持有一份拷贝）
     * @return soundId；解码或设备失败时返回 std::nullopt，并记录 lastError
     */
    std::optional<std::uint32_t> playMemory(const void* data, std::size_t size, const PlaybackOptions& opts = {});
    bool isPlaying(std::uint32_t soundId) const;
    bool stop(std::uint32_t soundId);
    void stopAll();

    // ---- 录音 ----
    bool startCapture(const CaptureOptions& opts);
    void stopCapture();
    bool isCapturing() const { return capturing_; }
    CapturedBuffer capturedBuffer() const;

    // ---- 验证/分析/编码（纯内存）----
    static std::optional<AudioError> validatePcmBuffer(const AudioStreamConfig& stream,
                                                       std::size_t pcmBytes,
                                                       std::size_t minFrames = 0,
                                                       std::size_t maxFrames = 0);
    static AudioStats analyzePcm(const AudioStreamConfig& stream,
                                 const void* pcm,
                                 std::size_t bytes);
    /**
     * @brief 将 PCM 编码为 WAV 字节（RIFF 头 + data）
     * @return 参数非法或编码失败时返回 std::nullopt
     */
    static std::optional<std::vector<std::uint8_t>> encodeWav(const AudioStreamConfig& stream,
                                                              const std::vector<std::uint8_t>& pcm);

private:
    struct SoundHandle {
        void* sound{nullptr};   // 实际类型为 ma_sound*
        void* decoder{nullptr}; // 实际类型为 ma_decoder*
        std::vector<std::uint8_t> data; // 解码器引用的编码数据
    };

    mutable std::mutex soundMutex_;
    std::unordered_map<std::uint32_t, std::unique_ptr<SoundHandle>> sounds_;
    std::atomic<std::uint32_t> nextSoundId_{1};

    mutable std::mutex lastErrorMutex_;
    mutable std::optional<AudioError> lastError_{};

    // 播放上下文
    void* engine_{nullptr}; // 实际类型为 ma_engine*
    AudioStreamConfig playbackConfig_{};
    bool initialized_{false};

    // 录音上下文
    void* captureContext_{nullptr}; // 实际类型为 ma_context*
    void* captureDevice_{nullptr};  // 实际类型为 ma_device*
    CaptureOptions captureOptions_{};
    mutable std::mutex captureMutex_;
    std::vector<std::uint8_t> captureBuffer_;
    std::atomic<bool> capturing_{false};

    static void dataCallbackCapture(void* pUserData, const void* pInput, std::uint32_t frameCount);
    void onCaptureFrames(const void* pInput, std::uint32_t frameCount);
    void releaseHandle(SoundHandle& handle);
    void setLastError(AudioErrorCode code, const std::string& message) const;
    void reportError(const CaptureOptions& opts, AudioErrorCode code, const std::string& message) const;
    ma_format toMiniaudioFormat(AudioFormat fmt) const;
    std::size_t frameSizeBytes(const AudioStreamConfig& cfg) const;
};

} // namespace talkbar::assistant::utils
