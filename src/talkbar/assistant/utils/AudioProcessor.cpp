#include "talkbar/assistant/utils/AudioProcessor.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstring>
#include <string>

namespace {
ma_device* toDevice(void* ptr) { return reinterpret_cast<ma_device*>(ptr); }
ma_engine* toEngine(void* ptr) { return reinterpret_cast<ma_engine*>(ptr); }
ma_sound* toSound(void* ptr) { return reinterpret_cast<ma_sound*>(ptr); }
ma_context* toContext(void* ptr) { return reinterpret_cast<ma_context*>(ptr); }
ma_decoder* toDecoder(void* ptr) { return reinterpret_cast<ma_decoder*>(ptr); }

// 内存编码目标：按游标写入，支持 WAV 头回填时的 seek
struct MemoryWriter {
    std::vector<std::uint8_t>* out{nullptr};
    std::size_t pos{0};
};

ma_result memoryWrite(ma_encoder* pEncoder, const void* pBufferIn, size_t bytesToWrite, size_t* pBytesWritten) {
    auto* w = static_cast<MemoryWriter*>(pEncoder->pUserData);
    if (w == nullptr || w->out == nullptr) {
        return MA_INVALID_ARGS;
    }
    if (w->pos + bytesToWrite > w->out->size()) {
        w->out->resize(w->pos + bytesToWrite);
    }
    if (bytesToWrite > 0) {
        std::memcpy(w->out->data() + w->pos, pBufferIn, bytesToWrite);
    }
    w->pos += bytesToWrite;
    if (pBytesWritten) {
        *pBytesWritten = bytesToWrite;
    }
    return MA_SUCCESS;
}

ma_result memorySeek(ma_encoder* pEncoder, ma_int64 offset, ma_seek_origin origin) {
    auto* w = static_cast<MemoryWriter*>(pEncoder->pUserData);
    if (w == nullptr || w->out == nullptr) {
        return MA_INVALID_ARGS;
    }
    std::int64_t base = 0;
    if (origin == ma_seek_origin_current) {
        base = static_cast<std::int64_t>(w->pos);
    } else if (origin == ma_seek_origin_end) {
        base = static_cast<std::int64_t>(w->out->size());
    }
    const std::int64_t target = base + offset;
    if (target < 0) {
        return MA_INVALID_ARGS;
    }
    w->pos = static_cast<std::size_t>(target);
    return MA_SUCCESS;
}
} // namespace

namespace talkbar::assistant::utils {

AudioProcessor::AudioProcessor() = default;

AudioProcessor::~AudioProcessor() { shutdown(); }

ma_format AudioProcessor::toMiniaudioFormat(AudioFormat fmt) const {
    switch (fmt) {
    case AudioFormat::F32:
        return ma_format_f32;
    case AudioFormat::S16:
        return ma_format_s16;
    default:
        return ma_format_f32;
    }
}

static AudioFormat fromMiniaudioFormat(ma_format fmt) {
    return fmt == ma_format_s16 ? AudioFormat::S16 : AudioFormat::F32;
}

static float dbfsFromRms(float rms) {
    if (rms <= 1e-9f) {
        return -90.0f;
    }
    return 20.0f * std::log10(rms);
}

static std::size_t bytesPerSampleFor(AudioFormat fmt) {
    return fmt == AudioFormat::S16 ? sizeof(std::int16_t) : sizeof(float);
}

std::size_t AudioProcessor::frameSizeBytes(const AudioStreamConfig& cfg) const {
    return ma_get_bytes_per_sample(toMiniaudioFormat(cfg.format)) * cfg.channels;
}

std::optional<AudioError> AudioProcessor::lastError() const {
    std::lock_guard<std::mutex> lock(lastErrorMutex_);
    return lastError_;
}

void AudioProcessor::clearLastError() {
    std::lock_guard<std::mutex> lock(lastErrorMutex_);
    lastError_.reset();
}

void AudioProcessor::setLastError(AudioErrorCode code, const std::string& message) const {
    std::lock_guard<std::mutex> lock(lastErrorMutex_);
    lastError_ = AudioError{code, message};
}

void AudioProcessor::reportError(const CaptureOptions& opts, AudioErrorCode code, const std::string& message) const {
    setLastError(code, message);
    if (opts.onError) {
        opts.onError(AudioError{code, message});
    }
}

std::optional<AudioError> AudioProcessor::validatePcmBuffer(const AudioStreamConfig& stream,
                                                            std::size_t pcmBytes,
                                                            std::size_t minFrames,
                                                            std::size_t maxFrames) {
    if (stream.sampleRate == 0 || stream.channels == 0) {
        return AudioError{AudioErrorCode::InvalidArgs, "invalid AudioStreamConfig: sampleRate/channels must be non-zero"};
    }
    if (!(stream.channels >= 1 && stream.channels <= 8)) {
        return AudioError{AudioErrorCode::InvalidArgs, "invalid AudioStreamConfig: channels out of range"};
    }
    if (!(stream.sampleRate >= 8000 && stream.sampleRate <= 192000)) {
        return AudioError{AudioErrorCode::InvalidArgs, "invalid AudioStreamConfig: sampleRate out of range"};
    }
    const std::size_t bpf = bytesPerSampleFor(stream.format) * stream.channels;
    if (pcmBytes == 0) {
        return AudioError{AudioErrorCode::InvalidArgs, "pcmBytes is zero"};
    }
    if (pcmBytes % bpf != 0) {
        return AudioError{AudioErrorCode::InvalidArgs, "pcmBytes is not frame-aligned"};
    }
    const std::size_t frames = pcmBytes / bpf;
    if (minFrames > 0 && frames < minFrames) {
        return AudioError{AudioErrorCode::InvalidArgs, "pcm too short"};
    }
    if (maxFrames > 0 && frames > maxFrames) {
        return AudioError{AudioErrorCode::InvalidArgs, "pcm too long"};
    }
    return std::nullopt;
}

AudioStats AudioProcessor::analyzePcm(const AudioStreamConfig& stream, const void* pcm, std::size_t bytes) {
    AudioStats st{};
    st.sampleRate = stream.sampleRate;
    st.channels = stream.channels;
    st.format = stream.format;

    const auto err = validatePcmBuffer(stream, bytes);
    if (err.has_value() || pcm == nullptr) {
        st.isSilent = true;
        st.dbfs = -90.0f;
        return st;
    }

    const std::size_t bpf = bytesPerSampleFor(stream.format) * stream.channels;
    const std::size_t frames = bytes / bpf;
    const std::size_t samples = frames * stream.channels;
    st.frames = static_cast<std::uint64_t>(frames);
    st.durationSeconds = static_cast<double>(frames) / static_cast<double>(stream.sampleRate);

    double accum = 0.0;
    float peak = 0.0f;
    if (stream.format == AudioFormat::S16) {
        const auto* p = static_cast<const std::int16_t*>(pcm);
        for (std::size_t i = 0; i < samples; ++i) {
            const float v = static_cast<float>(p[i]) / 32768.0f;
            peak = std::max(peak, std::abs(v));
            accum += static_cast<double>(v) * static_cast<double>(v);
        }
    } else {
        const auto* p = static_cast<const float*>(pcm);
        for (std::size_t i = 0; i < samples; ++i) {
            const float v = p[i];
            peak = std::max(peak, std::abs(v));
            accum += static_cast<double>(v) * static_cast<double>(v);
        }
    }

    const double rms = std::sqrt(accum / static_cast<double>(samples));
    st.peakAbs = peak;
    st.rms = static_cast<float>(rms);
    st.dbfs = dbfsFromRms(static_cast<float>(rms));
    st.isSilent = (st.rms <= 1e-4f);
    return st;
}

std::optional<std::vector<std::uint8_t>> AudioProcessor::encodeWav(const AudioStreamConfig& stream,
                                                                   const std::vector<std::uint8_t>& pcm) {
    if (validatePcmBuffer(stream, pcm.size()).has_value()) {
        return std::nullopt;
    }
    const ma_format fmt = stream.format == AudioFormat::S16 ? ma_format_s16 : ma_format_f32;
    ma_encoder_config encCfg = ma_encoder_config_init(ma_encoding_format_wav, fmt, stream.channels, stream.sampleRate);

    std::vector<std::uint8_t> out;
    out.reserve(pcm.size() + 64);
    MemoryWriter writer{&out, 0};

    ma_encoder encoder;
    if (ma_encoder_init(memoryWrite, memorySeek, &writer, &encCfg, &encoder) != MA_SUCCESS) {
        return std::nullopt;
    }
    const auto frames = static_cast<ma_uint64>(pcm.size() / (bytesPerSampleFor(stream.format) * stream.channels));
    ma_uint64 framesWritten = 0;
    const auto result = ma_encoder_write_pcm_frames(&encoder, pcm.data(), frames, &framesWritten);
    // uninit 时回填 RIFF/data 长度
    ma_encoder_uninit(&encoder);
    if (result != MA_SUCCESS || framesWritten != frames) {
        return std::nullopt;
    }
    return out;
}

bool AudioProcessor::initialize(const AudioStreamConfig& playbackConfig) {
    if (initialized_) {
        return true;
    }

    ma_engine_config cfg = ma_engine_config_init();
    cfg.channels = playbackConfig.channels;
    cfg.sampleRate = playbackConfig.sampleRate;
    cfg.listenerCount = 1;
    cfg.noDevice = MA_FALSE;

    auto* engine = new ma_engine();
    if (ma_engine_init(&cfg, engine) != MA_SUCCESS) {
        delete engine;
        setLastError(AudioErrorCode::DeviceInitFailed, "ma_engine_init failed");
        return false;
    }

    engine_ = engine;
    playbackConfig_ = playbackConfig;
    initialized_ = true;
    return true;
}

void AudioProcessor::shutdown() {
    stopAll();

    if (captureDevice_ != nullptr) {
        stopCapture();
    }

    if (initialized_ && engine_ != nullptr) {
        ma_engine_uninit(toEngine(engine_));
        delete toEngine(engine_);
    }

    if (captureContext_ != nullptr) {
        ma_context_uninit(toContext(captureContext_));
        delete toContext(captureContext_);
        captureContext_ = nullptr;
    }

    engine_ = nullptr;
    initialized_ = false;
}

std::optional<std::uint32_t> AudioProcessor::playMemory(const void* data, std::size_t size, const PlaybackOptions& opts) {
    if (!initialized_) {
        setLastError(AudioErrorCode::NotInitialized, "playMemory: processor not initialized");
        return std::nullopt;
    }
    if (data == nullptr || size == 0) {
        setLastError(AudioErrorCode::InvalidArgs, "playMemory: empty audio data");
        return std::nullopt;
    }

    auto handle = std::make_unique<SoundHandle>();
    const auto* bytes = static_cast<const std::uint8_t*>(data);
    handle->data.assign(bytes, bytes + size);

    auto* decoder = new ma_decoder();
    ma_decoder_config decCfg = ma_decoder_config_init(ma_format_f32,
                                                      playbackConfig_.channels,
                                                      playbackConfig_.sampleRate);
    if (ma_decoder_init_memory(handle->data.data(), handle->data.size(), &decCfg, decoder) != MA_SUCCESS) {
        delete decoder;
        setLastError(AudioErrorCode::DecoderFailed, "playMemory: ma_decoder_init_memory failed");
        return std::nullopt;
    }

    auto* sound = new ma_sound();
    if (ma_sound_init_from_data_source(toEngine(engine_), decoder, MA_SOUND_FLAG_DECODE, nullptr, sound) != MA_SUCCESS) {
        ma_decoder_uninit(decoder);
        delete decoder;
        delete sound;
        setLastError(AudioErrorCode::DeviceInitFailed, "playMemory: ma_sound_init_from_data_source failed");
        return std::nullopt;
    }

    ma_sound_set_looping(sound, MA_FALSE);
    ma_sound_set_volume(sound, opts.volume);

    handle->sound = sound;
    handle->decoder = decoder;
    const auto id = nextSoundId_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(soundMutex_);
        sounds_.emplace(id, std::move(handle));
    }
    if (ma_sound_start(sound) != MA_SUCCESS) {
        stop(id);
        setLastError(AudioErrorCode::DeviceStartFailed, "playMemory: ma_sound_start failed");
        return std::nullopt;
    }
    return id;
}

bool AudioProcessor::isPlaying(std::uint32_t soundId) const {
    std::lock_guard<std::mutex> lock(soundMutex_);
    auto it = sounds_.find(soundId);
    if (it == sounds_.end()) {
        return false;
    }
    auto* sound = toSound(it->second->sound);
    return ma_sound_is_playing(sound) == MA_TRUE && ma_sound_at_end(sound) == MA_FALSE;
}

void AudioProcessor::releaseHandle(SoundHandle& handle) {
    auto* sound = toSound(handle.sound);
    ma_sound_stop(sound);
    ma_sound_uninit(sound);
    delete sound;
    handle.sound = nullptr;

    if (handle.decoder != nullptr) {
        ma_decoder_uninit(toDecoder(handle.decoder));
        delete toDecoder(handle.decoder);
        handle.decoder = nullptr;
    }
}

bool AudioProcessor::stop(std::uint32_t soundId) {
    std::unique_ptr<SoundHandle> handle;
    {
        std::lock_guard<std::mutex> lock(soundMutex_);
        auto it = sounds_.find(soundId);
        if (it == sounds_.end()) {
            return false;
        }
        handle = std::move(it->second);
        sounds_.erase(it);
    }
    releaseHandle(*handle);
    return true;
}

void AudioProcessor::stopAll() {
    std::vector<std::uint32_t> ids;
    {
        std::lock_guard<std::mutex> lock(soundMutex_);
        ids.reserve(sounds_.size());
        for (auto& kv : sounds_) {
            ids.push_back(kv.first);
        }
    }

    for (auto id : ids) {
        stop(id);
    }
}

void AudioProcessor::dataCallbackCapture(void* pUserData, const void* pInput, std::uint32_t frameCount) {
    auto* self = reinterpret_cast<AudioProcessor*>(pUserData);
    if (self != nullptr) {
        self->onCaptureFrames(pInput, frameCount);
    }
}

void AudioProcessor::onCaptureFrames(const void* pInput, std::uint32_t frameCount) {
    if (!capturing_ || pInput == nullptr) {
        return;
    }

    const auto bytesPerFrame = frameSizeBytes(captureOptions_.stream);
    const auto bytesToCopy = static_cast<std::size_t>(frameCount) * bytesPerFrame;

    if (captureOptions_.storeInMemory) {
        std::lock_guard<std::mutex> lock(captureMutex_);
        const auto currentFrames = captureBuffer_.size() / bytesPerFrame;
        const auto maxFrames = captureOptions_.maxFramesInBuffer;
        const auto writableFrames = maxFrames > currentFrames ? maxFrames - currentFrames : 0;
        const auto framesToCopy = std::min<std::size_t>(writableFrames, frameCount);
        const auto bytesCopy = framesToCopy * bytesPerFrame;
        if (bytesCopy > 0) {
            const auto* src = static_cast<const std::uint8_t*>(pInput);
            captureBuffer_.insert(captureBuffer_.end(), src, src + bytesCopy);
        }
    }

    if (captureOptions_.onData) {
        captureOptions_.onData(pInput, bytesToCopy, frameCount);
    }
}

bool AudioProcessor::startCapture(const CaptureOptions& opts) {
    if (capturing_) {
        return true;
    }

    if (captureContext_ == nullptr) {
        auto* ctx = new ma_context();
        if (ma_context_init(nullptr, 0, nullptr, ctx) != MA_SUCCESS) {
            delete ctx;
            reportError(opts, AudioErrorCode::DeviceInitFailed, "startCapture: ma_context_init failed");
            return false;
        }
        captureContext_ = ctx;
    }
    auto* ctx = toContext(captureContext_);

    ma_device_config deviceConfig = ma_device_config_init(ma_device_type_capture);
    const bool useDefault = opts.useDeviceDefault;
    deviceConfig.sampleRate = useDefault ? 0 : opts.stream.sampleRate;
    deviceConfig.capture.format = useDefault ? ma_format_unknown : toMiniaudioFormat(opts.stream.format);
    deviceConfig.capture.channels = useDefault ? 0 : opts.stream.channels;
    deviceConfig.dataCallback = [](ma_device* device, void* /*pOutput*/, const void* pInput, ma_uint32 frameCount) {
        dataCallbackCapture(device->pUserData, pInput, frameCount);
    };
    deviceConfig.pUserData = this;
    const std::uint32_t period = opts.stream.periodSizeInFrames == 0 ? 1024 : opts.stream.periodSizeInFrames;
    deviceConfig.periodSizeInFrames = period;

    // 默认输入若是 loopback，改选第一个非 loopback 设备，避免把播放声当作输入
    ma_device_info* playbackInfos = nullptr;
    ma_uint32 playbackCount = 0;
    ma_device_info* captureInfos = nullptr;
    ma_uint32 captureCount = 0;
    if (ma_context_get_devices(ctx, &playbackInfos, &playbackCount, &captureInfos, &captureCount) == MA_SUCCESS &&
        captureInfos != nullptr && captureCount > 0) {
        const ma_device_info* chosen = &captureInfos[0];
        auto isLoopbackName = [](const ma_device_info& info) {
            std::string name(info.name);
            std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return name.find("loopback") != std::string::npos;
        };
        if (isLoopbackName(*chosen)) {
            for (ma_uint32 i = 0; i < captureCount; ++i) {
                if (!isLoopbackName(captureInfos[i])) {
                    chosen = &captureInfos[i];
                    break;
                }
            }
        }
        deviceConfig.capture.pDeviceID = &chosen->id;
    } else {
        ma_context_uninit(ctx);
        delete ctx;
        captureContext_ = nullptr;
        reportError(opts, AudioErrorCode::DeviceInitFailed, "startCapture: no capture device");
        return false;
    }

    auto* device = new ma_device();
    const ma_result initResult = ma_device_init(ctx, &deviceConfig, device);
    if (initResult != MA_SUCCESS) {
        delete device;
        ma_context_uninit(ctx);
        delete ctx;
        captureContext_ = nullptr;
        if (initResult == MA_ACCESS_DENIED) {
            reportError(opts, AudioErrorCode::PermissionDenied, "startCapture: microphone access denied");
        } else {
            reportError(opts, AudioErrorCode::DeviceInitFailed, "startCapture: ma_device_init failed");
        }
        return false;
    }

    captureDevice_ = device;
    captureOptions_ = opts;
    // 以设备实际参数为准
    captureOptions_.stream.sampleRate = device->sampleRate;
    captureOptions_.stream.channels = device->capture.channels;
    captureOptions_.stream.format = fromMiniaudioFormat(device->capture.format);
    captureOptions_.stream.periodSizeInFrames = period;
    {
        std::lock_guard<std::mutex> lock(captureMutex_);
        captureBuffer_.clear();
        if (captureOptions_.storeInMemory) {
            captureBuffer_.reserve(captureOptions_.maxFramesInBuffer * frameSizeBytes(captureOptions_.stream));
        }
    }
    capturing_ = true;
    const ma_result startResult = ma_device_start(device);
    if (startResult != MA_SUCCESS) {
        capturing_ = false;
        ma_device_uninit(device);
        delete device;
        captureDevice_ = nullptr;
        reportError(opts,
                    startResult == MA_ACCESS_DENIED ? AudioErrorCode::PermissionDenied : AudioErrorCode::DeviceStartFailed,
                    "startCapture: ma_device_start failed");
        return false;
    }
    return true;
}

void AudioProcessor::stopCapture() {
    if (captureDevice_ == nullptr) {
        return;
    }

    auto* device = toDevice(captureDevice_);
    capturing_ = false;
    if (ma_device_stop(device) != MA_SUCCESS) {
        reportError(captureOptions_, AudioErrorCode::DeviceStopFailed, "stopCapture: ma_device_stop failed");
    }
    ma_device_uninit(device);
    delete device;
    captureDevice_ = nullptr;

    if (captureContext_ != nullptr) {
        ma_context_uninit(toContext(captureContext_));
        delete toContext(captureContext_);
        captureContext_ = nullptr;
    }
}

CapturedBuffer AudioProcessor::capturedBuffer() const {
    std::lock_guard<std::mutex> lock(captureMutex_);
    return CapturedBuffer{captureOptions_.stream, captureBuffer_};
}

} // namespace talkbar::assistant::utils
