#pragma once

#include "talkbar/assistant/ErrorTypes.h"
#include "talkbar/assistant/SessionTypes.h"

#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

namespace talkbar::assistant {

/**
 * @brief 阶段异常基类：携带 ErrorInfo 与阶段标签
 */
class StageError : public std::runtime_error {
public:
    StageError(PipelineStage stage, ErrorInfo info)
        : std::runtime_error(info.message)
        , m_stage(stage)
        , m_info(std::move(info))
    {}

    PipelineStage stage() const { return m_stage; }
    const ErrorInfo& info() const { return m_info; }

private:
    PipelineStage m_stage;
    ErrorInfo m_info;
};

// 无麦克风 / 权限被拒 / 听不懂 / 等待超时
class CaptureError : public StageError {
public:
    explicit CaptureError(ErrorInfo info) : StageError(PipelineStage::Capture, std::move(info)) {}
};

// 后端不可达 / 后端错误响应 / 请求超时
class InferenceError : public StageError {
public:
    explicit InferenceError(ErrorInfo info) : StageError(PipelineStage::Inference, std::move(info)) {}
};

// 合成失败 / 音频输出失败
class PlaybackError : public StageError {
public:
    explicit PlaybackError(ErrorInfo info) : StageError(PipelineStage::Playback, std::move(info)) {}
};

/**
 * @brief 语音采集：阻塞直到得到识别文本；失败抛 CaptureError
 */
class Capturer {
public:
    // 环境校准完成、可以开口时调用（工作线程上），可为空
    using ListeningCallback = std::function<void()>;

    virtual ~Capturer() = default;
    virtual std::string capture(GenerationToken token, const ListeningCallback& onListening) = 0;

    // 尽力放弃 token 及更早代际的采集；默认不支持
    virtual void interrupt(GenerationToken token) { (void)token; }
};

/**
 * @brief 推理：阻塞网络调用；失败抛 InferenceError
 */
class Inferencer {
public:
    virtual ~Inferencer() = default;
    virtual std::string query(const std::string& transcript, GenerationToken token) = 0;

    // token 及更早代际的结果不再被采用；默认无动作
    virtual void interrupt(GenerationToken token) { (void)token; }
};

/**
 * @brief 播放：合成并播放到结束；失败抛 PlaybackError
 */
class Speaker {
public:
    virtual ~Speaker() = default;
    virtual void speak(const std::string& reply, GenerationToken token) = 0;

    // 尽力中断 token 及更早代际的播放；默认不支持
    virtual void interrupt(GenerationToken token) { (void)token; }
};

/**
 * @brief 展示面：纯响应式，不含业务逻辑
 */
class PresentationSurface {
public:
    virtual ~PresentationSurface() = default;
    virtual void update(const SurfaceView& view) = 0;
    virtual void hide() = 0;
};

} // namespace talkbar::assistant
