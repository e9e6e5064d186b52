#pragma once

#include "talkbar/assistant/ErrorTypes.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace talkbar::assistant {

/**
 * @brief 会话状态机状态
 *
 * CaptureFailed / InferenceFailed / PlaybackFailed / Done 为“静止态”：
 * 没有在途工作，只等待自动隐藏或新的激活。
 */
enum class SessionState {
    Idle,
    Capturing,
    CaptureFailed,
    Thinking,
    InferenceFailed,
    Speaking,
    PlaybackFailed,
    Done
};

inline const char* sessionStateToString(SessionState s) {
    switch (s) {
        case SessionState::Idle: return "Idle";
        case SessionState::Capturing: return "Capturing";
        case SessionState::CaptureFailed: return "Capture_Failed";
        case SessionState::Thinking: return "Thinking";
        case SessionState::InferenceFailed: return "Inference_Failed";
        case SessionState::Speaking: return "Speaking";
        case SessionState::PlaybackFailed: return "Playback_Failed";
        case SessionState::Done: return "Done";
    }
    return "Unknown";
}

// 有阶段工作在途
inline bool isInFlight(SessionState s) {
    return s == SessionState::Capturing || s == SessionState::Thinking || s == SessionState::Speaking;
}

inline bool isRestState(SessionState s) {
    return s == SessionState::CaptureFailed || s == SessionState::InferenceFailed ||
           s == SessionState::PlaybackFailed || s == SessionState::Done;
}

/**
 * @brief 代际令牌：等于所属会话 id，单调递增
 */
using GenerationToken = std::uint64_t;

/**
 * @brief 带阶段标签的失败
 */
struct StageFailure {
    PipelineStage stage{PipelineStage::Capture};
    ErrorInfo info;
};

/**
 * @brief 一次激活到完成的会话记录（仅由编排器修改）
 */
struct Session {
    GenerationToken id{0};
    SessionState state{SessionState::Idle};
    std::optional<std::string> transcript;
    std::optional<std::string> reply;
    std::optional<StageFailure> error;
    bool listening{false};                 // 采集端已校准完成，提示用户开口
};

/**
 * @brief 推送给展示面的只读视图
 */
struct SurfaceView {
    SessionState state{SessionState::Idle};
    std::optional<std::string> text;       // 识别文本或回复文本
    std::optional<ErrorType> errorKind;    // 仅失败态
    std::string status;                    // 状态行（已本地化）
};

/**
 * @brief 工作线程投递回控制队列的阶段结果
 */
struct StageResult {
    PipelineStage stage{PipelineStage::Capture};
    GenerationToken token{0};
    std::string text;                      // capture: 识别文本；inference: 回复；playback: 空
    std::optional<ErrorInfo> error;

    bool ok() const { return !error.has_value(); }
};

// 采集进度：校准完成、开始收音
struct ListeningEvent {
    GenerationToken token{0};
};

// 用户手势
struct ActivateEvent {};
struct CancelEvent {};

// 退出控制循环前中断在途会话
struct ShutdownEvent {};

using ControlEvent = std::variant<ActivateEvent, CancelEvent, ShutdownEvent, StageResult, ListeningEvent>;

} // namespace talkbar::assistant
