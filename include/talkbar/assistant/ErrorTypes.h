#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"

namespace talkbar::assistant {

/**
 * @brief 统一错误类型（网络侧 + 设备/语音侧）
 */
enum class ErrorType {
    NetworkError,     // 网络错误（连接失败、DNS等）
    RateLimitError,   // 限流错误（429）
    InvalidRequest,   // 请求错误（400/401/403等）
    ServerError,      // 服务器错误（5xx）
    TimeoutError,     // 超时（408 或本地超时）
    DeviceError,      // 音频设备缺失/初始化失败
    PermissionDenied, // 麦克风权限被拒绝
    NoSpeech,         // 未检测到语音或无法识别
    AudioError,       // 解码/播放失败
    UnknownError      // 未知错误
};

/**
 * @brief 会话流水线阶段，用于给错误打上来源标签
 */
enum class PipelineStage {
    Capture,
    Inference,
    Playback
};

inline const char* stageToString(PipelineStage s) {
    switch (s) {
        case PipelineStage::Capture: return "capture";
        case PipelineStage::Inference: return "inference";
        case PipelineStage::Playback: return "playback";
    }
    return "unknown";
}

/**
 * @brief 结构化错误信息
 */
struct ErrorInfo {
    ErrorType errorType{ErrorType::UnknownError};
    int errorCode{0}; // HTTP status 或内部错误码（0 表示无/未知）
    std::string message;
    std::optional<nlohmann::json> details;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    std::optional<std::map<std::string, std::string>> context;

    static const char* errorTypeToString(ErrorType t) {
        switch (t) {
            case ErrorType::NetworkError: return "NetworkError";
            case ErrorType::RateLimitError: return "RateLimitError";
            case ErrorType::InvalidRequest: return "InvalidRequest";
            case ErrorType::ServerError: return "ServerError";
            case ErrorType::TimeoutError: return "TimeoutError";
            case ErrorType::DeviceError: return "DeviceError";
            case ErrorType::PermissionDenied: return "PermissionDenied";
            case ErrorType::NoSpeech: return "NoSpeech";
            case ErrorType::AudioError: return "AudioError";
            default: return "UnknownError";
        }
    }

    static ErrorInfo make(ErrorType type, std::string msg, int code = 0) {
        ErrorInfo info;
        info.errorType = type;
        info.errorCode = code;
        info.message = std::move(msg);
        return info;
    }

    void addContext(const std::string& key, const std::string& value) {
        if (value.empty()) return;
        if (!context.has_value()) context = std::map<std::string, std::string>{};
        (*context)[key] = value;
    }

    nlohmann::json toJson() const {
        nlohmann::json j;
        j["error_type"] = errorTypeToString(errorType);
        j["error_code"] = errorCode;
        j["message"] = message;
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
        j["timestamp_ms"] = ms;
        if (details.has_value()) j["details"] = details.value();
        if (context.has_value()) j["context"] = context.value();
        return j;
    }

    std::string toString() const {
        // JSON 作为统一字符串化输出，便于日志/调试
        return toJson().dump();
    }
};

} // namespace talkbar::assistant
