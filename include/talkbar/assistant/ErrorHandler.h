#pragma once

#include "talkbar/assistant/ErrorTypes.h"
#include "talkbar/assistant/utils/HttpTypes.h"

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace talkbar::assistant {

/**
 * @brief 错误识别 + 结构化日志
 *
 * - HTTP 状态/传输错误 -> ErrorType
 * - OpenAI 兼容 error JSON 解析
 * - 单行结构化日志：stderr，可选追加写入日志文件
 */
class ErrorHandler {
public:
    enum class LogLevel {
        Error,
        Warning,
        Info,
        Debug
    };

    struct LoggerConfig {
        LogLevel minLevel{LogLevel::Warning};
        bool enabled{true};
        std::string filePath; // 为空表示只写 stderr
    };

    ErrorHandler();
    explicit ErrorHandler(LoggerConfig cfg);

    ErrorHandler(const ErrorHandler&) = delete;
    ErrorHandler& operator=(const ErrorHandler&) = delete;

    // 切换配置时会重新打开日志文件；打开失败时回退为仅 stderr 并返回 false
    bool setLoggerConfig(LoggerConfig cfg);
    LoggerConfig getLoggerConfig() const;

    // ========== 识别/解析 ==========
    static ErrorType mapHttpStatusToErrorType(int statusCode, const std::string& transportError = "");

    // 从 HttpResponse 生成 ErrorInfo（会尝试解析 body 的 API 错误 JSON）
    static ErrorInfo fromHttpResponse(
        const utils::HttpResponse& resp,
        const std::optional<utils::HttpRequest>& req = std::nullopt);

    // 解析 OpenAI 兼容 error JSON；非该结构返回 nullopt
    static std::optional<ErrorInfo> parseApiErrorJson(
        const nlohmann::json& root,
        int httpStatusCode = 0);

    // ========== 日志 ==========
    void log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err = std::nullopt) const;

    static const char* logLevelToString(LogLevel level);
    // "error"/"warning"/"warn"/"info"/"debug"（大小写不敏感）
    static std::optional<LogLevel> parseLogLevel(const std::string& text);

private:
    mutable std::mutex m_mu;
    LoggerConfig m_loggerCfg;
    std::unique_ptr<std::ofstream> m_file;

    bool openFileLocked();
};

} // namespace talkbar::assistant
