#include "talkbar/assistant/ErrorHandler.h"

#include <algorithm>
#include <chrono>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <sstream>
#include <string>

namespace talkbar::assistant {

static uint64_t nowEpochMs() {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

static bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return utils::toLowerAscii(haystack).find(utils::toLowerAscii(needle)) != std::string::npos;
}

ErrorHandler::ErrorHandler() = default;

ErrorHandler::ErrorHandler(LoggerConfig cfg) {
    setLoggerConfig(std::move(cfg));
}

bool ErrorHandler::setLoggerConfig(LoggerConfig cfg) {
    std::lock_guard<std::mutex> lk(m_mu);
    m_loggerCfg = std::move(cfg);
    m_file.reset();
    if (m_loggerCfg.filePath.empty()) return true;
    return openFileLocked();
}

ErrorHandler::LoggerConfig ErrorHandler::getLoggerConfig() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_loggerCfg;
}

bool ErrorHandler::openFileLocked() {
    const std::filesystem::path p(m_loggerCfg.filePath);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }
    auto f = std::make_unique<std::ofstream>(p, std::ios::out | std::ios::app | std::ios::binary);
    if (!f->is_open()) {
        const std::string msg = "[" + std::to_string(nowEpochMs()) + "] WARNING cannot open log file: " +
                                m_loggerCfg.filePath + "\n";
        std::fwrite(msg.c_str(), 1, msg.size(), stderr);
        m_loggerCfg.filePath.clear();
        return false;
    }
    m_file = std::move(f);
    return true;
}

const char* ErrorHandler::logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Info: return "INFO";
        default: return "DEBUG";
    }
}

std::optional<ErrorHandler::LogLevel> ErrorHandler::parseLogLevel(const std::string& text) {
    const auto low = utils::toLowerAscii(text);
    if (low == "error") return LogLevel::Error;
    if (low == "warning" || low == "warn") return LogLevel::Warning;
    if (low == "info") return LogLevel::Info;
    if (low == "debug") return LogLevel::Debug;
    return std::nullopt;
}

ErrorType ErrorHandler::mapHttpStatusToErrorType(int statusCode, const std::string& transportError) {
    if (statusCode == 0) {
        // statusCode==0 表示传输层失败；文案含 timeout 则归为 Timeout
        if (containsIgnoreCase(transportError, "timeout")) return ErrorType::TimeoutError;
        return ErrorType::NetworkError;
    }
    if (statusCode == 408 || statusCode == 504) return ErrorType::TimeoutError;
    if (statusCode == 429) return ErrorType::RateLimitError;
    if (statusCode >= 500 && statusCode < 600) return ErrorType::ServerError;
    if (statusCode >= 400 && statusCode < 500) return ErrorType::InvalidRequest;
    return ErrorType::UnknownError;
}

std::optional<ErrorInfo> ErrorHandler::parseApiErrorJson(const nlohmann::json& root, int httpStatusCode) {
    // {"error": {"message": "...", "type": "...", "code": "..."}} 或 {"error": "..."}
    if (!root.is_object()) return std::nullopt;
    if (!root.contains("error")) return std::nullopt;
    const auto& e = root.at("error");

    ErrorInfo info;
    info.errorCode = httpStatusCode;
    info.errorType = mapHttpStatusToErrorType(httpStatusCode);

    if (e.is_string()) {
        info.message = e.get<std::string>();
        if (info.message.empty()) info.message = "API error";
        return info;
    }
    if (!e.is_object()) return std::nullopt;

    if (e.contains("message") && e.at("message").is_string()) {
        info.message = e.at("message").get<std::string>();
    }
    if (info.message.empty()) info.message = "API error";
    info.details = e;

    const auto typeStr = e.contains("type") && e.at("type").is_string() ? e.at("type").get<std::string>() : "";
    const auto codeStr = e.contains("code") && e.at("code").is_string() ? e.at("code").get<std::string>() : "";
    if (containsIgnoreCase(typeStr, "rate") || containsIgnoreCase(codeStr, "rate")) {
        info.errorType = ErrorType::RateLimitError;
    } else if (containsIgnoreCase(typeStr, "timeout")) {
        info.errorType = ErrorType::TimeoutError;
    }
    return info;
}

ErrorInfo ErrorHandler::fromHttpResponse(
    const utils::HttpResponse& resp,
    const std::optional<utils::HttpRequest>& req) {

    ErrorInfo info;
    info.errorCode = resp.statusCode;
    info.errorType = mapHttpStatusToErrorType(resp.statusCode, resp.error);

    std::optional<nlohmann::json> parsed;
    if (!resp.body.empty()) {
        parsed = resp.asJson();
        if (parsed.has_value()) {
            if (auto apiInfo = parseApiErrorJson(*parsed, resp.statusCode); apiInfo.has_value()) {
                info = *apiInfo;
            }
        }
    }

    // message：API error.message -> 传输错误 -> body 片段 -> 兜底
    if (info.message.empty()) {
        if (!resp.error.empty()) {
            info.message = resp.error;
        } else if (!resp.body.empty()) {
            info.message = resp.body.substr(0, 256);
        } else {
            info.message = "HTTP request failed";
        }
    }

    if (!info.details.has_value()) {
        nlohmann::json d;
        d["http_status"] = resp.statusCode;
        if (!resp.error.empty()) d["transport_error"] = resp.error;
        if (parsed.has_value()) {
            d["body_json"] = *parsed;
        } else if (!resp.body.empty()) {
            d["body_snippet"] = resp.body.substr(0, 1024);
        }
        info.details = d;
    }

    // 只记录 method/url，不记录 Authorization
    if (req.has_value()) {
        info.addContext("url", req->url);
        info.addContext("method", req->method == utils::HttpMethod::GET ? "GET" : "POST");
    }

    return info;
}

void ErrorHandler::log(LogLevel level, const std::string& message, const std::optional<ErrorInfo>& err) const {
    std::lock_guard<std::mutex> lk(m_mu);
    if (!m_loggerCfg.enabled) return;
    if (static_cast<int>(level) > static_cast<int>(m_loggerCfg.minLevel)) return;

    // 结构化输出：timestamp + level + message + optional error json
    std::ostringstream oss;
    oss << "[" << nowEpochMs() << "] "
        << logLevelToString(level) << " "
        << message;
    if (err.has_value()) {
        oss << " " << err->toString();
    }
    oss << "\n";
    const auto line = oss.str();
    std::fwrite(line.c_str(), 1, line.size(), stderr);
    std::fflush(stderr);
    if (m_file) {
        *m_file << line;
        m_file->flush();
    }
}

} // namespace talkbar::assistant
