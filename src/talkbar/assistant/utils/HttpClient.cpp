#include "talkbar/assistant/utils/HttpClient.h"

// HTTPS 由构建选项 TALKBAR_HTTPS 定义 CPPHTTPLIB_OPENSSL_SUPPORT 打开
#include "httplib.h"

#include <chrono>
#include <random>
#include <sstream>
#include <thread>
#include <utility>

namespace talkbar::assistant::utils {

HttpClient::HttpClient(const std::string& baseUrl)
    : m_baseUrl(baseUrl)
    , m_timeoutMs(30000)
{
    m_defaultHeaders["User-Agent"] = "talkbar/1.0";
}

void HttpClient::setDefaultHeader(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(m_headerMutex);
    m_defaultHeaders[key] = value;
}

void HttpClient::setRetryConfig(const RetryConfig& config) {
    m_retryConfig = config;
}

void HttpClient::setTimeout(int timeoutMs) {
    m_timeoutMs = timeoutMs > 0 ? timeoutMs : 30000;
}

// ========== 同步请求方法 ==========

HttpResponse HttpClient::get(const std::string& path,
                             const std::map<std::string, std::string>& headers) {
    HttpRequest request;
    request.method = HttpMethod::GET;
    request.url = buildFullUrl(path);
    request.headers = mergeHeaders(headers);
    request.timeoutMs = m_timeoutMs;
    return execute(request);
}

HttpResponse HttpClient::post(const std::string& path,
                              const std::string& body,
                              const std::string& contentType,
                              const std::map<std::string, std::string>& headers) {
    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = buildFullUrl(path);
    request.body = body;
    request.timeoutMs = m_timeoutMs;

    auto mergedHeaders = mergeHeaders(headers);
    mergedHeaders["Content-Type"] = contentType;
    request.headers = std::move(mergedHeaders);

    return execute(request);
}

HttpResponse HttpClient::postJson(const std::string& path,
                                  const std::string& jsonBody,
                                  const std::map<std::string, std::string>& headers) {
    return post(path, jsonBody, "application/json", headers);
}

HttpResponse HttpClient::postMultipart(const std::string& path,
                                       const std::map<std::string, std::string>& fields,
                                       const std::map<std::string, MultipartFile>& files,
                                       const std::map<std::string, std::string>& headers) {
    std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream boundary;
    boundary << "----talkbar-" << std::hex << rng();
    const auto body = buildMultipartBody(fields, files, boundary.str());
    return post(path, body, "multipart/form-data; boundary=" + boundary.str(), headers);
}

HttpResponse HttpClient::execute(const HttpRequest& request) {
    return executeWithRetry(request);
}

RetryStatsSnapshot HttpClient::getRetryStats() const {
    return m_retryStats.snapshot();
}

// ========== 私有方法 ==========

HttpResponse HttpClient::executeWithRetry(const HttpRequest& request) {
    HttpResponse response;
    int attempt = 0;
    m_retryStats.totalAttempts.fetch_add(1, std::memory_order_relaxed);

    while (attempt <= m_retryConfig.maxRetries) {
        response = executeOnce(request);

        if (response.isSuccess() || !isRetryableError(response)) {
            if (response.isSuccess() && attempt > 0) {
                m_retryStats.totalSuccessAfterRetry.fetch_add(1, std::memory_order_relaxed);
            }
            break;
        }

        if (attempt < m_retryConfig.maxRetries) {
            std::this_thread::sleep_for(m_retryConfig.getRetryDelay(attempt));
            m_retryStats.totalRetries.fetch_add(1, std::memory_order_relaxed);
            attempt++;
        } else {
            break;
        }
    }

    return response;
}

HttpResponse HttpClient::executeOnce(const HttpRequest& request) {
    HttpResponse response;

    const auto [origin, path] = splitUrl(request.url);
    if (origin.empty()) {
        response.error = "Invalid URL: " + request.url;
        return response;
    }

    try {
        httplib::Client client(origin);
        const int timeoutMs = request.timeoutMs > 0 ? request.timeoutMs : m_timeoutMs;
        client.set_connection_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
        client.set_read_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
        client.set_write_timeout(timeoutMs / 1000, (timeoutMs % 1000) * 1000);
        client.set_follow_location(true);

        httplib::Headers headers;
        std::string contentType = "application/json";
        for (const auto& [key, value] : request.headers) {
            if (toLowerAscii(key) == "content-type") {
                contentType = value;
                continue;
            }
            headers.emplace(key, value);
        }

        const auto started = std::chrono::steady_clock::now();
        httplib::Result result;
        switch (request.method) {
            case HttpMethod::GET:
                result = client.Get(path, headers);
                break;
            case HttpMethod::POST:
                result = client.Post(path, headers, request.body, contentType);
                break;
        }

        if (result) {
            response.statusCode = result->status;
            response.body = result->body;
            for (const auto& [key, value] : result->headers) {
                // 多值头仅保留首值
                response.headers.emplace(toLowerAscii(key), value);
            }
        } else {
            const auto err = result.error();
            const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count();
            response.statusCode = 0;
            response.error = "Request failed: error_code=" + std::to_string(static_cast<int>(err));
            if (err == httplib::Error::Connection) {
                response.error += " (connection refused or unreachable)";
            }
            // httplib 对读写超时只报告 Read/Write；按耗时判定是否为超时
            if (elapsedMs >= static_cast<long long>(timeoutMs) * 9 / 10) {
                response.error += " (timeout after " + std::to_string(elapsedMs) + "ms)";
            }
        }
    } catch (const std::exception& e) {
        response.statusCode = 0;
        response.error = "Exception: " + std::string(e.what());
    }

    return response;
}

std::string HttpClient::buildFullUrl(const std::string& path) const {
    if (m_baseUrl.empty()) {
        return path;
    }
    if (path.find("://") != std::string::npos) {
        return path;
    }
    if (path.empty()) {
        return m_baseUrl;
    }

    std::string fullUrl = m_baseUrl;
    if (fullUrl.back() == '/' && path.front() == '/') {
        fullUrl.pop_back();
    } else if (fullUrl.back() != '/' && path.front() != '/') {
        fullUrl += '/';
    }
    fullUrl += path;
    return fullUrl;
}

bool HttpClient::isRetryableError(const HttpResponse& response) const {
    switch (classifyStatus(response.statusCode)) {
        case HttpErrorType::Network:
            if (response.error.find("timeout") != std::string::npos) {
                return m_retryConfig.retryOnTimeout;
            }
            return true;
        case HttpErrorType::Timeout:
            return m_retryConfig.retryOnTimeout;
        case HttpErrorType::RateLimit:
            return m_retryConfig.retryOnRateLimit;
        case HttpErrorType::Server:
            return m_retryConfig.retryOnServerError;
        default:
            return false;
    }
}

std::map<std::string, std::string> HttpClient::mergeHeaders(
    const std::map<std::string, std::string>& requestHeaders) const {
    std::lock_guard<std::mutex> lock(m_headerMutex);
    std::map<std::string, std::string> merged = requestHeaders;
    // 请求级头优先
    merged.insert(m_defaultHeaders.begin(), m_defaultHeaders.end());
    return merged;
}

std::pair<std::string, std::string> HttpClient::splitUrl(const std::string& url) {
    const auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos || schemeEnd == 0) {
        return {"", ""};
    }
    const auto hostStart = schemeEnd + 3;
    const auto pathStart = url.find('/', hostStart);
    if (pathStart == std::string::npos) {
        if (hostStart >= url.size()) return {"", ""};
        return {url, "/"};
    }
    if (pathStart == hostStart) {
        return {"", ""};
    }
    return {url.substr(0, pathStart), url.substr(pathStart)};
}

std::string HttpClient::buildMultipartBody(const std::map<std::string, std::string>& fields,
                                           const std::map<std::string, MultipartFile>& files,
                                           const std::string& boundary) {
    std::string body;
    for (const auto& [name, value] : fields) {
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
        body += value + "\r\n";
    }
    for (const auto& [name, file] : files) {
        body += "--" + boundary + "\r\n";
        body += "Content-Disposition: form-data; name=\"" + name + "\"; filename=\"" + file.filename + "\"\r\n";
        body += "Content-Type: " + (file.contentType.empty() ? std::string("application/octet-stream") : file.contentType) + "\r\n\r\n";
        body += file.data;
        body += "\r\n";
    }
    body += "--" + boundary + "--\r\n";
    return body;
}

HttpErrorType HttpClient::classifyStatus(int statusCode) {
    if (statusCode == 0) {
        return HttpErrorType::Network;
    }
    if (statusCode == 408) {
        return HttpErrorType::Timeout;
    }
    if (statusCode == 429) {
        return HttpErrorType::RateLimit;
    }
    if (statusCode >= 500 && statusCode < 600) {
        return HttpErrorType::Server;
    }
    if (statusCode >= 400 && statusCode < 500) {
        return HttpErrorType::Client;
    }
    return HttpErrorType::None;
}

} // namespace talkbar::assistant::utils
