#pragma once

// 测试用本地 HTTP 服务：绑定 127.0.0.1 随机端口，析构时停止

#include "httplib.h"

#include <chrono>
#include <string>
#include <thread>

namespace mini_test {

class LoopbackServer {
public:
    LoopbackServer() = default;
    ~LoopbackServer() { stop(); }

    LoopbackServer(const LoopbackServer&) = delete;
    LoopbackServer& operator=(const LoopbackServer&) = delete;

    httplib::Server& server() { return m_server; }

    // 注册完路由后调用；返回是否成功监听
    bool start() {
        m_port = m_server.bind_to_any_port("127.0.0.1");
        if (m_port <= 0) return false;
        m_thread = std::thread([this]() { m_server.listen_after_bind(); });
        for (int i = 0; i < 200 && !m_server.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return m_server.is_running();
    }

    void stop() {
        m_server.stop();
        if (m_thread.joinable()) m_thread.join();
    }

    int port() const { return m_port; }
    std::string baseUrl() const { return "http://127.0.0.1:" + std::to_string(m_port) + "/v1"; }

private:
    httplib::Server m_server;
    std::thread m_thread;
    int m_port{0};
};

} // namespace mini_test
