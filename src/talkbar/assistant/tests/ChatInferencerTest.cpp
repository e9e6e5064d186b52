#include "talkbar/assistant/ChatInferencer.h"
#include "talkbar/assistant/ConfigManager.h"
#include "talkbar/assistant/utils/StringUtils.h"

#include "LoopbackServer.h"
#include "MiniTest.h"

#include <mutex>
#include <string>
#include <vector>

using namespace talkbar::assistant;
using talkbar::assistant::types::ChatResponse;
using talkbar::assistant::types::MessageRole;

static void configure(ConfigManager& cm, const std::string& baseUrl, const std::string& systemPrompt = "") {
    ErrorInfo err;
    if (!cm.loadFromString("{}", &err)) {
        throw std::runtime_error("loadFromString failed: " + err.message);
    }
    cm.set("llm.base_url", baseUrl);
    cm.set("llm.api_key", "sk-test-123456789");
    cm.set("llm.max_retries", 0);
    cm.set("llm.timeout_ms", 3000);
    cm.set("llm.system_prompt", systemPrompt);
}

static std::string completion(const std::string& content) {
    nlohmann::json j;
    j["choices"] = nlohmann::json::array({{{"index", 0},
                                           {"finish_reason", "stop"},
                                           {"message", {{"role", "assistant"}, {"content", content}}}}});
    j["model"] = "openclaw";
    return j.dump();
}

// 记录收到的 chat 请求体
struct ChatBackend {
    std::mutex mu;
    std::vector<nlohmann::json> bodies;
    std::vector<std::string> authHeaders;
    int status{200};
    std::string reply{"ok"};
    std::string rawBody;

    void install(httplib::Server& svr) {
        svr.Post("/v1/chat/completions", [this](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lk(mu);
            bodies.push_back(nlohmann::json::parse(req.body, nullptr, false));
            authHeaders.push_back(req.get_header_value("Authorization"));
            res.status = status;
            res.set_content(rawBody.empty() ? completion(reply) : rawBody, "application/json");
        });
    }
};

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    tests.push_back({"history_drops_oldest_messages_when_full", []() {
        ConversationHistory h(4);
        h.appendTurn("u1", "a1");
        h.appendTurn("u2", "a2");
        h.appendTurn("u3", "a3");
        CHECK_EQ(h.size(), size_t{4});
        const auto snap = h.snapshot();
        CHECK_EQ(snap.front().content, std::string("u2"));
        CHECK_TRUE(snap.front().role == MessageRole::User);
        CHECK_EQ(snap.back().content, std::string("a3"));
        CHECK_TRUE(snap.back().role == MessageRole::Assistant);
    }});

    tests.push_back({"history_with_zero_cap_keeps_nothing", []() {
        ConversationHistory h(0);
        h.appendTurn("u1", "a1");
        CHECK_EQ(h.size(), size_t{0});
    }});

    tests.push_back({"request_is_system_then_history_then_user", []() {
        ConfigManager cm;
        configure(cm, "http://127.0.0.1:1/v1", "Answer briefly.");
        ChatInferencer inf(cm);
        inf.history().appendTurn("hello", "hi");
        const auto req = inf.buildRequest("what time is it");
        CHECK_EQ(req.model, std::string("openclaw"));
        CHECK_EQ(req.messages.size(), size_t{4});
        CHECK_TRUE(req.messages[0].role == MessageRole::System);
        CHECK_EQ(req.messages[1].content, std::string("hello"));
        CHECK_EQ(req.messages[2].content, std::string("hi"));
        CHECK_EQ(req.messages[3].content, std::string("what time is it"));
        CHECK_TRUE(req.temperature.has_value());
        CHECK_EQ(req.maxTokens.value_or(0), 1024u);
    }});

    tests.push_back({"request_without_system_prompt_starts_with_user", []() {
        ConfigManager cm;
        configure(cm, "http://127.0.0.1:1/v1");
        ChatInferencer inf(cm);
        const auto req = inf.buildRequest("hello");
        CHECK_EQ(req.messages.size(), size_t{1});
        CHECK_TRUE(req.messages[0].role == MessageRole::User);
    }});

    tests.push_back({"query_trims_reply_and_records_turn", []() {
        ChatBackend backend;
        backend.reply = "  สวัสดีครับ \n";
        mini_test::LoopbackServer srv;
        backend.install(srv.server());
        CHECK_TRUE(srv.start());

        ConfigManager cm;
        configure(cm, srv.baseUrl());
        ChatInferencer inf(cm);
        CHECK_EQ(inf.query("สวัสดี", 1), std::string("สวัสดีครับ"));
        CHECK_EQ(inf.history().size(), size_t{2});

        CHECK_EQ(inf.query("again", 2), std::string("สวัสดีครับ"));
        std::lock_guard<std::mutex> lk(backend.mu);
        CHECK_EQ(backend.bodies.size(), size_t{2});
        // 第二次请求带上第一轮历史
        CHECK_EQ(backend.bodies[1]["messages"].size(), size_t{3});
        CHECK_EQ(backend.bodies[1]["messages"][0]["content"].get<std::string>(), std::string("สวัสดี"));
        CHECK_EQ(backend.bodies[1]["model"].get<std::string>(), std::string("openclaw"));
        CHECK_EQ(backend.authHeaders[0], std::string("Bearer sk-test-123456789"));
    }});

    tests.push_back({"trim_keeps_utf8_bytes_intact", []() {
        const std::string thai = "\xE0\xB8\xAA\xE0\xB8\xA7\xE0\xB8\xB1\xE0\xB8\xAA\xE0\xB8\x94\xE0\xB8\xB5";
        CHECK_EQ(utils::trimCopy(" " + thai + " \n"), thai);
        CHECK_EQ(utils::trimCopy(" สวัสดี "), std::string("สวัสดี"));
        CHECK_EQ(utils::trimCopy("\t\r\n "), std::string());
        // 结尾字节 0xB5 等不能被当作空白
        CHECK_EQ(utils::trimCopy(thai).size(), thai.size());
    }});

    tests.push_back({"interrupted_turn_is_not_recorded", []() {
        ChatBackend backend;
        backend.reply = "late answer";
        mini_test::LoopbackServer srv;
        ConfigManager cm;
        ChatInferencer* target = nullptr;
        // 服务端在返回之前模拟用户取消第 7 轮
        srv.server().Post("/v1/chat/completions", [&](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> lk(backend.mu);
                backend.bodies.push_back(nlohmann::json::parse(req.body, nullptr, false));
            }
            if (target) target->interrupt(7);
            res.set_content(completion(backend.reply), "application/json");
        });
        CHECK_TRUE(srv.start());

        configure(cm, srv.baseUrl());
        ChatInferencer inf(cm);
        target = &inf;
        CHECK_EQ(inf.query("first question", 7), std::string("late answer"));
        CHECK_EQ(inf.history().size(), size_t{0});

        // 更早代际直接拒绝，不发请求
        bool thrown = false;
        try {
            inf.query("stale", 6);
        } catch (const InferenceError& e) {
            thrown = true;
            CHECK_TRUE(e.info().errorType == ErrorType::UnknownError);
        }
        CHECK_TRUE(thrown);

        target = nullptr;
        CHECK_EQ(inf.query("second question", 8), std::string("late answer"));
        CHECK_EQ(inf.history().size(), size_t{2});
        std::lock_guard<std::mutex> lk(backend.mu);
        CHECK_EQ(backend.bodies.size(), size_t{2});
        // 被取消的一轮不出现在下一次请求里
        CHECK_EQ(backend.bodies[1]["messages"].size(), size_t{1});
        CHECK_EQ(backend.bodies[1]["messages"][0]["content"].get<std::string>(), std::string("second question"));
    }});

    tests.push_back({"backend_error_becomes_inference_error_with_status", []() {
        ChatBackend backend;
        backend.status = 500;
        backend.rawBody = R"({"error":{"message":"model crashed","type":"server_error"}})";
        mini_test::LoopbackServer srv;
        backend.install(srv.server());
        CHECK_TRUE(srv.start());

        ConfigManager cm;
        configure(cm, srv.baseUrl());
        ChatInferencer inf(cm);
        bool thrown = false;
        try {
            inf.query("hello", 1);
        } catch (const InferenceError& e) {
            thrown = true;
            CHECK_TRUE(e.stage() == PipelineStage::Inference);
            CHECK_TRUE(e.info().errorType == ErrorType::ServerError);
            CHECK_EQ(e.info().message, std::string("HTTP 500: model crashed"));
        }
        CHECK_TRUE(thrown);
        CHECK_EQ(inf.history().size(), size_t{0});
    }});

    tests.push_back({"empty_reply_is_an_inference_error", []() {
        ChatBackend backend;
        backend.reply = "   ";
        mini_test::LoopbackServer srv;
        backend.install(srv.server());
        CHECK_TRUE(srv.start());

        ConfigManager cm;
        configure(cm, srv.baseUrl());
        ChatInferencer inf(cm);
        bool thrown = false;
        try {
            inf.query("hello", 1);
        } catch (const InferenceError& e) {
            thrown = true;
            CHECK_TRUE(e.info().errorType == ErrorType::ServerError);
        }
        CHECK_TRUE(thrown);
        CHECK_EQ(inf.history().size(), size_t{0});
    }});

    tests.push_back({"unreachable_backend_is_network_error", []() {
        int closedPort = 0;
        {
            mini_test::LoopbackServer srv;
            CHECK_TRUE(srv.start());
            closedPort = srv.port();
        }
        ConfigManager cm;
        configure(cm, "http://127.0.0.1:" + std::to_string(closedPort) + "/v1");
        ChatInferencer inf(cm);
        bool thrown = false;
        try {
            inf.query("hello", 1);
        } catch (const InferenceError& e) {
            thrown = true;
            CHECK_TRUE(e.info().errorType == ErrorType::NetworkError);
        }
        CHECK_TRUE(thrown);
    }});

    tests.push_back({"response_without_choices_does_not_parse", []() {
        CHECK_FALSE(ChatResponse::fromJson(nlohmann::json{{"id", "x"}}).has_value());
        const auto ok = ChatResponse::fromJson(nlohmann::json::parse(completion("hi")));
        CHECK_TRUE(ok.has_value());
        CHECK_EQ(ok->content, std::string("hi"));
        CHECK_EQ(ok->finishReason.value_or(""), std::string("stop"));
    }});

    tests.push_back({"api_key_is_redacted_for_diagnostics", []() {
        ConfigManager cm;
        configure(cm, "http://127.0.0.1:1/v1");
        APIClient client(cm);
        CHECK_EQ(client.getApiKeyRedacted(), std::string("sk******89"));
        CHECK_EQ(client.getMaxRetries(), 0);
        CHECK_EQ(client.getTimeoutMs(), 3000);
    }});

    return mini_test::run(tests);
}
