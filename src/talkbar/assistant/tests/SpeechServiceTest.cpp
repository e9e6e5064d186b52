#include "talkbar/assistant/ConfigManager.h"
#include "talkbar/assistant/SpeechService.h"

#include "LoopbackServer.h"
#include "MiniTest.h"

#include <mutex>
#include <string>
#include <vector>

using namespace talkbar::assistant;

static void configure(ConfigManager& cm, const std::string& json) {
    ErrorInfo err;
    if (!cm.loadFromString(json, &err)) {
        throw std::runtime_error("loadFromString failed: " + err.message);
    }
}

// 指向本地服务，STT/TTS 都走 llm.* 回退
static void pointAt(ConfigManager& cm, const std::string& baseUrl) {
    configure(cm, "{}");
    cm.set("llm.base_url", baseUrl);
    cm.set("llm.api_key", "sk-speech-abcdefgh");
    cm.set("stt.timeout_ms", 3000);
    cm.set("tts.timeout_ms", 3000);
}

static std::vector<std::uint8_t> fakeWav() {
    std::vector<std::uint8_t> v{'R', 'I', 'F', 'F'};
    v.resize(64, 0);
    return v;
}

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    tests.push_back({"stt_and_tts_fall_back_to_llm_endpoint", []() {
        ConfigManager cm;
        configure(cm, R"({"llm":{"base_url":"http://llm.local/v1","api_key":"sk-llm-key-000"}})");
        SpeechService s(cm);
        CHECK_EQ(s.sttConfig().baseUrl, std::string("http://llm.local/v1"));
        CHECK_EQ(s.sttConfig().apiKey, std::string("sk-llm-key-000"));
        CHECK_EQ(s.sttConfig().language.value_or(""), std::string("th"));
        CHECK_EQ(s.ttsConfig().baseUrl, std::string("http://llm.local/v1"));
        CHECK_EQ(s.ttsConfig().voice, std::string("th-TH-PremwadeeNeural"));
        CHECK_EQ(s.ttsConfig().responseFormat, std::string("mp3"));
    }});

    tests.push_back({"explicit_stt_endpoint_wins_over_llm", []() {
        ConfigManager cm;
        configure(cm, R"({"llm":{"base_url":"http://llm.local/v1"},
                          "stt":{"base_url":"http://stt.local/v1","api_key":"sk-stt-key-111","language":"en"}})");
        SpeechService s(cm);
        CHECK_EQ(s.sttConfig().baseUrl, std::string("http://stt.local/v1"));
        CHECK_EQ(s.sttConfig().apiKey, std::string("sk-stt-key-111"));
        CHECK_EQ(s.sttConfig().language.value_or(""), std::string("en"));
        CHECK_EQ(s.ttsConfig().baseUrl, std::string("http://llm.local/v1"));
    }});

    tests.push_back({"parse_transcription_variants", []() {
        auto flat = SpeechService::parseSTTResponse(R"({"text":"สวัสดี","language":"th","duration":1.5})");
        CHECK_TRUE(flat.has_value());
        CHECK_EQ(flat->text, std::string("สวัสดี"));
        CHECK_EQ(flat->language.value_or(""), std::string("th"));
        CHECK_TRUE(flat->duration.has_value());

        auto nested = SpeechService::parseSTTResponse(R"({"data":{"text":"hello"}})");
        CHECK_TRUE(nested.has_value());
        CHECK_EQ(nested->text, std::string("hello"));

        // 空文本是合法结果（听不懂），由调用方决定
        auto empty = SpeechService::parseSTTResponse(R"({"text":""})");
        CHECK_TRUE(empty.has_value());
        CHECK_TRUE(empty->text.empty());

        CHECK_FALSE(SpeechService::parseSTTResponse("not json").has_value());
        CHECK_FALSE(SpeechService::parseSTTResponse(R"({"result":"x"})").has_value());
        CHECK_FALSE(SpeechService::parseSTTResponse(R"(["text"])").has_value());
    }});

    tests.push_back({"transcribe_uploads_multipart_with_auth", []() {
        std::mutex mu;
        std::string contentType;
        std::string auth;
        mini_test::LoopbackServer srv;
        srv.server().Post("/v1/audio/transcriptions", [&](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lk(mu);
            contentType = req.get_header_value("Content-Type");
            auth = req.get_header_value("Authorization");
            res.set_content(R"({"text":" ไปไหนมา "})", "application/json");
        });
        CHECK_TRUE(srv.start());

        ConfigManager cm;
        pointAt(cm, srv.baseUrl());
        SpeechService s(cm);
        ErrorInfo err;
        const auto r = s.speechToText(fakeWav(), &err);
        CHECK_TRUE(r.has_value());
        CHECK_EQ(r->text, std::string(" ไปไหนมา "));

        std::lock_guard<std::mutex> lk(mu);
        CHECK_EQ(contentType.rfind("multipart/form-data", 0), size_t{0});
        CHECK_EQ(auth, std::string("Bearer sk-speech-abcdefgh"));
    }});

    tests.push_back({"transcribe_reports_backend_error", []() {
        mini_test::LoopbackServer srv;
        srv.server().Post("/v1/audio/transcriptions", [](const httplib::Request&, httplib::Response& res) {
            res.status = 400;
            res.set_content(R"({"error":{"message":"unsupported audio"}})", "application/json");
        });
        CHECK_TRUE(srv.start());

        ConfigManager cm;
        pointAt(cm, srv.baseUrl());
        SpeechService s(cm);
        ErrorInfo err;
        CHECK_FALSE(s.speechToText(fakeWav(), &err).has_value());
        CHECK_TRUE(err.errorType == ErrorType::InvalidRequest);
        CHECK_EQ(err.errorCode, 400);
        CHECK_EQ(err.message, std::string("unsupported audio"));
    }});

    tests.push_back({"empty_audio_is_rejected_locally", []() {
        ConfigManager cm;
        pointAt(cm, "http://127.0.0.1:1/v1");
        SpeechService s(cm);
        ErrorInfo err;
        CHECK_FALSE(s.speechToText({}, &err).has_value());
        CHECK_TRUE(err.errorType == ErrorType::InvalidRequest);
        CHECK_FALSE(s.textToSpeech("", &err).has_value());
    }});

    tests.push_back({"synthesize_returns_audio_bytes", []() {
        std::mutex mu;
        nlohmann::json body;
        mini_test::LoopbackServer srv;
        srv.server().Post("/v1/audio/speech", [&](const httplib::Request& req, httplib::Response& res) {
            std::lock_guard<std::mutex> lk(mu);
            body = nlohmann::json::parse(req.body, nullptr, false);
            std::string audio("ID3");
            audio.push_back('\x04');
            audio.push_back('\0');
            audio += "fakeaudio";
            res.set_content(audio, "audio/mpeg");
        });
        CHECK_TRUE(srv.start());

        ConfigManager cm;
        pointAt(cm, srv.baseUrl());
        SpeechService s(cm);
        ErrorInfo err;
        const auto r = s.textToSpeech("สวัสดีครับ", &err);
        CHECK_TRUE(r.has_value());
        CHECK_EQ(r->audioData.size(), size_t{14});
        CHECK_EQ(r->format, std::string("mp3"));

        std::lock_guard<std::mutex> lk(mu);
        CHECK_EQ(body["input"].get<std::string>(), std::string("สวัสดีครับ"));
        CHECK_EQ(body["voice"].get<std::string>(), std::string("th-TH-PremwadeeNeural"));
        CHECK_EQ(body["stream"].get<bool>(), false);
    }});

    tests.push_back({"synthesize_rejects_json_success_body", []() {
        mini_test::LoopbackServer srv;
        srv.server().Post("/v1/audio/speech", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"status":"queued"})", "application/json");
        });
        CHECK_TRUE(srv.start());

        ConfigManager cm;
        pointAt(cm, srv.baseUrl());
        SpeechService s(cm);
        ErrorInfo err;
        CHECK_FALSE(s.textToSpeech("hello", &err).has_value());
        CHECK_TRUE(err.errorType == ErrorType::ServerError);
    }});

    return mini_test::run(tests);
}
