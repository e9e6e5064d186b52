#include "talkbar/assistant/ConfigManager.h"
#include "talkbar/assistant/ErrorHandler.h"
#include "talkbar/assistant/SpeechService.h"
#include "talkbar/assistant/SpeechCapturer.h"

#include "MiniTest.h"

#include <string>
#include <vector>

using namespace talkbar::assistant;
using State = Endpointer::State;
using Reason = Endpointer::EndReason;

// 16kHz 下 160 帧 = 10ms
static constexpr std::uint32_t kRate = 16000;
static constexpr std::uint32_t kChunk = 160;

static EndpointerConfig quietRoomConfig() {
    EndpointerConfig c;
    c.startThresholdDb = -41.0f;
    c.startHoldMs = 100;
    c.pauseMs = 500;
    c.listenTimeoutMs = 2000;
    c.phraseTimeLimitMs = 3000;
    c.calibrationMs = 0;
    return c;
}

// 连续喂入 ms 毫秒的同一能量，返回最终状态
static State feedFor(Endpointer& ep, float db, std::uint32_t ms) {
    State s = ep.state();
    for (std::uint32_t t = 0; t < ms; t += 10) {
        s = ep.feed(db, kChunk);
    }
    return s;
}

int main() {
    using mini_test::TestCase;

    std::vector<TestCase> tests;

    tests.push_back({"speech_then_pause_ends_utterance", []() {
        Endpointer ep(quietRoomConfig(), kRate);
        CHECK_TRUE(ep.state() == State::Waiting);
        CHECK_TRUE(feedFor(ep, -60.0f, 300) == State::Waiting);
        CHECK_TRUE(feedFor(ep, -20.0f, 800) == State::Speaking);
        // 起点 = 300ms 处
        CHECK_EQ(ep.speechStartFrame(), std::uint64_t{300 * kRate / 1000});
        CHECK_TRUE(feedFor(ep, -60.0f, 490) == State::Speaking);
        CHECK_TRUE(feedFor(ep, -60.0f, 10) == State::Ended);
        CHECK_TRUE(ep.endReason() == Reason::Pause);
    }});

    tests.push_back({"short_blip_does_not_start_speech", []() {
        Endpointer ep(quietRoomConfig(), kRate);
        feedFor(ep, -20.0f, 50);
        CHECK_TRUE(feedFor(ep, -60.0f, 100) == State::Waiting);
        CHECK_TRUE(feedFor(ep, -20.0f, 50) == State::Waiting);
    }});

    tests.push_back({"brief_dips_inside_speech_do_not_end_it", []() {
        Endpointer ep(quietRoomConfig(), kRate);
        feedFor(ep, -20.0f, 200);
        for (int i = 0; i < 5; ++i) {
            feedFor(ep, -60.0f, 300);
            CHECK_TRUE(feedFor(ep, -20.0f, 100) == State::Speaking);
        }
    }});

    tests.push_back({"silence_until_listen_timeout_is_no_speech", []() {
        Endpointer ep(quietRoomConfig(), kRate);
        CHECK_TRUE(feedFor(ep, -60.0f, 1990) == State::Waiting);
        CHECK_TRUE(feedFor(ep, -60.0f, 10) == State::Ended);
        CHECK_TRUE(ep.endReason() == Reason::ListenTimeout);
        // 结束后不再变化
        CHECK_TRUE(ep.feed(-10.0f, kChunk) == State::Ended);
        CHECK_TRUE(ep.endReason() == Reason::ListenTimeout);
    }});

    tests.push_back({"continuous_speech_hits_phrase_limit", []() {
        Endpointer ep(quietRoomConfig(), kRate);
        CHECK_TRUE(feedFor(ep, -15.0f, 2990) == State::Speaking);
        CHECK_TRUE(feedFor(ep, -15.0f, 10) == State::Ended);
        CHECK_TRUE(ep.endReason() == Reason::PhraseLimit);
    }});

    tests.push_back({"calibration_raises_threshold_in_noisy_room", []() {
        auto cfg = quietRoomConfig();
        cfg.calibrationMs = 200;
        cfg.noiseMarginDb = 6.0f;
        Endpointer ep(cfg, kRate);
        CHECK_TRUE(ep.state() == State::Calibrating);
        CHECK_TRUE(feedFor(ep, -30.0f, 200) == State::Waiting);
        CHECK_EQ(ep.threshold(), -24.0f);
        // 环境噪声本身不再触发
        CHECK_TRUE(feedFor(ep, -30.0f, 500) == State::Waiting);
        CHECK_TRUE(feedFor(ep, -18.0f, 100) == State::Speaking);
    }});

    tests.push_back({"calibration_never_lowers_configured_threshold", []() {
        auto cfg = quietRoomConfig();
        cfg.calibrationMs = 100;
        Endpointer ep(cfg, kRate);
        feedFor(ep, -80.0f, 100);
        CHECK_EQ(ep.threshold(), -41.0f);
    }});

    tests.push_back({"reset_restarts_detection", []() {
        Endpointer ep(quietRoomConfig(), kRate);
        feedFor(ep, -60.0f, 2000);
        CHECK_TRUE(ep.state() == State::Ended);
        ep.reset();
        CHECK_TRUE(ep.state() == State::Waiting);
        CHECK_TRUE(ep.endReason() == Reason::None);
        CHECK_EQ(ep.totalFrames(), std::uint64_t{0});
    }});

    tests.push_back({"endpointer_config_reads_stt_section", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString(R"({"stt":{"pause_ms":800,"start_threshold_db":-35.5,"calibration_ms":0}})", &err));
        const auto c = EndpointerConfig::fromConfig(cm);
        CHECK_EQ(c.pauseMs, 800u);
        CHECK_EQ(c.startThresholdDb, -35.5f);
        CHECK_EQ(c.calibrationMs, 0u);
        // 默认值
        CHECK_EQ(c.listenTimeoutMs, 10000u);
        CHECK_EQ(c.phraseTimeLimitMs, 30000u);
        CHECK_EQ(c.startHoldMs, 120u);
    }});

    tests.push_back({"interrupted_token_is_abandoned_before_recording", []() {
        ConfigManager cm;
        ErrorInfo err;
        CHECK_TRUE(cm.loadFromString("{}", &err));
        SpeechService speech(cm);
        ErrorHandler logger(ErrorHandler::LoggerConfig{ErrorHandler::LogLevel::Error, false, ""});
        SpeechCapturer capturer(cm, speech, logger);

        capturer.interrupt(5);
        // 同代与更早代际都不再打开麦克风
        for (GenerationToken token : {GenerationToken{5}, GenerationToken{3}}) {
            bool announced = false;
            bool thrown = false;
            try {
                capturer.capture(token, [&]() { announced = true; });
            } catch (const CaptureError& e) {
                thrown = true;
                CHECK_TRUE(e.stage() == PipelineStage::Capture);
                CHECK_TRUE(e.info().errorType == ErrorType::UnknownError);
            }
            CHECK_TRUE(thrown);
            CHECK_FALSE(announced);
        }
    }});

    return mini_test::run(tests);
}
