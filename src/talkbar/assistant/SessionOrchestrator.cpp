#include "talkbar/assistant/SessionOrchestrator.h"

#include "talkbar/assistant/ConfigManager.h"

#include <string>
#include <utility>

namespace talkbar::assistant {

using LogLevel = ErrorHandler::LogLevel;

SessionOrchestrator::Options SessionOrchestrator::Options::fromConfig(const ConfigManager& cfg) {
    Options o;
    const int ms = cfg.getInt("assistant.auto_hide_ms", static_cast<int>(o.autoHide.count()));
    o.autoHide = std::chrono::milliseconds(ms < 0 ? 0 : ms);
    o.messages = AssistantMessages::fromConfig(cfg);
    return o;
}

SessionOrchestrator::SessionOrchestrator(Capturer& capturer,
                                         Inferencer& inferencer,
                                         Speaker& speaker,
                                         PresentationSurface& surface,
                                         const ErrorHandler& logger,
                                         Options options)
    : m_capturer(capturer)
    , m_inferencer(inferencer)
    , m_speaker(speaker)
    , m_surface(surface)
    , m_logger(logger)
    , m_options(std::move(options))
    , m_workers(m_queue, logger)
{}

SessionOrchestrator::~SessionOrchestrator() {
    stop();
    // 没有控制线程时（由调用方驱动 processNext），析构线程即控制上下文
    abandonInFlight("shutdown");
    m_workers.joinAll();
}

// ========== 事件入口 ==========

void SessionOrchestrator::activate() {
    m_queue.push(ActivateEvent{});
}

void SessionOrchestrator::cancel() {
    m_queue.push(CancelEvent{});
}

// ========== 控制循环 ==========

bool SessionOrchestrator::processNext(std::chrono::milliseconds maxWait) {
    const auto now = Clock::now();
    if (fireAutoHideIfDue(now)) return true;

    auto deadline = now + maxWait;
    if (const auto hideAt = m_timer.deadline(); hideAt.has_value() && *hideAt < deadline) {
        deadline = *hideAt;
    }

    auto event = m_queue.popUntil(deadline);
    if (!event.has_value()) {
        return fireAutoHideIfDue(Clock::now());
    }
    handleEvent(*event);
    return true;
}

bool SessionOrchestrator::fireAutoHideIfDue(Clock::time_point now) {
    const auto token = m_timer.expired(now);
    if (!token.has_value()) return false;
    onAutoHideFired(*token);
    return true;
}

void SessionOrchestrator::run() {
    m_running.store(true);
    m_logger.log(LogLevel::Info, "Session orchestrator loop started");
    while (m_running.load() && !m_queue.closed()) {
        processNext(std::chrono::milliseconds(200));
    }
    m_logger.log(LogLevel::Info, "Session orchestrator loop stopped");
}

void SessionOrchestrator::start() {
    if (m_loopThread.joinable()) return;
    m_running.store(true);
    m_loopThread = std::thread([this]() { run(); });
}

void SessionOrchestrator::stop() {
    if (m_loopThread.joinable()) {
        // 交给控制线程中断在途会话，再退出循环
        if (!m_queue.push(ShutdownEvent{})) m_running.store(false);
        m_loopThread.join();
    }
    m_running.store(false);
    m_queue.close();
}

void SessionOrchestrator::handleEvent(const ControlEvent& event) {
    if (std::holds_alternative<ActivateEvent>(event)) {
        onActivate();
    } else if (std::holds_alternative<CancelEvent>(event)) {
        onCancel();
    } else if (std::holds_alternative<ShutdownEvent>(event)) {
        abandonInFlight("shutdown");
        m_running.store(false);
    } else if (const auto* listening = std::get_if<ListeningEvent>(&event)) {
        onListening(listening->token);
    } else {
        onStageResult(std::get<StageResult>(event));
    }
}

// ========== 手势 ==========

void SessionOrchestrator::onActivate() {
    // 在途时再次激活等同取消，保证单会话
    if (isInFlight(m_session.state)) {
        cancelCurrent("re-activation");
        return;
    }
    startSession();
}

void SessionOrchestrator::onCancel() {
    if (m_session.state == SessionState::Idle) {
        m_timer.disarm();
        m_logger.log(LogLevel::Debug, "Cancel ignored: no active session");
        return;
    }
    cancelCurrent("dismiss");
}

void SessionOrchestrator::startSession() {
    m_timer.disarm();

    Session s;
    s.id = ++m_generation;
    m_session = std::move(s);
    m_logger.log(LogLevel::Info, "Session " + std::to_string(m_session.id) + " started");

    transition(SessionState::Capturing);
    const auto token = m_session.id;
    m_workers.dispatch(PipelineStage::Capture, token, [this, token]() {
        return m_capturer.capture(token, [this, token]() { m_queue.push(ListeningEvent{token}); });
    });
    publish();
}

void SessionOrchestrator::cancelCurrent(const char* reason) {
    const auto prev = m_session.state;
    const auto token = m_session.id;

    // 换到一个全新、未使用的代际；迟到结果因 token 不匹配被丢弃
    ++m_generation;
    m_timer.disarm();
    m_logger.log(LogLevel::Info,
                 "Session " + std::to_string(token) + " cancelled (" + reason + ") in state " +
                     sessionStateToString(prev));

    interruptStage(prev, token);
    resetToIdle();
}

void SessionOrchestrator::abandonInFlight(const char* reason) {
    if (!isInFlight(m_session.state)) return;
    const auto prev = m_session.state;
    const auto token = m_session.id;

    ++m_generation;
    m_timer.disarm();
    m_logger.log(LogLevel::Info,
                 "Session " + std::to_string(token) + " abandoned (" + reason + ") in state " +
                     sessionStateToString(prev));
    interruptStage(prev, token);
    transition(SessionState::Idle);
}

void SessionOrchestrator::interruptStage(SessionState state, GenerationToken token) {
    // 中断是尽力而为；迟到的结果会因 token 失效被丢弃
    try {
        switch (state) {
            case SessionState::Capturing: m_capturer.interrupt(token); break;
            case SessionState::Thinking: m_inferencer.interrupt(token); break;
            case SessionState::Speaking: m_speaker.interrupt(token); break;
            default: break;
        }
    } catch (const std::exception& e) {
        m_logger.log(LogLevel::Warning,
                     std::string("Interrupt in state ") + sessionStateToString(state) + " failed: " + e.what());
    }
}

void SessionOrchestrator::resetToIdle() {
    const auto id = m_session.id;
    m_session = Session{};
    m_session.id = id;
    transition(SessionState::Idle);
    m_surface.hide();
}

void SessionOrchestrator::onListening(GenerationToken token) {
    if (token != m_generation || m_session.state != SessionState::Capturing || m_session.listening) {
        return;
    }
    m_session.listening = true;
    publish();
}

// ========== 阶段结果 ==========

SessionState SessionOrchestrator::expectedStateFor(PipelineStage stage) {
    switch (stage) {
        case PipelineStage::Capture: return SessionState::Capturing;
        case PipelineStage::Inference: return SessionState::Thinking;
        case PipelineStage::Playback: return SessionState::Speaking;
    }
    return SessionState::Idle;
}

void SessionOrchestrator::onStageResult(const StageResult& result) {
    if (result.token != m_generation || m_session.state != expectedStateFor(result.stage)) {
        m_logger.log(LogLevel::Debug,
                     std::string("Discarding stale ") + stageToString(result.stage) + " result token=" +
                         std::to_string(result.token) + " current=" + std::to_string(m_generation));
        return;
    }

    switch (result.stage) {
        case PipelineStage::Capture: onCaptureResult(result); break;
        case PipelineStage::Inference: onInferenceResult(result); break;
        case PipelineStage::Playback: onPlaybackResult(result); break;
    }
}

void SessionOrchestrator::onCaptureResult(const StageResult& result) {
    if (!result.ok()) {
        failStage(PipelineStage::Capture, SessionState::CaptureFailed, *result.error);
        return;
    }
    if (result.text.find_first_not_of(" \t\r\n") == std::string::npos) {
        failStage(PipelineStage::Capture, SessionState::CaptureFailed,
                  ErrorInfo::make(ErrorType::NoSpeech, "Empty transcript"));
        return;
    }

    m_session.transcript = result.text;
    transition(SessionState::Thinking);
    const auto token = m_session.id;
    const auto transcript = result.text;
    m_workers.dispatch(PipelineStage::Inference, token, [this, transcript, token]() {
        return m_inferencer.query(transcript, token);
    });
    publish();
}

void SessionOrchestrator::onInferenceResult(const StageResult& result) {
    if (!result.ok()) {
        failStage(PipelineStage::Inference, SessionState::InferenceFailed, *result.error);
        return;
    }

    m_session.reply = result.text;
    transition(SessionState::Speaking);
    const auto token = m_session.id;
    const auto reply = result.text;
    m_workers.dispatch(PipelineStage::Playback, token, [this, reply, token]() {
        m_speaker.speak(reply, token);
        return std::string();
    });
    publish();
}

void SessionOrchestrator::onPlaybackResult(const StageResult& result) {
    if (!result.ok()) {
        failStage(PipelineStage::Playback, SessionState::PlaybackFailed, *result.error);
        return;
    }
    transition(SessionState::Done);
    armAutoHide();
    publish();
}

void SessionOrchestrator::failStage(PipelineStage stage, SessionState failedState, ErrorInfo info) {
    m_logger.log(LogLevel::Warning,
                 "Session " + std::to_string(m_session.id) + " " + stageToString(stage) + " failed",
                 info);
    m_session.error = StageFailure{stage, std::move(info)};
    transition(failedState);
    armAutoHide();
    publish();
}

// ========== 自动隐藏 ==========

void SessionOrchestrator::armAutoHide() {
    m_timer.arm(Clock::now(), m_options.autoHide, m_session.id);
}

void SessionOrchestrator::onAutoHideFired(GenerationToken token) {
    if (token != m_generation || !isRestState(m_session.state)) {
        m_logger.log(LogLevel::Debug,
                     "Ignoring stale auto-hide token=" + std::to_string(token) +
                         " current=" + std::to_string(m_generation));
        return;
    }
    m_logger.log(LogLevel::Info, "Session " + std::to_string(token) + " auto-hidden");
    resetToIdle();
}

// ========== 展示 ==========

void SessionOrchestrator::transition(SessionState next) {
    const auto prev = m_session.state;
    m_session.state = next;
    m_logger.log(LogLevel::Info,
                 "Session " + std::to_string(m_session.id) + ": " + sessionStateToString(prev) + " -> " +
                     sessionStateToString(next));
}

void SessionOrchestrator::publish() {
    const auto& msg = m_options.messages;
    SurfaceView view;
    view.state = m_session.state;

    switch (m_session.state) {
        case SessionState::Capturing:
            view.status = m_session.listening ? msg.speakNow : msg.listening;
            break;
        case SessionState::Thinking:
            view.status = msg.thinking;
            view.text = m_session.transcript;
            break;
        case SessionState::Speaking:
        case SessionState::Done:
            view.status = msg.answer;
            view.text = m_session.reply;
            break;
        case SessionState::CaptureFailed:
        case SessionState::InferenceFailed:
        case SessionState::PlaybackFailed:
            if (m_session.error.has_value()) {
                view.status = msg.forError(m_session.error->stage, m_session.error->info);
                view.errorKind = m_session.error->info.errorType;
            }
            // 播放失败不影响信息送达：回复文本保留
            if (m_session.state == SessionState::PlaybackFailed) view.text = m_session.reply;
            break;
        case SessionState::Idle:
            return;
    }
    m_surface.update(view);
}

} // namespace talkbar::assistant
