#pragma once

#include "talkbar/assistant/AssistantMessages.h"
#include "talkbar/assistant/AutoHideTimer.h"
#include "talkbar/assistant/Collaborators.h"
#include "talkbar/assistant/ControlQueue.h"
#include "talkbar/assistant/ErrorHandler.h"
#include "talkbar/assistant/SessionTypes.h"
#include "talkbar/assistant/WorkerDispatcher.h"

#include <atomic>
#include <chrono>
#include <optional>
#include <thread>

namespace talkbar::assistant {

class ConfigManager;

/**
 * @brief 会话编排器：单会话状态机 + 工作分发 + 结果仲裁 + 取消 + 自动隐藏
 *
 * 线程模型：
 * - activate()/cancel() 可在任意线程调用，只向控制队列投递事件
 * - 其余状态读写只发生在控制上下文（run() 所在线程，或测试中调用 processNext 的线程）
 * - 阶段结果仅在 token 等于当前代际时生效，否则无条件丢弃
 */
class SessionOrchestrator {
public:
    using Clock = std::chrono::steady_clock;

    struct Options {
        Options() {}

        std::chrono::milliseconds autoHide{5000};
        AssistantMessages messages;

        // assistant.auto_hide_ms + messages.*
        static Options fromConfig(const ConfigManager& cfg);
    };

    SessionOrchestrator(Capturer& capturer,
                        Inferencer& inferencer,
                        Speaker& speaker,
                        PresentationSurface& surface,
                        const ErrorHandler& logger,
                        Options options = Options{});
    ~SessionOrchestrator();

    // 禁止拷贝/移动
    SessionOrchestrator(const SessionOrchestrator&) = delete;
    SessionOrchestrator& operator=(const SessionOrchestrator&) = delete;

    // ========== 事件入口（线程安全） ==========
    void activate();
    void cancel();

    // ========== 控制上下文 ==========
    /**
     * @brief 处理一个事件或一次到期的自动隐藏
     * @param maxWait 最长等待；自动隐藏截止时间更早时提前醒来
     * @return 是否处理了事件或触发了自动隐藏
     */
    bool processNext(std::chrono::milliseconds maxWait);

    // 截止时间已到则触发自动隐藏；返回是否触发
    bool fireAutoHideIfDue(Clock::time_point now);

    // 阻塞运行控制循环，直到 stop()
    void run();
    // 在独立线程上运行控制循环
    void start();
    // 中断在途会话并停止控制循环；之后的事件被忽略
    void stop();
    bool isRunning() const { return m_running.load(); }

    // ========== 查询（控制上下文） ==========
    SessionState state() const { return m_session.state; }
    const Session& currentSession() const { return m_session; }
    GenerationToken currentGeneration() const { return m_generation; }
    std::optional<Clock::time_point> autoHideDeadline() const { return m_timer.deadline(); }

    // 线程安全
    size_t pendingEvents() const { return m_queue.size(); }
    size_t activeWorkers() const { return m_workers.activeCount(); }

private:
    void handleEvent(const ControlEvent& event);
    void onActivate();
    void onCancel();
    void onListening(GenerationToken token);
    void onStageResult(const StageResult& result);
    void onAutoHideFired(GenerationToken token);

    void startSession();
    void cancelCurrent(const char* reason);
    // 退出时放弃在途会话：换代并中断协作者，不再更新展示面
    void abandonInFlight(const char* reason);
    void interruptStage(SessionState state, GenerationToken token);
    void resetToIdle();

    void onCaptureResult(const StageResult& result);
    void onInferenceResult(const StageResult& result);
    void onPlaybackResult(const StageResult& result);
    void failStage(PipelineStage stage, SessionState failedState, ErrorInfo info);

    void transition(SessionState next);
    void publish();
    void armAutoHide();

    static SessionState expectedStateFor(PipelineStage stage);

    Capturer& m_capturer;
    Inferencer& m_inferencer;
    Speaker& m_speaker;
    PresentationSurface& m_surface;
    const ErrorHandler& m_logger;
    Options m_options;

    // 以下仅控制上下文读写
    Session m_session;
    GenerationToken m_generation{0};
    AutoHideTimer m_timer;

    ControlQueue m_queue;
    WorkerDispatcher m_workers; // 须在 m_queue 之后声明：析构时先 join 工作线程

    std::atomic<bool> m_running{false};
    std::thread m_loopThread;
};

} // namespace talkbar::assistant
