#pragma once

#include "talkbar/assistant/ControlQueue.h"
#include "talkbar/assistant/ErrorHandler.h"
#include "talkbar/assistant/SessionTypes.h"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace talkbar::assistant {

/**
 * @brief 阶段工作分发器
 *
 * 每次 dispatch 起一个线程，只做一次阻塞协作者调用；
 * 结果（含异常转换后的错误）以 StageResult 投递回 ControlQueue。
 * 工作线程不接触编排器状态；被取消的工作允许在后台跑完。
 */
class WorkerDispatcher {
public:
    // 返回阶段文本；失败时抛 StageError 或其它 std::exception
    using StageCall = std::function<std::string()>;

    WorkerDispatcher(ControlQueue& queue, const ErrorHandler& logger);
    ~WorkerDispatcher();

    // 禁止拷贝/移动
    WorkerDispatcher(const WorkerDispatcher&) = delete;
    WorkerDispatcher& operator=(const WorkerDispatcher&) = delete;

    void dispatch(PipelineStage stage, GenerationToken token, StageCall call);

    // 仍在运行的工作线程数
    size_t activeCount() const;

    // 等待全部工作线程结束
    void joinAll();

    // 执行一次调用并把结果/异常转换成 StageResult（工作线程内使用）
    static StageResult runStage(PipelineStage stage, GenerationToken token, const StageCall& call);

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    void reapFinishedLocked();

    ControlQueue& m_queue;
    const ErrorHandler& m_logger;

    mutable std::mutex m_mutex;
    std::vector<Worker> m_workers;
};

} // namespace talkbar::assistant
