#include "talkbar/assistant/WorkerDispatcher.h"

#include "talkbar/assistant/Collaborators.h"

#include <utility>

namespace talkbar::assistant {

WorkerDispatcher::WorkerDispatcher(ControlQueue& queue, const ErrorHandler& logger)
    : m_queue(queue)
    , m_logger(logger)
{}

WorkerDispatcher::~WorkerDispatcher() {
    joinAll();
}

StageResult WorkerDispatcher::runStage(PipelineStage stage, GenerationToken token, const StageCall& call) {
    StageResult result;
    result.stage = stage;
    result.token = token;
    try {
        result.text = call();
    } catch (const StageError& e) {
        result.error = e.info();
    } catch (const std::exception& e) {
        result.error = ErrorInfo::make(ErrorType::UnknownError, e.what());
    } catch (...) {
        result.error = ErrorInfo::make(ErrorType::UnknownError, "unknown exception in stage call");
    }
    if (result.error.has_value()) {
        result.error->addContext("stage", stageToString(stage));
    }
    return result;
}

void WorkerDispatcher::dispatch(PipelineStage stage, GenerationToken token, StageCall call) {
    std::lock_guard<std::mutex> lock(m_mutex);
    reapFinishedLocked();

    auto done = std::make_shared<std::atomic<bool>>(false);
    Worker worker;
    worker.done = done;
    worker.thread = std::thread([this, stage, token, call = std::move(call), done]() {
        auto result = runStage(stage, token, call);
        if (!m_queue.push(std::move(result))) {
            m_logger.log(ErrorHandler::LogLevel::Debug,
                         std::string("Control queue closed, dropping ") + stageToString(stage) +
                             " result token=" + std::to_string(token));
        }
        done->store(true, std::memory_order_release);
    });
    m_workers.push_back(std::move(worker));

    m_logger.log(ErrorHandler::LogLevel::Debug,
                 std::string("Dispatched ") + stageToString(stage) + " worker token=" + std::to_string(token));
}

size_t WorkerDispatcher::activeCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t n = 0;
    for (const auto& w : m_workers) {
        if (!w.done->load(std::memory_order_acquire)) n++;
    }
    return n;
}

void WorkerDispatcher::joinAll() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        workers.swap(m_workers);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}

void WorkerDispatcher::reapFinishedLocked() {
    for (auto it = m_workers.begin(); it != m_workers.end();) {
        if (it->done->load(std::memory_order_acquire)) {
            if (it->thread.joinable()) it->thread.join();
            it = m_workers.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace talkbar::assistant
