#include "talkbar/assistant/ControlQueue.h"

#include <utility>

namespace talkbar::assistant {

int ControlQueue::eventRank(const ControlEvent& event) {
    // 工作线程产生的事件同级，保持彼此的到达顺序
    if (std::holds_alternative<StageResult>(event) || std::holds_alternative<ListeningEvent>(event)) return 1;
    return 0;
}

bool ControlQueue::push(ControlEvent event) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_closed) return false;
        Item item;
        item.rank = eventRank(event);
        item.seq = m_nextSeq++;
        item.event = std::move(event);
        m_items.push(std::move(item));
    }
    m_cond.notify_one();
    return true;
}

std::optional<ControlEvent> ControlQueue::popUntil(Clock::time_point deadline) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cond.wait_until(lock, deadline, [this]() { return !m_items.empty() || m_closed; });
    if (m_items.empty()) return std::nullopt;
    return popLocked();
}

std::optional<ControlEvent> ControlQueue::tryPop() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_items.empty()) return std::nullopt;
    return popLocked();
}

size_t ControlQueue::size() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_items.size();
}

void ControlQueue::close() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_closed = true;
    }
    m_cond.notify_all();
}

bool ControlQueue::closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

ControlEvent ControlQueue::popLocked() {
    // priority_queue::top 只给 const 引用
    ControlEvent event = m_items.top().event;
    m_items.pop();
    return event;
}

} // namespace talkbar::assistant
