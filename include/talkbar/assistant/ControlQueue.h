#pragma once

#include "talkbar/assistant/SessionTypes.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace talkbar::assistant {

/**
 * @brief 控制上下文的有序事件队列（线程安全）
 *
 * 排序：用户手势（激活/取消/退出）优先于工作线程事件（阶段结果、采集进度）；同级按到达顺序（FIFO）。
 * 不合并、不丢弃事件。
 */
class ControlQueue {
public:
    using Clock = std::chrono::steady_clock;

    ControlQueue() = default;

    // 禁止拷贝/移动
    ControlQueue(const ControlQueue&) = delete;
    ControlQueue& operator=(const ControlQueue&) = delete;

    // close 之后的 push 会被忽略并返回 false
    bool push(ControlEvent event);

    // 等待到 deadline；超时或已关闭且为空时返回 nullopt
    std::optional<ControlEvent> popUntil(Clock::time_point deadline);
    std::optional<ControlEvent> tryPop();

    size_t size() const;

    // 唤醒所有等待者
    void close();
    bool closed() const;

    // 数值越小越优先
    static int eventRank(const ControlEvent& event);

private:
    struct Item {
        ControlEvent event;
        int rank{0};
        std::uint64_t seq{0};
    };

    struct CompareItem {
        bool operator()(const Item& a, const Item& b) const {
            if (a.rank != b.rank) {
                return a.rank > b.rank;
            }
            // 同级：先到先处理
            return a.seq > b.seq;
        }
    };

    ControlEvent popLocked();

    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    std::priority_queue<Item, std::vector<Item>, CompareItem> m_items;
    std::uint64_t m_nextSeq{0};
    bool m_closed{false};
};

} // namespace talkbar::assistant
