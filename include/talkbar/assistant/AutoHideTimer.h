#pragma once

#include "talkbar/assistant/SessionTypes.h"

#include <chrono>
#include <optional>

namespace talkbar::assistant {

/**
 * @brief 单一截止时间的自动隐藏定时器
 *
 * 值类型，由编排器独占；arm 覆盖旧的截止时间（后写者胜），
 * 任意时刻最多一个待触发的截止时间。时间由调用方传入，便于测试。
 */
class AutoHideTimer {
public:
    using Clock = std::chrono::steady_clock;

    void arm(Clock::time_point now, std::chrono::milliseconds duration, GenerationToken token);
    void disarm();

    bool armed() const { return m_deadline.has_value(); }
    std::optional<Clock::time_point> deadline() const { return m_deadline; }
    std::optional<GenerationToken> token() const;

    // 到期则解除并返回 armed 时的 token；未到期或未 armed 返回 nullopt
    std::optional<GenerationToken> expired(Clock::time_point now);

private:
    std::optional<Clock::time_point> m_deadline;
    GenerationToken m_token{0};
};

} // namespace talkbar::assistant
