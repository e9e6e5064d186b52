#include "talkbar/assistant/AutoHideTimer.h"

namespace talkbar::assistant {

void AutoHideTimer::arm(Clock::time_point now, std::chrono::milliseconds duration, GenerationToken token) {
    if (duration.count() < 0) duration = std::chrono::milliseconds(0);
    m_deadline = now + duration;
    m_token = token;
}

void AutoHideTimer::disarm() {
    m_deadline.reset();
    m_token = 0;
}

std::optional<GenerationToken> AutoHideTimer::token() const {
    if (!m_deadline.has_value()) return std::nullopt;
    return m_token;
}

std::optional<GenerationToken> AutoHideTimer::expired(Clock::time_point now) {
    if (!m_deadline.has_value() || now < *m_deadline) return std::nullopt;
    const auto fired = m_token;
    disarm();
    return fired;
}

} // namespace talkbar::assistant
