#pragma once

#include "talkbar/assistant/Collaborators.h"

#include <cstddef>
#include <mutex>
#include <ostream>

namespace talkbar::assistant {

/**
 * @brief 终端展示面：每次 update 输出一块状态，hide 输出收起标记
 *
 * 输出格式：
 * ```
 * [Thinking] 正在思考...
 *   > 你好
 * ```
 * 失败态追加错误类别，如 `[Capture_Failed] ... (NoSpeech)`。
 */
class ConsoleSurface : public PresentationSurface {
public:
    explicit ConsoleSurface(std::ostream& out);

    void update(const SurfaceView& view) override;
    void hide() override;

    bool visible() const;
    size_t updateCount() const;

private:
    mutable std::mutex m_mu;
    std::ostream& m_out;
    bool m_visible{false};
    size_t m_updates{0};
};

} // namespace talkbar::assistant
