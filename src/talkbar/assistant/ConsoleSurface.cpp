#include "talkbar/assistant/ConsoleSurface.h"

namespace talkbar::assistant {

ConsoleSurface::ConsoleSurface(std::ostream& out)
    : m_out(out)
{}

void ConsoleSurface::update(const SurfaceView& view) {
    std::lock_guard<std::mutex> lk(m_mu);
    m_visible = true;
    ++m_updates;

    m_out << "[" << sessionStateToString(view.state) << "] " << view.status;
    if (view.errorKind.has_value()) {
        m_out << " (" << ErrorInfo::errorTypeToString(*view.errorKind) << ")";
    }
    m_out << "\n";
    if (view.text.has_value() && !view.text->empty()) {
        m_out << "  > " << *view.text << "\n";
    }
    m_out.flush();
}

void ConsoleSurface::hide() {
    std::lock_guard<std::mutex> lk(m_mu);
    if (!m_visible) return;
    m_visible = false;
    m_out << "[hidden]\n";
    m_out.flush();
}

bool ConsoleSurface::visible() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_visible;
}

size_t ConsoleSurface::updateCount() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_updates;
}

} // namespace talkbar::assistant
