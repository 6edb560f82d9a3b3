#include "overlay_window.hpp"

#include "../animation/animation_clock.hpp"
#include "../utility/constants.hpp"

OverlayWindow::OverlayWindow(WindowId id,
                             std::unique_ptr<IOverlaySurface> surface,
                             EventLoop &loop)
    : m_id(id), m_surface(std::move(surface)), m_loop(loop) {}

OverlayWindow::~OverlayWindow() {
    stop_ticker();
    close();
}

bool OverlayWindow::is_valid() const {
    if (m_closed || !m_surface->is_visible())
        return false;
    auto screen = m_surface->screen();
    return screen.has_value() && screen->has_valid_size();
}

void OverlayWindow::apply(const CircleConfig &config) {
    if (m_closed)
        return;
    m_config = config;
    redraw();
}

void OverlayWindow::update_position(Vector2 local) {
    if (m_closed)
        return;
    m_state.position = local;
    redraw();
}

void OverlayWindow::start_animation(bool pressed) {
    if (m_closed)
        return;
    stop_ticker();
    m_state.restart(pressed, m_loop.now());
    tick();
}

void OverlayWindow::reset_mouse_state() {
    if (m_closed)
        return;
    stop_ticker();
    m_state.clear();
    redraw();
}

void OverlayWindow::close() {
    if (m_closed)
        return;
    stop_ticker();
    m_surface->detach_events();
    if (m_surface->is_visible())
        m_surface->order_out();
    m_surface->close();
    m_closed = true;
}

std::vector<Stroke> OverlayWindow::strokes() const {
    return CircleRenderer::render(m_state.position, m_config, m_state.progress,
                                  m_state.pressed);
}

void OverlayWindow::tick() {
    m_ticker = EventLoop::kInvalidTimer;
    if (!m_state.start_time)
        return;

    const auto elapsed = m_loop.now() - *m_state.start_time;
    m_state.progress = AnimationClock::advance(
        m_config.animation,
        std::chrono::duration_cast<AnimationClock::Duration>(elapsed),
        m_state.pressed, m_state.progress);
    redraw();

    if (AnimationClock::is_finished(m_config.animation, m_state.pressed,
                                    m_state.progress))
        return;

    m_ticker = m_loop.schedule(halo::constants::animation_frame_interval,
                               [this]() { tick(); });
}

void OverlayWindow::redraw() { m_surface->present(strokes()); }

void OverlayWindow::stop_ticker() {
    m_loop.cancel(m_ticker);
    m_ticker = EventLoop::kInvalidTimer;
}
