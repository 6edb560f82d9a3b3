#pragma once

#include <memory>
#include <vector>

#include "../animation/animation_state.hpp"
#include "../event/event_loop.hpp"
#include "../render/circle_renderer.hpp"
#include "../render/types/config.hpp"
#include "surface.hpp"
#include "window_event.hpp"

/**
 * @brief Overlay covering one display, hosting one circle.
 *
 * Holds only what it is told: a copy of the last applied configuration, the
 * window-local cursor position and its animation state. While an animation
 * is running the window owns a single ticker timer on the event loop; the
 * timer is cancelled when a new transition supersedes it and when the window
 * is destroyed, so no frame callback ever outlives its window.
 */
class OverlayWindow {
  public:
    OverlayWindow(WindowId id, std::unique_ptr<IOverlaySurface> surface,
                  EventLoop &loop);
    ~OverlayWindow();
    OverlayWindow(const OverlayWindow &) = delete;
    OverlayWindow &operator=(const OverlayWindow &) = delete;
    OverlayWindow(OverlayWindow &&) = delete;
    OverlayWindow &operator=(OverlayWindow &&) = delete;

    WindowId id() const { return m_id; }
    Rectangle frame() const { return m_surface->frame(); }
    Vector2 origin() const { return {frame().x, frame().y}; }

    /**
     * @brief A window is valid while it is visible and its display still
     * exists with non-zero dimensions
     */
    bool is_valid() const;

    void apply(const CircleConfig &config);

    /**
     * @brief Move the circle
     * @param local Cursor position in this window's coordinates
     */
    void update_position(Vector2 local);

    /**
     * @brief Restart the click animation for a press or release
     */
    void start_animation(bool pressed);

    /**
     * @brief Drop any press and running animation without animating
     */
    void reset_mouse_state();

    void order_front() { m_surface->order_front(); }
    void attach_events(WindowEventChannel &channel) {
        m_surface->attach_events(channel, m_id);
    }
    void detach_events() { m_surface->detach_events(); }

    /**
     * @brief Hide and close the native surface; idempotent
     */
    void close();

    bool is_animating() const { return m_loop.is_pending(m_ticker); }
    const AnimationState &state() const { return m_state; }
    const CircleConfig &config() const { return m_config; }

    std::vector<Stroke> strokes() const;

  private:
    void tick();
    void redraw();
    void stop_ticker();

    WindowId m_id;
    std::unique_ptr<IOverlaySurface> m_surface;
    EventLoop &m_loop;
    EventLoop::TimerId m_ticker = EventLoop::kInvalidTimer;

    CircleConfig m_config;
    AnimationState m_state;
    bool m_closed = false;
};
