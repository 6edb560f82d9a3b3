#pragma once

#include <functional>
#include <optional>
#include <vector>

#include <raylib.h>

#include "../overlay/display_set_manager.hpp"
#include "pointer_event.hpp"
#include "pointer_queue.hpp"

/**
 * @brief Fans pointer events out to every overlay window.
 *
 * Both the global and the in-app monitor feed the same queue, which is
 * drained on the UI thread by dispatch(). Moves and drags update the circle
 * on every display. Press and release restart the click animation on every
 * display unless the click belongs to the settings surface: while the menu
 * is open, or on the lower part of the color panel where its opacity control
 * sits, only position tracking continues.
 */
class InputRouter {
  public:
    using GlyphCallback = std::function<void()>;

    explicit InputRouter(DisplaySetManager &windows);
    ~InputRouter();
    InputRouter(const InputRouter &) = delete;
    InputRouter &operator=(const InputRouter &) = delete;

    /**
     * @brief Subscribe to a monitor. The monitor must outlive the router or
     * be detached with stop_monitors() first.
     * @return false if the monitor could not start
     */
    bool attach(input::IPointerMonitor &monitor);

    void stop_monitors();

    /**
     * @brief Give sampling monitors their per-frame turn (UI thread)
     */
    void poll_monitors();

    /**
     * @brief Drain the marshal queue and handle every event (UI thread)
     * @return Number of events handled
     */
    std::size_t dispatch();

    void handle(const input::PointerEvent &event);

    /**
     * @brief Release every circle without animating
     */
    void reset_mouse_state();

    /**
     * @brief Whether a press or release belongs to the settings surface.
     * A release filtered this way still ends the press, silently.
     */
    bool is_settings_interaction(const input::PointerEvent &event) const;

    void set_menu_open(bool open) { m_menu_open = open; }
    void set_color_panel(std::optional<Rectangle> bounds) {
        m_color_panel = bounds;
    }
    void set_glyph(Rectangle bounds, GlyphCallback on_click) {
        m_glyph = bounds;
        m_on_glyph = std::move(on_click);
    }

    input::PointerQueue &queue() { return m_queue; }
    Vector2 last_position() const { return m_last_position; }
    bool pressed() const { return m_pressed; }

  private:
    bool hits_glyph(const input::PointerEvent &event) const;

    DisplaySetManager &m_windows;
    input::PointerQueue m_queue;
    std::vector<input::IPointerMonitor *> m_monitors;

    Vector2 m_last_position = {0.0f, 0.0f};
    bool m_pressed = false;
    bool m_swallow_release = false;

    bool m_menu_open = false;
    std::optional<Rectangle> m_color_panel;
    std::optional<Rectangle> m_glyph;
    GlyphCallback m_on_glyph;
};
