#include "input_router.hpp"

#include <fmt/format.h>

#include "../utility/constants.hpp"
#include "../utility/logger.hpp"

using input::PointerEvent;
using input::PointerKind;

InputRouter::InputRouter(DisplaySetManager &windows) : m_windows(windows) {}

InputRouter::~InputRouter() { stop_monitors(); }

bool InputRouter::attach(input::IPointerMonitor &monitor) {
    if (!monitor.start(m_queue)) {
        LOG_WARN(fmt::format("Pointer monitor ({}) unavailable",
                             monitor.source() == input::PointerSource::Global
                                 ? "global"
                                 : "in-app"));
        return false;
    }
    m_monitors.push_back(&monitor);
    return true;
}

void InputRouter::stop_monitors() {
    for (auto *monitor : m_monitors)
        monitor->stop();
    m_monitors.clear();
}

void InputRouter::poll_monitors() {
    for (auto *monitor : m_monitors)
        monitor->poll();
}

std::size_t InputRouter::dispatch() {
    auto events = m_queue.drain();
    for (const auto &event : events)
        handle(event);
    return events.size();
}

void InputRouter::handle(const PointerEvent &event) {
    switch (event.kind) {
    case PointerKind::Move:
    case PointerKind::Drag:
        m_last_position = event.position;
        if (m_windows.tracking_enabled())
            m_windows.update_mouse_position(event.position);
        return;

    case PointerKind::Press:
        if (event.source == input::PointerSource::Global && hits_glyph(event)) {
            m_swallow_release = true;
            if (m_on_glyph)
                m_on_glyph();
            return;
        }
        if (m_pressed || is_settings_interaction(event) ||
            !m_windows.tracking_enabled())
            return;
        m_pressed = true;
        m_windows.start_animation(true);
        return;

    case PointerKind::Release:
        if (m_swallow_release) {
            m_swallow_release = false;
            return;
        }
        if (!m_pressed)
            return;
        m_pressed = false;
        if (is_settings_interaction(event)) {
            // Drop the press without a release animation
            m_windows.reset_mouse_state();
            return;
        }
        if (m_windows.tracking_enabled())
            m_windows.start_animation(false);
        return;
    }
}

void InputRouter::reset_mouse_state() {
    m_pressed = false;
    m_swallow_release = false;
    m_windows.reset_mouse_state();
}

bool InputRouter::is_settings_interaction(const PointerEvent &event) const {
    if (m_menu_open || event.window == input::WindowTag::SettingsMenu)
        return true;
    if (!m_color_panel)
        return false;

    // In-app events arrive tagged; global ones are located by position
    const Rectangle &panel = *m_color_panel;
    const bool in_panel = event.window == input::WindowTag::ColorPanel ||
                          CheckCollisionPointRec(event.position, panel);
    if (!in_panel)
        return false;
    // Heuristic: the panel's opacity control occupies its lower part
    return event.position.y >=
           panel.y + halo::constants::color_panel_opacity_threshold;
}

bool InputRouter::hits_glyph(const PointerEvent &event) const {
    return m_glyph && CheckCollisionPointRec(event.position, *m_glyph);
}
