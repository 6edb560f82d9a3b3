#include "raylib_pointer_monitor.hpp"

#include <raylib.h>

bool RaylibPointerMonitor::start(input::PointerQueue &queue) {
    m_queue = &queue;
    return true;
}

void RaylibPointerMonitor::poll() {
    if (!m_queue || IsWindowState(FLAG_WINDOW_MOUSE_PASSTHROUGH))
        return;

    const Vector2 window = GetWindowPosition();
    const Vector2 local = GetMousePosition();
    const Vector2 global = {window.x + local.x, window.y + local.y};
    const input::WindowTag tag = m_tag_of(global);

    if (global.x != m_last.x || global.y != m_last.y) {
        m_queue->push({IsMouseButtonDown(MOUSE_BUTTON_LEFT)
                           ? input::PointerKind::Drag
                           : input::PointerKind::Move,
                       global, input::PointerSource::InApp, tag});
        m_last = global;
    }
    if (IsMouseButtonPressed(MOUSE_BUTTON_LEFT))
        m_queue->push({input::PointerKind::Press, global,
                       input::PointerSource::InApp, tag});
    if (IsMouseButtonReleased(MOUSE_BUTTON_LEFT))
        m_queue->push({input::PointerKind::Release, global,
                       input::PointerSource::InApp, tag});
}
