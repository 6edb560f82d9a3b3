#pragma once

#include <raylib.h>

namespace input {

enum class PointerKind { Move, Drag, Press, Release };

enum class PointerSource {
    Global, ///< System-wide monitor, sees events outside the app
    InApp   ///< Events delivered to the app's own windows
};

// Identity of the app window an event was delivered to
enum class WindowTag { None, Overlay, SettingsMenu, ColorPanel };

struct PointerEvent {
    PointerKind kind = PointerKind::Move;
    Vector2 position = {0.0f, 0.0f}; ///< Global coordinates
    PointerSource source = PointerSource::Global;
    WindowTag window = WindowTag::None;
};

inline const char *pointer_kind_name(PointerKind kind) {
    switch (kind) {
    case PointerKind::Move:
        return "move";
    case PointerKind::Drag:
        return "drag";
    case PointerKind::Press:
        return "press";
    case PointerKind::Release:
        return "release";
    }
    return "unknown";
}

} // namespace input
