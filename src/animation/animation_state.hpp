#pragma once

#include <chrono>
#include <optional>
#include <raylib.h>

/**
 * @brief Per-window animation state
 */
struct AnimationState {
    Vector2 position = {0.0f, 0.0f}; ///< Cursor in window-local coordinates
    bool pressed = false;
    float progress = 0.0f; ///< Normalized animation time, 0..1
    std::optional<std::chrono::steady_clock::time_point> start_time;

    // Every press/release transition restarts the animation from zero.
    void restart(bool is_pressed, std::chrono::steady_clock::time_point now) {
        pressed = is_pressed;
        progress = 0.0f;
        start_time = now;
    }

    // Back to a released, idle circle with no animation in flight.
    void clear() {
        pressed = false;
        progress = 0.0f;
        start_time.reset();
    }
};
