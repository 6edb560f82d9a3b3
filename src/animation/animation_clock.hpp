#pragma once

#include <chrono>

#include "../render/types/config.hpp"

/**
 * @brief Maps elapsed time since a press/release transition to a normalized
 * animation progress for each animation variant.
 *
 * Ripple advances only while the button is released; Pulse advances
 * regardless of button state. Progress is clamped to exactly 1.0 once the
 * variant's duration has elapsed.
 */
class AnimationClock {
  public:
    using Duration = std::chrono::duration<double>;

    /**
     * @brief Compute the progress for the current frame
     * @param type Active animation variant
     * @param elapsed Time since the triggering transition
     * @param pressed Current button state
     * @param previous Progress computed on the previous frame
     * @return Progress in [0, 1]
     */
    static float advance(AnimationType type, Duration elapsed, bool pressed,
                         float previous);

    /**
     * @brief Whether no further frames are needed for this state
     */
    static bool is_finished(AnimationType type, bool pressed, float progress);

    static Duration duration_of(AnimationType type);

  private:
    static float linear(Duration elapsed, Duration duration);
};
