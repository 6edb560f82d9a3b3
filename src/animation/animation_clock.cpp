#include "animation_clock.hpp"

#include "../utility/constants.hpp"

float AnimationClock::advance(AnimationType type, Duration elapsed,
                              bool pressed, float previous) {
    switch (type) {
    case AnimationType::Ripple:
        // the ring only expands after release
        if (pressed)
            return previous;
        return linear(elapsed, halo::constants::ripple_duration);
    case AnimationType::Pulse:
        return linear(elapsed, halo::constants::pulse_duration);
    }
    return previous;
}

bool AnimationClock::is_finished(AnimationType type, bool pressed,
                                 float progress) {
    switch (type) {
    case AnimationType::Ripple:
        return pressed || progress >= 1.0f;
    case AnimationType::Pulse:
        return progress >= 1.0f;
    }
    return true;
}

AnimationClock::Duration AnimationClock::duration_of(AnimationType type) {
    return type == AnimationType::Pulse ? halo::constants::pulse_duration
                                        : halo::constants::ripple_duration;
}

float AnimationClock::linear(Duration elapsed, Duration duration) {
    if (elapsed.count() <= 0.0)
        return 0.0f;
    if (elapsed >= duration)
        return 1.0f;
    return static_cast<float>(elapsed / duration);
}
