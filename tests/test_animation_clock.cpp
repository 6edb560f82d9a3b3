#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "animation/animation_clock.hpp"

using namespace std::chrono_literals;
using Duration = AnimationClock::Duration;

TEST_CASE("AnimationClock - Ripple", "[animation]") {
    SECTION("Linear over 0.3s while released") {
        REQUIRE(AnimationClock::advance(AnimationType::Ripple, Duration(0.15),
                                        false, 0.0f) == Catch::Approx(0.5f));
        REQUIRE(AnimationClock::advance(AnimationType::Ripple, Duration(0.075),
                                        false, 0.0f) == Catch::Approx(0.25f));
    }

    SECTION("Frozen while pressed") {
        REQUIRE(AnimationClock::advance(AnimationType::Ripple, 10s, true,
                                        0.4f) == 0.4f);
        REQUIRE(AnimationClock::is_finished(AnimationType::Ripple, true, 0.0f));
    }

    SECTION("Non-decreasing while released") {
        float previous = 0.0f;
        for (int frame = 0; frame <= 30; ++frame) {
            const float p = AnimationClock::advance(
                AnimationType::Ripple, Duration(frame / 60.0), false, previous);
            REQUIRE(p >= previous);
            previous = p;
        }
        REQUIRE(previous == 1.0f);
    }

    SECTION("Finished at 1") {
        REQUIRE_FALSE(
            AnimationClock::is_finished(AnimationType::Ripple, false, 0.99f));
        REQUIRE(AnimationClock::is_finished(AnimationType::Ripple, false, 1.0f));
    }
}

TEST_CASE("AnimationClock - Pulse", "[animation]") {
    SECTION("Linear over 0.15s regardless of press state") {
        REQUIRE(AnimationClock::advance(AnimationType::Pulse, Duration(0.075),
                                        true, 0.0f) == Catch::Approx(0.5f));
        REQUIRE(AnimationClock::advance(AnimationType::Pulse, Duration(0.075),
                                        false, 0.0f) == Catch::Approx(0.5f));
    }

    SECTION("Pressed pulse still finishes") {
        REQUIRE(AnimationClock::is_finished(AnimationType::Pulse, true, 1.0f));
        REQUIRE_FALSE(
            AnimationClock::is_finished(AnimationType::Pulse, true, 0.5f));
    }
}

TEST_CASE("AnimationClock - Boundaries", "[animation]") {
    for (auto type : {AnimationType::Ripple, AnimationType::Pulse}) {
        const Duration duration = AnimationClock::duration_of(type);

        // Exactly 1, not approximately
        REQUIRE(AnimationClock::advance(type, duration, false, 0.0f) == 1.0f);
        REQUIRE(AnimationClock::advance(type, duration * 3, false, 0.0f) ==
                1.0f);

        REQUIRE(AnimationClock::advance(type, Duration(-0.5), false, 0.7f) ==
                0.0f);
        REQUIRE(AnimationClock::advance(type, Duration(0), false, 0.0f) ==
                0.0f);
    }

    REQUIRE(AnimationClock::duration_of(AnimationType::Ripple) ==
            Duration(0.3));
    REQUIRE(AnimationClock::duration_of(AnimationType::Pulse) ==
            Duration(0.15));
}
