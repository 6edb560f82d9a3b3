#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "fakes.hpp"
#include "overlay/overlay_window.hpp"

using namespace std::chrono_literals;

namespace {

struct WindowFixture {
    const EventLoop::TimePoint t0{};
    EventLoop loop{t0};
    FakeSurfaceFactory factory;
    std::unique_ptr<OverlayWindow> window;

    WindowFixture() {
        window = std::make_unique<OverlayWindow>(
            7, factory.create(make_display(0, 100, 50, 800, 600)), loop);
        window->order_front();
    }

    FakeSurface::Shared &surface() { return *factory.created.front(); }

    // Run frames at 60 Hz until the clock reaches t0 + until
    void run_until(EventLoop::Duration until) {
        for (auto t = EventLoop::Duration(0); t <= until; t += 1.0s / 60.0)
            loop.run_due(
                t0 + std::chrono::duration_cast<EventLoop::Clock::duration>(t));
    }
};

} // namespace

TEST_CASE("OverlayWindow - Validity", "[overlay_window]") {
    WindowFixture f;

    SECTION("Visible window on a live display is valid") {
        REQUIRE(f.window->is_valid());
        REQUIRE(f.window->origin().x == 100.0f);
        REQUIRE(f.window->origin().y == 50.0f);
    }

    SECTION("Lost display invalidates") {
        f.surface().screen_present = false;
        REQUIRE_FALSE(f.window->is_valid());
    }

    SECTION("Hidden window is invalid") {
        f.surface().visible = false;
        REQUIRE_FALSE(f.window->is_valid());
    }

    SECTION("Closing is idempotent") {
        f.window->close();
        f.window->close();
        REQUIRE_FALSE(f.window->is_valid());
        REQUIRE(f.surface().close_calls == 1);
        REQUIRE_FALSE(f.surface().visible);
    }
}

TEST_CASE("OverlayWindow - Drawing", "[overlay_window]") {
    WindowFixture f;

    SECTION("Applying a configuration redraws with it") {
        CircleConfig config;
        config.size = 300.0f;
        f.window->apply(config);

        REQUIRE(f.window->config() == config);
        REQUIRE(f.surface().last_strokes.size() == 1);
        REQUIRE(f.surface().last_strokes[0].diameter == Catch::Approx(300.0f));
    }

    SECTION("Position updates move the circle") {
        f.window->update_position({50.0f, 30.0f});
        REQUIRE(f.surface().last_strokes[0].center.x == 50.0f);
        REQUIRE(f.surface().last_strokes[0].center.y == 30.0f);
    }

    SECTION("Closed windows ignore updates") {
        f.window->close();
        const int presented = f.surface().present_calls;
        f.window->update_position({1.0f, 1.0f});
        f.window->start_animation(true);
        REQUIRE(f.surface().present_calls == presented);
        REQUIRE_FALSE(f.window->is_animating());
    }
}

TEST_CASE("OverlayWindow - Animation ticker", "[overlay_window]") {
    WindowFixture f;

    SECTION("Ripple release runs to completion then stops") {
        f.window->start_animation(false);
        REQUIRE(f.window->is_animating());
        REQUIRE(f.window->state().progress == 0.0f);

        f.run_until(0.5s);
        REQUIRE(f.window->state().progress == 1.0f);
        REQUIRE_FALSE(f.window->is_animating());
    }

    SECTION("Ripple press holds without a ticker") {
        f.window->start_animation(true);
        REQUIRE(f.window->state().pressed);
        REQUIRE_FALSE(f.window->is_animating());
        REQUIRE(f.loop.pending_timers() == 0);
    }

    SECTION("Pulse animates while pressed") {
        CircleConfig config;
        config.animation = AnimationType::Pulse;
        f.window->apply(config);

        f.window->start_animation(true);
        REQUIRE(f.window->is_animating());
        f.run_until(0.3s);
        REQUIRE(f.window->state().progress == 1.0f);
        REQUIRE_FALSE(f.window->is_animating());
    }

    SECTION("A new trigger resets progress and replaces the ticker") {
        f.window->start_animation(false);
        f.run_until(0.1s);
        REQUIRE(f.window->state().progress > 0.0f);

        f.window->start_animation(false);
        REQUIRE(f.window->state().progress == 0.0f);
        REQUIRE(f.loop.pending_timers() == 1);
    }

    SECTION("Reset clears the pressed state and stops animating") {
        f.window->start_animation(false);
        f.window->reset_mouse_state();
        REQUIRE_FALSE(f.window->state().pressed);
        REQUIRE_FALSE(f.window->state().start_time.has_value());
        REQUIRE_FALSE(f.window->is_animating());
    }

    SECTION("Destroying the window cancels its ticker") {
        f.window->start_animation(false);
        REQUIRE(f.loop.pending_timers() == 1);
        f.window.reset();
        REQUIRE(f.loop.pending_timers() == 0);
    }
}
