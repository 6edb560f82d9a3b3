#include <catch2/catch_test_macros.hpp>

#include <thread>

#include "fakes.hpp"
#include "input/input_router.hpp"

using namespace std::chrono_literals;
using input::PointerEvent;
using input::PointerKind;
using input::PointerSource;
using input::WindowTag;

namespace {

PointerEvent event(PointerKind kind, float x, float y,
                   PointerSource source = PointerSource::Global) {
    return PointerEvent{kind, Vector2{x, y}, source, WindowTag::None};
}

class FakeMonitor : public input::IPointerMonitor {
  public:
    explicit FakeMonitor(bool available = true) : m_available(available) {}

    bool start(input::PointerQueue &queue) override {
        if (!m_available)
            return false;
        m_queue = &queue;
        return true;
    }
    void stop() override {
        m_queue = nullptr;
        ++stopped;
    }
    void poll() override {
        ++polled;
        if (m_queue && pending) {
            m_queue->push(*pending);
            pending.reset();
        }
    }
    PointerSource source() const override { return PointerSource::InApp; }

    std::optional<PointerEvent> pending;
    int polled = 0;
    int stopped = 0;

  private:
    bool m_available;
    input::PointerQueue *m_queue = nullptr;
};

struct RouterFixture {
    const EventLoop::TimePoint t0{};
    EventLoop loop{t0};
    FakeDisplayProvider displays;
    FakeSurfaceFactory surfaces;
    CircleConfig config;
    DisplaySetManager manager{displays, surfaces, loop, config};
    InputRouter router{manager};

    RouterFixture() {
        displays.layout = {make_display(0, 100, 50, 800, 600),
                           make_display(1, 900, 50, 800, 600)};
        manager.build();
    }

    bool all_pressed() const {
        for (const auto &w : manager.windows())
            if (!w->state().pressed)
                return false;
        return true;
    }
};

} // namespace

TEST_CASE("InputRouter - Position tracking", "[input_router]") {
    RouterFixture f;

    SECTION("Global position becomes window-local") {
        f.router.handle(event(PointerKind::Move, 150.0f, 80.0f));

        const auto &first = f.manager.windows()[0]->state().position;
        REQUIRE(first.x == 50.0f);
        REQUIRE(first.y == 30.0f);

        const auto &second = f.manager.windows()[1]->state().position;
        REQUIRE(second.x == -750.0f);
        REQUIRE(second.y == 30.0f);
    }

    SECTION("Drags also move the circle") {
        f.router.handle(event(PointerKind::Drag, 1000.0f, 60.0f));
        REQUIRE(f.manager.windows()[1]->state().position.x == 100.0f);
        REQUIRE(f.router.last_position().x == 1000.0f);
    }

    SECTION("Tracking continues while the settings menu is open") {
        f.router.set_menu_open(true);
        f.router.handle(event(PointerKind::Move, 200.0f, 100.0f));
        REQUIRE(f.manager.windows()[0]->state().position.x == 100.0f);
    }
}

TEST_CASE("InputRouter - Press and release", "[input_router]") {
    RouterFixture f;

    SECTION("Press and release reach every window") {
        f.router.handle(event(PointerKind::Press, 10.0f, 10.0f));
        REQUIRE(f.router.pressed());
        REQUIRE(f.all_pressed());

        f.router.handle(event(PointerKind::Release, 10.0f, 10.0f));
        REQUIRE_FALSE(f.router.pressed());
        for (const auto &w : f.manager.windows()) {
            REQUIRE_FALSE(w->state().pressed);
            REQUIRE(w->is_animating());
        }
    }

    SECTION("Duplicate presses from both monitors trigger once") {
        f.router.handle(event(PointerKind::Press, 10.0f, 10.0f));
        f.loop.run_due(f.t0 + 100ms);
        const auto started = f.manager.windows()[0]->state().start_time;

        f.router.handle(
            event(PointerKind::Press, 10.0f, 10.0f, PointerSource::InApp));
        REQUIRE(f.manager.windows()[0]->state().start_time == started);
    }

    SECTION("Release without a press is ignored") {
        f.router.handle(event(PointerKind::Release, 10.0f, 10.0f));
        for (const auto &w : f.manager.windows())
            REQUIRE_FALSE(w->state().start_time.has_value());
    }

    SECTION("Open settings menu suppresses clicks") {
        f.router.set_menu_open(true);
        f.router.handle(event(PointerKind::Press, 10.0f, 10.0f));
        REQUIRE_FALSE(f.router.pressed());
        REQUIRE_FALSE(f.all_pressed());
    }

    SECTION("In-app events tagged with the settings menu are suppressed") {
        PointerEvent press{PointerKind::Press, Vector2{10.0f, 10.0f},
                           PointerSource::InApp, WindowTag::SettingsMenu};
        REQUIRE(f.router.is_settings_interaction(press));
        f.router.handle(press);
        REQUIRE_FALSE(f.router.pressed());
    }

    SECTION("Reset releases every circle") {
        f.router.handle(event(PointerKind::Press, 10.0f, 10.0f));
        f.router.reset_mouse_state();
        REQUIRE_FALSE(f.router.pressed());
        for (const auto &w : f.manager.windows())
            REQUIRE_FALSE(w->state().pressed);

        // The release that follows is not a transition anymore
        f.router.handle(event(PointerKind::Release, 10.0f, 10.0f));
        for (const auto &w : f.manager.windows())
            REQUIRE_FALSE(w->is_animating());
    }
}

TEST_CASE("InputRouter - Color panel filter", "[input_router]") {
    RouterFixture f;
    const Rectangle panel = {400.0f, 100.0f, 270.0f, 400.0f};
    f.router.set_color_panel(panel);

    SECTION("Clicks on the opacity region are suppressed") {
        auto press = event(PointerKind::Press, 500.0f, 450.0f);
        REQUIRE(f.router.is_settings_interaction(press));
        f.router.handle(press);
        REQUIRE_FALSE(f.router.pressed());
    }

    SECTION("Clicks on the upper part of the panel animate") {
        auto press = event(PointerKind::Press, 500.0f, 150.0f);
        REQUIRE_FALSE(f.router.is_settings_interaction(press));
        f.router.handle(press);
        REQUIRE(f.router.pressed());
    }

    SECTION("Clicks outside the panel animate") {
        REQUIRE_FALSE(f.router.is_settings_interaction(
            event(PointerKind::Press, 50.0f, 450.0f)));
    }

    SECTION("Release on the opacity region ends the press without animating") {
        f.router.handle(event(PointerKind::Press, 100.0f, 100.0f));
        REQUIRE(f.all_pressed());

        f.router.handle(event(PointerKind::Drag, 500.0f, 450.0f));
        f.router.handle(event(PointerKind::Release, 500.0f, 450.0f));
        REQUIRE_FALSE(f.router.pressed());
        for (const auto &w : f.manager.windows()) {
            REQUIRE_FALSE(w->state().pressed);
            REQUIRE_FALSE(w->is_animating());
        }

        // The next real press animates again
        f.router.set_color_panel(std::nullopt);
        f.loop.run_due(f.t0 + 1s);
        f.router.handle(event(PointerKind::Press, 100.0f, 100.0f));
        REQUIRE(f.router.pressed());
        for (const auto &w : f.manager.windows()) {
            REQUIRE(w->state().pressed);
            REQUIRE(w->state().start_time == f.t0 + 1s);
        }
    }

    SECTION("In-app events tagged with the panel use the threshold") {
        PointerEvent lower{PointerKind::Press, Vector2{500.0f, 450.0f},
                           PointerSource::InApp, WindowTag::ColorPanel};
        REQUIRE(f.router.is_settings_interaction(lower));

        PointerEvent upper{PointerKind::Press, Vector2{500.0f, 150.0f},
                           PointerSource::InApp, WindowTag::ColorPanel};
        REQUIRE_FALSE(f.router.is_settings_interaction(upper));
    }

    SECTION("Closing the panel lifts the filter") {
        f.router.set_color_panel(std::nullopt);
        REQUIRE_FALSE(f.router.is_settings_interaction(
            event(PointerKind::Press, 500.0f, 450.0f)));
    }
}

TEST_CASE("InputRouter - Menu glyph", "[input_router]") {
    RouterFixture f;
    int toggled = 0;
    f.router.set_glyph({860.0f, 60.0f, 22.0f, 22.0f}, [&]() { ++toggled; });

    SECTION("A global press on the glyph toggles the menu only") {
        f.router.handle(event(PointerKind::Press, 870.0f, 70.0f));
        REQUIRE(toggled == 1);
        REQUIRE_FALSE(f.router.pressed());

        // Its release is swallowed
        f.router.handle(event(PointerKind::Release, 870.0f, 70.0f));
        for (const auto &w : f.manager.windows())
            REQUIRE_FALSE(w->state().start_time.has_value());
    }

    SECTION("In-app presses on the glyph are not toggles") {
        f.router.handle(
            event(PointerKind::Press, 870.0f, 70.0f, PointerSource::InApp));
        REQUIRE(toggled == 0);
    }
}

TEST_CASE("InputRouter - Rebuild suspends tracking", "[input_router]") {
    RouterFixture f;
    f.manager.on_display_configuration_changed();
    f.loop.run_due(f.t0 + 400ms);
    f.loop.run_due(f.t0 + 550ms);
    REQUIRE(f.manager.window_count() == 2);
    REQUIRE_FALSE(f.manager.tracking_enabled());

    f.router.handle(event(PointerKind::Move, 300.0f, 300.0f));
    REQUIRE(f.manager.windows()[0]->state().position.x == -100.0f);
    REQUIRE(f.router.last_position().x == 300.0f);

    f.router.handle(event(PointerKind::Press, 300.0f, 300.0f));
    REQUIRE_FALSE(f.router.pressed());
}

TEST_CASE("InputRouter - Monitors and marshaling", "[input_router]") {
    RouterFixture f;

    SECTION("Unavailable monitors are reported and not kept") {
        FakeMonitor missing(false);
        REQUIRE_FALSE(f.router.attach(missing));
        f.router.poll_monitors();
        REQUIRE(missing.polled == 0);
    }

    SECTION("Polled events are handled on dispatch") {
        FakeMonitor monitor;
        REQUIRE(f.router.attach(monitor));
        monitor.pending = event(PointerKind::Move, 150.0f, 80.0f,
                                PointerSource::InApp);

        f.router.poll_monitors();
        REQUIRE(f.router.dispatch() == 1);
        REQUIRE(f.manager.windows()[0]->state().position.x == 50.0f);

        f.router.stop_monitors();
        REQUIRE(monitor.stopped == 1);
    }

    SECTION("Events pushed from another thread are drained in order") {
        std::thread producer([&]() {
            f.router.queue().push(event(PointerKind::Move, 110.0f, 60.0f));
            f.router.queue().push(event(PointerKind::Move, 120.0f, 70.0f));
        });
        producer.join();

        REQUIRE(f.router.dispatch() == 2);
        REQUIRE(f.router.last_position().x == 120.0f);
    }
}
