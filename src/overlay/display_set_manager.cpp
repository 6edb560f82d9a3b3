#include "display_set_manager.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "../utility/constants.hpp"
#include "../utility/exceptions.hpp"
#include "../utility/formatters.hpp"
#include "../utility/logger.hpp"

DisplaySetManager::DisplaySetManager(IDisplayProvider &displays,
                                     ISurfaceFactory &surfaces,
                                     EventLoop &loop,
                                     const CircleConfig &config)
    : m_displays(displays), m_surfaces(surfaces), m_loop(loop),
      m_config(&config) {}

DisplaySetManager::~DisplaySetManager() {
    if (m_state != State::TornDown)
        tear_down();
}

void DisplaySetManager::build() {
    if (m_state != State::Empty)
        throw halo::StateError(fmt::format(
            "cannot build overlay windows in state {}", state_name(m_state)));
    build_windows();
}

void DisplaySetManager::build_windows() {
    m_state = State::Building;

    std::vector<DisplayInfo> displays = m_displays.displays();
    displays.erase(std::remove_if(displays.begin(), displays.end(),
                                  [](const DisplayInfo &d) {
                                      return !d.has_valid_size();
                                  }),
                   displays.end());

    const Vector2 mouse = m_displays.mouse_location();
    for (const auto &display : displays) {
        auto window = std::make_unique<OverlayWindow>(
            m_next_id++, m_surfaces.create(display), m_loop);
        window->apply(*m_config);
        window->attach_events(m_events);
        window->order_front();
        window->update_position(to_local(mouse, window->origin()));
        LOG_DEBUG(fmt::format("Overlay window {} on display {} {}",
                              window->id(), display.id, display.frame));
        m_windows.push_back(std::move(window));
    }

    m_state = State::Active;
    ++m_generation;
    LOG_INFO(fmt::format("Built {} overlay windows (generation {})",
                         m_windows.size(), m_generation));

    update_all_views();

    if (m_on_rebuilt)
        m_on_rebuilt(displays);
}

void DisplaySetManager::on_display_configuration_changed() {
    if (m_state == State::TornDown || m_state == State::Empty)
        return;

    if (m_loop.is_pending(m_debounce_timer)) {
        LOG_DEBUG("Display change collapsed into pending rebuild");
        return;
    }

    LOG_INFO("Display configuration changed, rebuild scheduled");
    m_debounce_timer =
        m_loop.schedule(halo::constants::screen_change_debounce, [this]() {
            m_debounce_timer = EventLoop::kInvalidTimer;
            begin_rebuild();
        });
}

void DisplaySetManager::begin_rebuild() {
    if (m_rebuilding) {
        LOG_DEBUG("Rebuild already in progress");
        return;
    }
    m_rebuilding = true;
    m_state = State::Rebuilding;

    // A newer rebuild supersedes the previous re-enable step
    m_loop.cancel(m_reenable_timer);
    m_reenable_timer = EventLoop::kInvalidTimer;
    m_tracking_enabled = false;

    close_all_windows();

    m_settle_timer =
        m_loop.schedule(halo::constants::window_recreation_delay, [this]() {
            m_settle_timer = EventLoop::kInvalidTimer;
            finish_rebuild();
        });
}

void DisplaySetManager::finish_rebuild() {
    build_windows();
    m_rebuilding = false;

    m_reenable_timer =
        m_loop.schedule(halo::constants::tracking_reenable_delay, [this]() {
            m_reenable_timer = EventLoop::kInvalidTimer;
            m_tracking_enabled = true;
            LOG_DEBUG("Pointer tracking re-enabled");
        });
}

void DisplaySetManager::process_window_events() {
    for (const auto &event : m_events.drain()) {
        auto it = std::find_if(m_windows.begin(), m_windows.end(),
                               [&](const auto &w) {
                                   return w->id() == event.window;
                               });
        if (it == m_windows.end())
            continue; // from a previous generation

        switch (event.kind) {
        case WindowEvent::Kind::ScreenLost:
            LOG_INFO(fmt::format("Window {} lost its display", event.window));
            (*it)->close();
            break;
        case WindowEvent::Kind::WillClose:
            LOG_DEBUG(fmt::format("Window {} closing", event.window));
            break;
        }
        m_windows.erase(it);
    }
}

std::size_t DisplaySetManager::prune_invalid_windows() {
    std::size_t removed = 0;
    for (auto it = m_windows.begin(); it != m_windows.end();) {
        if ((*it)->is_valid()) {
            ++it;
            continue;
        }
        LOG_DEBUG(fmt::format("Pruning invalid window {}", (*it)->id()));
        (*it)->close();
        it = m_windows.erase(it);
        ++removed;
    }
    return removed;
}

void DisplaySetManager::update_all_views() {
    if (!m_config)
        return;
    const CircleConfig &config = *m_config;
    for_each_valid_window([&](OverlayWindow &w) { w.apply(config); });
}

void DisplaySetManager::update_mouse_position(Vector2 global) {
    for_each_valid_window([&](OverlayWindow &w) {
        w.update_position(to_local(global, w.origin()));
    });
}

void DisplaySetManager::start_animation(bool pressed) {
    for_each_valid_window([&](OverlayWindow &w) { w.start_animation(pressed); });
}

void DisplaySetManager::reset_mouse_state() {
    for_each_valid_window([](OverlayWindow &w) { w.reset_mouse_state(); });
}

void DisplaySetManager::close_all_windows() {
    // Detach every event route before any window is torn down
    for (auto &window : m_windows)
        window->detach_events();
    for (auto &window : m_windows)
        window->close();
    m_windows.clear();
    m_events.drain();
}

void DisplaySetManager::cancel_timers() {
    m_loop.cancel(m_debounce_timer);
    m_loop.cancel(m_settle_timer);
    m_loop.cancel(m_reenable_timer);
    m_debounce_timer = EventLoop::kInvalidTimer;
    m_settle_timer = EventLoop::kInvalidTimer;
    m_reenable_timer = EventLoop::kInvalidTimer;
}

void DisplaySetManager::tear_down() {
    if (m_state == State::TornDown)
        return;
    cancel_timers();
    close_all_windows();
    m_config = nullptr;
    m_rebuilding = false;
    m_tracking_enabled = false;
    m_state = State::TornDown;
    LOG_INFO("Overlay windows torn down");
}

OverlayWindow *DisplaySetManager::find(WindowId id) const {
    for (const auto &window : m_windows) {
        if (window->id() == id)
            return window.get();
    }
    return nullptr;
}
