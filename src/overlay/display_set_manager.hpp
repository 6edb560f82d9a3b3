#pragma once

#include <functional>
#include <memory>
#include <vector>

#include "../event/event_loop.hpp"
#include "../render/types/config.hpp"
#include "display.hpp"
#include "overlay_window.hpp"
#include "surface.hpp"
#include "window_event.hpp"

/**
 * @brief Owns one overlay window per active display and keeps the set in
 * line with the display configuration.
 *
 * Lifecycle: Empty -> Building -> Active -> Rebuilding -> Active ... ->
 * TornDown. A display configuration change is debounced, then tears the
 * whole set down and rebuilds it after a short settle delay; windows are
 * never diffed against the previous generation. Windows whose display
 * disappears without a global change notification are pruned before every
 * fan-out.
 */
class DisplaySetManager {
  public:
    enum class State { Empty, Building, Active, Rebuilding, TornDown };

    using RebuiltCallback =
        std::function<void(const std::vector<DisplayInfo> &)>;

    DisplaySetManager(IDisplayProvider &displays, ISurfaceFactory &surfaces,
                      EventLoop &loop, const CircleConfig &config);
    ~DisplaySetManager();
    DisplaySetManager(const DisplaySetManager &) = delete;
    DisplaySetManager &operator=(const DisplaySetManager &) = delete;

    /**
     * @brief Create the initial window set
     * @throws halo::StateError unless the manager is Empty
     */
    void build();

    /**
     * @brief Display-configuration-changed notification. Repeats within the
     * debounce window collapse into one rebuild.
     */
    void on_display_configuration_changed();

    /**
     * @brief Handle notifications posted by native surfaces
     */
    void process_window_events();

    /**
     * @brief Close and forget every window that is no longer valid
     * @return Number of windows removed
     */
    std::size_t prune_invalid_windows();

    void update_all_views();
    void update_mouse_position(Vector2 global);
    void start_animation(bool pressed);
    void reset_mouse_state();

    /**
     * @brief Close every window and release the configuration. Terminal.
     */
    void tear_down();

    /**
     * @brief Invoked after every completed build with the displays used
     */
    void set_on_rebuilt(RebuiltCallback callback) {
        m_on_rebuilt = std::move(callback);
    }

    State state() const { return m_state; }
    bool is_rebuilding() const { return m_rebuilding; }
    bool rebuild_pending() const { return m_loop.is_pending(m_debounce_timer); }

    /**
     * @brief False while a rebuild is in flight and shortly after it
     */
    bool tracking_enabled() const { return m_tracking_enabled; }

    std::size_t window_count() const { return m_windows.size(); }
    const std::vector<std::unique_ptr<OverlayWindow>> &windows() const {
        return m_windows;
    }
    OverlayWindow *find(WindowId id) const;

    /**
     * @brief Number of completed builds, initial one included
     */
    std::uint64_t generation() const { return m_generation; }

    WindowEventChannel &events() { return m_events; }

  private:
    void build_windows();
    void begin_rebuild();
    void finish_rebuild();
    void close_all_windows();
    void cancel_timers();

    template <typename Fn> void for_each_valid_window(Fn &&fn) {
        prune_invalid_windows();
        for (auto &window : m_windows)
            fn(*window);
    }

    IDisplayProvider &m_displays;
    ISurfaceFactory &m_surfaces;
    EventLoop &m_loop;
    const CircleConfig *m_config;

    std::vector<std::unique_ptr<OverlayWindow>> m_windows;
    WindowEventChannel m_events;
    WindowId m_next_id = 1;

    State m_state = State::Empty;
    bool m_rebuilding = false;
    bool m_tracking_enabled = true;
    std::uint64_t m_generation = 0;

    EventLoop::TimerId m_debounce_timer = EventLoop::kInvalidTimer;
    EventLoop::TimerId m_settle_timer = EventLoop::kInvalidTimer;
    EventLoop::TimerId m_reenable_timer = EventLoop::kInvalidTimer;

    RebuiltCallback m_on_rebuilt;
};

inline const char *state_name(DisplaySetManager::State state) {
    switch (state) {
    case DisplaySetManager::State::Empty:
        return "Empty";
    case DisplaySetManager::State::Building:
        return "Building";
    case DisplaySetManager::State::Active:
        return "Active";
    case DisplaySetManager::State::Rebuilding:
        return "Rebuilding";
    case DisplaySetManager::State::TornDown:
        return "TornDown";
    }
    return "Unknown";
}
