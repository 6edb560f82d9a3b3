#pragma once

#include "event/event_loop.hpp"
#include "input/input_router.hpp"
#include "input/key_manager.hpp"
#include "overlay/display_set_manager.hpp"
#include "platform/host_window.hpp"
#include "platform/raylib_display_provider.hpp"
#include "platform/raylib_pointer_monitor.hpp"
#include "platform/raylib_surface.hpp"
#include "platform/x11_pointer_monitor.hpp"
#include "render/manager.hpp"
#include "render/types/config.hpp"
#include "render/types/context.hpp"

/**
 * @brief Owns the configuration and every long-lived component.
 *
 * Construction brings up the host window and the overlay windows; run()
 * drives the frame loop until quit; stop() tears everything down in reverse.
 * Subordinates get references to what they need, nothing is global.
 */
class App {
  public:
    App();
    ~App();
    App(const App &) = delete;
    App &operator=(const App &) = delete;

    void run();
    void stop();

    /**
     * @brief Push the current configuration to every overlay window
     */
    void apply_configuration();

  private:
    void frame();
    void on_rebuilt(const std::vector<DisplayInfo> &displays);
    void sync_settings();
    void toggle_menu();
    input::WindowTag tag_of(Vector2 global) const;

    HostWindow m_host;
    CircleConfig m_config;
    SettingsState m_settings;
    SettingsState m_synced_settings;
    EventLoop m_loop;

    RaylibDisplayProvider m_provider;
    RaylibSurfaceFactory m_surfaces;
    DisplaySetManager m_manager;
    // Declared before the router, which stops them on destruction
    X11PointerMonitor m_global_monitor;
    RaylibPointerMonitor m_app_monitor;
    InputRouter m_router;

    KeyManager m_keys;
    RenderManager m_render;

    Rectangle m_primary = {0, 0, 0, 0};
    Rectangle m_glyph = {0, 0, 0, 0};
    bool m_should_exit = false;
    bool m_stopped = false;
};
