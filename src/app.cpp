#include "app.hpp"

#include <imgui.h>

#include <fmt/format.h>

#include "input/keys.hpp"
#include "render/ui/menu_glyph_ui.hpp"
#include "utility/formatters.hpp"
#include "utility/logger.hpp"

App::App()
    : m_host("cursor_halo"),
      m_provider([this]() { return m_router.last_position(); }),
      m_manager(m_provider, m_surfaces, m_loop, m_config),
      m_app_monitor([this](Vector2 global) { return tag_of(global); }),
      m_router(m_manager),
      m_render(m_surfaces) {
    m_manager.set_on_rebuilt(
        [this](const std::vector<DisplayInfo> &displays) {
            on_rebuilt(displays);
        });

    if (!m_router.attach(m_global_monitor))
        LOG_WARN("No global pointer monitor, the circle only follows the "
                 "pointer over this app");
    if (!m_router.attach(m_app_monitor))
        LOG_WARN("In-app pointer monitor unavailable");

    setup_keys(m_keys, m_settings, m_should_exit);

    m_manager.build();
    LOG_INFO(fmt::format("cursor_halo started with {}", m_config));
}

App::~App() { stop(); }

void App::run() {
    while (!m_should_exit)
        frame();
    LOG_INFO("Leaving frame loop");
}

void App::stop() {
    if (m_stopped)
        return;
    m_stopped = true;
    m_router.stop_monitors();
    m_manager.tear_down();
}

void App::apply_configuration() {
    LOG_DEBUG(fmt::format("Applying configuration {}", m_config));
    m_manager.update_all_views();
}

void App::frame() {
    if (WindowShouldClose()) {
        LOG_INFO("Host window close requested");
        m_surfaces.close_all();
        m_manager.process_window_events();
        m_should_exit = true;
        return;
    }

    if (m_provider.poll_configuration_changed())
        m_manager.on_display_configuration_changed();
    m_surfaces.poll_screens();
    m_manager.process_window_events();

    m_router.poll_monitors();
    m_router.dispatch();
    m_loop.run_due(EventLoop::Clock::now());

    // Glyph clicks arrive through dispatch(), so settle them before drawing
    sync_settings();

    Context ctx{m_config, m_settings, m_primary, m_glyph, m_host.origin()};
    m_render.draw_frame(ctx);

    m_keys.process(ImGui::GetIO().WantCaptureKeyboard);

    if (ctx.config_changed)
        apply_configuration();
    if (ctx.should_exit)
        m_should_exit = true;

    sync_settings();
}

void App::on_rebuilt(const std::vector<DisplayInfo> &displays) {
    m_host.fit(RaylibDisplayProvider::union_of(displays));
    if (displays.empty())
        return;

    m_primary = displays.front().frame;
    m_glyph = MenuGlyphUI::bounds_for(m_primary);
    m_router.set_glyph(m_glyph, [this]() { toggle_menu(); });
}

void App::toggle_menu() {
    m_settings.menu_open = !m_settings.menu_open;
    if (m_settings.menu_open)
        m_settings.color_panel_open = false;
}

void App::sync_settings() {
    const SettingsState &was = m_synced_settings;
    const SettingsState &now = m_settings;

    const bool opened = (now.menu_open && !was.menu_open) ||
                        (now.color_panel_open && !was.color_panel_open);
    const bool closed = (!now.menu_open && was.menu_open) ||
                        (!now.color_panel_open && was.color_panel_open);

    if (opened) {
        LOG_DEBUG("Settings surface opened");
        m_router.reset_mouse_state();
    }
    if (closed) {
        LOG_DEBUG("Settings surface closed");
        apply_configuration();
    }

    m_router.set_menu_open(now.menu_open);
    m_router.set_color_panel(now.color_panel_open ? now.color_panel_bounds
                                                  : std::nullopt);
    m_host.set_passthrough(!now.menu_open && !now.color_panel_open);

    m_synced_settings = m_settings;
}

input::WindowTag App::tag_of(Vector2 global) const {
    if (m_settings.color_panel_bounds &&
        CheckCollisionPointRec(global, *m_settings.color_panel_bounds))
        return input::WindowTag::ColorPanel;
    if (m_settings.menu_open)
        return input::WindowTag::SettingsMenu;
    return input::WindowTag::Overlay;
}
