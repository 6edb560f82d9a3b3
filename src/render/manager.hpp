#pragma once

#include <raylib.h>
#include <rlImGui.h>

#include "../platform/raylib_surface.hpp"
#include "types/context.hpp"
#include "ui/color_panel_ui.hpp"
#include "ui/menu_glyph_ui.hpp"
#include "ui/settings_menu_ui.hpp"

// Composites the overlay surfaces and draws the settings surface on top.
class RenderManager {
  public:
    explicit RenderManager(RaylibSurfaceFactory &surfaces)
        : m_surfaces(surfaces) {}

    void draw_frame(Context &ctx) {
        BeginDrawing();
        ClearBackground(BLANK);

        m_surfaces.composite(ctx.host_origin);
        m_glyph.render(ctx);

        rlImGuiBegin();
        {
            m_menu.render(ctx);
            m_color_panel.render(ctx);
        }
        rlImGuiEnd();

        EndDrawing();
    }

  private:
    RaylibSurfaceFactory &m_surfaces;
    MenuGlyphUI m_glyph;
    SettingsMenuUI m_menu;
    ColorPanelUI m_color_panel;
};
