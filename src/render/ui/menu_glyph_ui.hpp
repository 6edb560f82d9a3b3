#pragma once

#include "ui_component.hpp"

/**
 * @brief The persistent menu glyph: a small ring in the primary display's
 * top-right corner, filled while the settings menu is open
 */
class MenuGlyphUI : public IUiComponent {
  public:
    void render(Context &ctx) override;

    /**
     * @brief Glyph bounds in global coordinates for a primary display
     */
    static Rectangle bounds_for(Rectangle primary_display);
};
