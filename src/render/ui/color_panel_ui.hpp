#pragma once

#include <imgui.h>

#include "ui_component.hpp"

/**
 * @brief Floating "Colors" panel centered on the primary display.
 *
 * The picker and the preset swatches fill the upper part; the color alpha
 * slider sits in the lower part of the panel. Its bounds are published in
 * global coordinates so pointer routing can tell its clicks apart.
 */
class ColorPanelUI : public IUiComponent {
  public:
    void render(Context &ctx) override;

    /**
     * @brief Panel bounds in global coordinates for a primary display
     */
    static Rectangle bounds_for(Rectangle primary_display);

  private:
    bool render_picker(Color &color);
    bool render_presets(Color &color);
    bool render_alpha(Color &color);
};
