#pragma once

#include <imgui.h>

#include "ui_component.hpp"

/**
 * @brief Dropdown settings menu anchored under the menu glyph.
 *
 * Four sliders (size, intensity, thickness, opacity), the animation type,
 * the color panel entry and quit. Edits made during a frame are clamped and
 * reported as one configuration change.
 */
class SettingsMenuUI : public IUiComponent {
  public:
    SettingsMenuUI() = default;
    ~SettingsMenuUI() override = default;
    SettingsMenuUI(const SettingsMenuUI &) = delete;
    SettingsMenuUI &operator=(const SettingsMenuUI &) = delete;
    SettingsMenuUI(SettingsMenuUI &&) = delete;
    SettingsMenuUI &operator=(SettingsMenuUI &&) = delete;

    void render(Context &ctx) override;

  private:
    bool render_sliders(CircleConfig &edited);
    bool render_animation_type(CircleConfig &edited);
    void render_actions(Context &ctx);
    void close_on_outside_click(Context &ctx);
};
