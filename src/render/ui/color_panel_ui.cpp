#include "color_panel_ui.hpp"

#include <algorithm>
#include <array>
#include <cmath>

#include "../../utility/constants.hpp"

namespace {

struct Preset {
    const char *name;
    Color color;
};

constexpr std::array<Preset, 6> presets = {{
    {"Red", {255, 59, 48, 255}},
    {"Green", {52, 199, 89, 255}},
    {"Blue", {0, 122, 255, 255}},
    {"Yellow", {255, 204, 0, 255}},
    {"White", {255, 255, 255, 255}},
    {"Black", {0, 0, 0, 255}},
}};

unsigned char to_byte(float v) {
    return (unsigned char)std::lround(std::clamp(v, 0.0f, 1.0f) * 255.0f);
}

} // namespace

void ColorPanelUI::render(Context &ctx) {
    if (!ctx.settings.color_panel_open) {
        ctx.settings.color_panel_bounds.reset();
        return;
    }

    using namespace halo::constants;
    const Rectangle bounds = bounds_for(ctx.primary_display);
    const Vector2 pos = ctx.to_host({bounds.x, bounds.y});
    ImGui::SetNextWindowPos(ImVec2{pos.x, pos.y});
    ImGui::SetNextWindowSize(ImVec2{bounds.width, bounds.height});

    bool open = true;
    const ImGuiWindowFlags flags = ImGuiWindowFlags_NoResize |
                                   ImGuiWindowFlags_NoMove |
                                   ImGuiWindowFlags_NoCollapse |
                                   ImGuiWindowFlags_NoSavedSettings;
    if (ImGui::Begin("Colors", &open, flags)) {
        Color color = ctx.config.color;
        bool changed = render_picker(color);
        changed |= render_presets(color);

        // Keep the alpha control in the panel's lower region
        const float lower = color_panel_opacity_threshold + 8.0f;
        if (ImGui::GetCursorPosY() < lower)
            ImGui::SetCursorPosY(lower);
        changed |= render_alpha(color);

        if (changed) {
            ctx.config.color = color;
            ctx.config_changed = true;
        }
    }
    ImGui::End();

    if (open) {
        ctx.settings.color_panel_bounds = bounds;
    } else {
        ctx.settings.color_panel_open = false;
        ctx.settings.color_panel_bounds.reset();
    }
}

Rectangle ColorPanelUI::bounds_for(Rectangle primary_display) {
    using namespace halo::constants;
    return Rectangle{
        primary_display.x + (primary_display.width - color_panel_width) * 0.5f,
        primary_display.y +
            (primary_display.height - color_panel_height) * 0.5f,
        color_panel_width, color_panel_height};
}

bool ColorPanelUI::render_picker(Color &color) {
    float rgb[3] = {color.r / 255.0f, color.g / 255.0f, color.b / 255.0f};
    ImGui::SetNextItemWidth(-1.0f);
    if (!ImGui::ColorPicker3("##picker", rgb,
                             ImGuiColorEditFlags_NoSidePreview |
                                 ImGuiColorEditFlags_NoInputs))
        return false;
    color.r = to_byte(rgb[0]);
    color.g = to_byte(rgb[1]);
    color.b = to_byte(rgb[2]);
    return true;
}

bool ColorPanelUI::render_presets(Color &color) {
    bool changed = false;
    for (std::size_t i = 0; i < presets.size(); ++i) {
        const Color &c = presets[i].color;
        const ImVec4 swatch{c.r / 255.0f, c.g / 255.0f, c.b / 255.0f, 1.0f};
        if (i > 0)
            ImGui::SameLine();
        if (ImGui::ColorButton(presets[i].name, swatch,
                               ImGuiColorEditFlags_NoAlpha,
                               ImVec2{30.0f, 30.0f})) {
            // Presets replace the hue but keep the chosen alpha
            color = Color{c.r, c.g, c.b, color.a};
            changed = true;
        }
    }
    return changed;
}

bool ColorPanelUI::render_alpha(Color &color) {
    float alpha = color.a / 255.0f;
    ImGui::TextUnformatted("Opacity");
    ImGui::SetNextItemWidth(-1.0f);
    if (!ImGui::SliderFloat("##alpha", &alpha, 0.0f, 1.0f, "%.2f"))
        return false;
    color.a = to_byte(alpha);
    return true;
}
