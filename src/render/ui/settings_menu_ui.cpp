#include "settings_menu_ui.hpp"

#include "../../utility/constants.hpp"

void SettingsMenuUI::render(Context &ctx) {
    if (!ctx.settings.menu_open)
        return;

    const Vector2 anchor = ctx.to_host(
        {ctx.glyph.x + ctx.glyph.width - halo::constants::menu_width,
         ctx.glyph.y + ctx.glyph.height + 6.0f});
    ImGui::SetNextWindowPos(ImVec2{anchor.x, anchor.y});
    ImGui::SetNextWindowSize(ImVec2{halo::constants::menu_width, 0.0f});

    const ImGuiWindowFlags flags =
        ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoResize |
        ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoSavedSettings |
        ImGuiWindowFlags_AlwaysAutoResize;

    if (ImGui::Begin("##settings_menu", nullptr, flags)) {
        CircleConfig edited = ctx.config;
        bool changed = render_sliders(edited);
        ImGui::Separator();
        changed |= render_animation_type(edited);

        if (changed) {
            ctx.config = clamp_to_bounds(edited);
            ctx.config_changed = true;
        }

        render_actions(ctx);
        close_on_outside_click(ctx);
    }
    ImGui::End();
}

bool SettingsMenuUI::render_sliders(CircleConfig &edited) {
    bool changed = false;
    ImGui::PushItemWidth(-1.0f);

    ImGui::TextUnformatted("Circle Size");
    changed |= ImGui::SliderFloat("##size", &edited.size, ConfigBounds::min_size,
                                  ConfigBounds::max_size, "%.0f px");

    ImGui::TextUnformatted("Animation Intensity");
    changed |= ImGui::SliderFloat("##intensity", &edited.intensity,
                                  ConfigBounds::min_intensity,
                                  ConfigBounds::max_intensity, "%.2f");

    ImGui::TextUnformatted("Circle Thickness");
    changed |= ImGui::SliderFloat("##thickness", &edited.thickness,
                                  ConfigBounds::min_thickness,
                                  ConfigBounds::max_thickness, "%.1f px");

    ImGui::TextUnformatted("Circle Opacity");
    changed |= ImGui::SliderFloat("##opacity", &edited.opacity,
                                  ConfigBounds::min_opacity,
                                  ConfigBounds::max_opacity, "%.2f");

    ImGui::PopItemWidth();
    return changed;
}

bool SettingsMenuUI::render_animation_type(CircleConfig &edited) {
    bool changed = false;
    if (ImGui::BeginMenu("Animation Type")) {
        for (AnimationType type : {AnimationType::Ripple, AnimationType::Pulse}) {
            const bool selected = edited.animation == type;
            if (ImGui::MenuItem(animation_type_name(type), nullptr, selected) &&
                !selected) {
                edited.animation = type;
                changed = true;
            }
        }
        ImGui::EndMenu();
    }
    return changed;
}

void SettingsMenuUI::render_actions(Context &ctx) {
    if (ImGui::MenuItem("Circle Color...")) {
        ctx.settings.menu_open = false;
        ctx.settings.color_panel_open = true;
    }
    ImGui::Separator();
    if (ImGui::MenuItem("Quit", "Ctrl+Q")) {
        ctx.should_exit = true;
    }
}

void SettingsMenuUI::close_on_outside_click(Context &ctx) {
    // Like a native dropdown: any click elsewhere dismisses it
    if (ImGui::IsMouseClicked(ImGuiMouseButton_Left) &&
        !ImGui::IsWindowHovered(ImGuiHoveredFlags_AnyWindow |
                                ImGuiHoveredFlags_AllowWhenBlockedByPopup)) {
        const ImVec2 mouse = ImGui::GetMousePos();
        const Vector2 glyph_host = ctx.to_host({ctx.glyph.x, ctx.glyph.y});
        const bool on_glyph = mouse.x >= glyph_host.x &&
                              mouse.x <= glyph_host.x + ctx.glyph.width &&
                              mouse.y >= glyph_host.y &&
                              mouse.y <= glyph_host.y + ctx.glyph.height;
        if (!on_glyph)
            ctx.settings.menu_open = false;
    }
}
