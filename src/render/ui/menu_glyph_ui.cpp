#include "menu_glyph_ui.hpp"

#include <raylib.h>

#include "../../utility/constants.hpp"

void MenuGlyphUI::render(Context &ctx) {
    const Vector2 top_left = ctx.to_host({ctx.glyph.x, ctx.glyph.y});
    const float radius = ctx.glyph.width * 0.5f;
    const Vector2 center = {top_left.x + radius, top_left.y + radius};

    const bool active = ctx.settings.menu_open || ctx.settings.color_panel_open;
    if (active)
        DrawCircleV(center, radius, Fade(WHITE, 0.85f));
    DrawRing(center, radius - 2.0f, radius, 0.0f, 360.0f, 0,
             Fade(active ? DARKGRAY : WHITE, 0.9f));
}

Rectangle MenuGlyphUI::bounds_for(Rectangle primary_display) {
    using namespace halo::constants;
    return Rectangle{
        primary_display.x + primary_display.width - glyph_margin - glyph_size,
        primary_display.y + glyph_margin, glyph_size, glyph_size};
}
