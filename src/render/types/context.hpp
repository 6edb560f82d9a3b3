#pragma once

#include <optional>

#include <raylib.h>

#include "config.hpp"

// Open/closed state of the settings surface
struct SettingsState {
    bool menu_open = false;
    bool color_panel_open = false;
    std::optional<Rectangle> color_panel_bounds; ///< Global, while open
};

// per-frame context passed to the settings surface renderers
struct Context {
    CircleConfig &config;
    SettingsState &settings;

    Rectangle primary_display; ///< Global coordinates
    Rectangle glyph;           ///< Menu glyph, global coordinates
    Vector2 host_origin;       ///< Host window top-left, global coordinates

    // Set by renderers, acted upon by the app after the frame
    bool config_changed = false;
    bool should_exit = false;

    Context(CircleConfig &config, SettingsState &settings,
            Rectangle primary_display, Rectangle glyph, Vector2 host_origin)
        : config(config), settings(settings), primary_display(primary_display),
          glyph(glyph), host_origin(host_origin) {}

    // Converts a global point into host window coordinates
    Vector2 to_host(Vector2 global) const {
        return {global.x - host_origin.x, global.y - host_origin.y};
    }
};
