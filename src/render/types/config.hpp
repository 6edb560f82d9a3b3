#pragma once

#include <algorithm>
#include <cmath>
#include <raylib.h>

#include "../../utility/exceptions.hpp"

enum class AnimationType { Ripple, Pulse };

inline const char *animation_type_name(AnimationType type) {
    switch (type) {
    case AnimationType::Ripple:
        return "Ripple";
    case AnimationType::Pulse:
        return "Pulse";
    }
    return "Unknown";
}

// Slider ranges exposed by the settings menu
struct ConfigBounds {
    static constexpr float min_size = 30.0f;
    static constexpr float max_size = 800.0f;
    static constexpr float min_thickness = 1.0f;
    static constexpr float max_thickness = 30.0f;
    static constexpr float min_intensity = 0.0f;
    static constexpr float max_intensity = 1.0f;
    static constexpr float min_opacity = 0.0f;
    static constexpr float max_opacity = 1.0f;
};

/**
 * @brief Appearance and animation settings shared by every overlay window
 *
 * Values are expected to stay inside ConfigBounds; the settings surface
 * clamps before applying, the renderer never does.
 */
struct CircleConfig {
    float size = 184.0f;     ///< Circle diameter in pixels
    float thickness = 6.0f;  ///< Stroke width in pixels
    float intensity = 0.5f;  ///< Animation scale multiplier
    float opacity = 0.5f;    ///< Multiplier applied on top of color.a
    Color color = {52, 199, 89, 255};
    AnimationType animation = AnimationType::Ripple;

    bool operator==(const CircleConfig &o) const {
        return size == o.size && thickness == o.thickness &&
               intensity == o.intensity && opacity == o.opacity &&
               color.r == o.color.r && color.g == o.color.g &&
               color.b == o.color.b && color.a == o.color.a &&
               animation == o.animation;
    }
    bool operator!=(const CircleConfig &o) const { return !(*this == o); }
};

/**
 * @brief Clamps every numeric field into ConfigBounds
 * @throws halo::ConfigError if a field is not a finite number
 */
inline CircleConfig clamp_to_bounds(CircleConfig cfg) {
    auto clamp_field = [](const char *name, float v, float lo, float hi) {
        if (!std::isfinite(v))
            throw halo::ConfigError(std::string(name) +
                                    " is not a finite number");
        return std::clamp(v, lo, hi);
    };
    cfg.size = clamp_field("size", cfg.size, ConfigBounds::min_size,
                           ConfigBounds::max_size);
    cfg.thickness =
        clamp_field("thickness", cfg.thickness, ConfigBounds::min_thickness,
                    ConfigBounds::max_thickness);
    cfg.intensity =
        clamp_field("intensity", cfg.intensity, ConfigBounds::min_intensity,
                    ConfigBounds::max_intensity);
    cfg.opacity = clamp_field("opacity", cfg.opacity, ConfigBounds::min_opacity,
                              ConfigBounds::max_opacity);
    return cfg;
}
