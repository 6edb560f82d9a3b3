#include "circle_renderer.hpp"

#include <algorithm>
#include <cmath>

#include "../utility/constants.hpp"

std::vector<Stroke> CircleRenderer::render(Vector2 position,
                                           const CircleConfig &config,
                                           float progress, bool pressed) {
    std::vector<Stroke> strokes;
    strokes.reserve(2);

    switch (config.animation) {
    case AnimationType::Ripple:
        render_ripple(strokes, position, config, progress, pressed);
        break;
    case AnimationType::Pulse:
        render_pulse(strokes, position, config, progress, pressed);
        break;
    }
    return strokes;
}

void CircleRenderer::render_ripple(std::vector<Stroke> &out, Vector2 position,
                                   const CircleConfig &config, float progress,
                                   bool pressed) {
    // Pressing doubles the base opacity as an emphasis cue
    const float base_opacity = pressed ? config.opacity * 2.0f : config.opacity;
    const unsigned char base_alpha =
        scaled_alpha(config.color.a, base_opacity);

    out.push_back({position, config.size,
                   with_alpha(config.color, base_alpha), config.thickness});

    if (pressed || progress <= 0.0f)
        return;

    const float scale =
        1.0f + progress * config.intensity * halo::constants::ripple_max_scale;
    const unsigned char ring_alpha =
        scaled_alpha(config.color.a, config.opacity * (1.0f - progress));

    out.push_back({position, config.size * scale,
                   with_alpha(config.color, ring_alpha), config.thickness});
}

void CircleRenderer::render_pulse(std::vector<Stroke> &out, Vector2 position,
                                  const CircleConfig &config, float progress,
                                  bool pressed) {
    const float amount = pulse_amount(config.intensity);

    float diameter = 0.0f;
    unsigned char alpha = 0;
    if (pressed) {
        diameter = config.size * (1.0f - amount * progress);
        alpha = config.color.a;
    } else {
        diameter = config.size * ((1.0f - amount) + amount * progress);
        alpha = scaled_alpha(config.color.a, config.opacity);
    }

    out.push_back({position, diameter, with_alpha(config.color, alpha),
                   config.thickness});
}

void CircleRenderer::paint(const std::vector<Stroke> &strokes, Vector2 offset) {
    for (const auto &s : strokes) {
        if (s.color.a == 0)
            continue;
        const float radius = s.diameter * 0.5f;
        const float half = s.line_width * 0.5f;
        const Vector2 center = {s.center.x + offset.x, s.center.y + offset.y};
        // segments < 4 lets raylib pick a count from the radius
        DrawRing(center, std::max(0.0f, radius - half), radius + half, 0.0f,
                 360.0f, 0, s.color);
    }
}

unsigned char CircleRenderer::scaled_alpha(unsigned char alpha, float factor) {
    const long v = std::lrint(static_cast<float>(alpha) * factor);
    return static_cast<unsigned char>(std::clamp(v, 0L, 255L));
}

float CircleRenderer::pulse_amount(float intensity) {
    return halo::constants::pulse_gain * intensity +
           halo::constants::pulse_base;
}
