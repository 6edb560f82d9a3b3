#pragma once

#include <vector>

#include <raylib.h>

#include "types/config.hpp"

/**
 * @brief One stroked circle outline
 */
struct Stroke {
    Vector2 center;
    float diameter;
    Color color;
    float line_width;
};

/**
 * @brief Turns the cursor position, configuration and animation state into
 * the stroke-only circles to paint for one frame
 *
 * Ripple draws a base circle, plus a fading ring that expands after release.
 * Pulse draws a single circle that shrinks while pressed and grows back after
 * release. All strokes share the cursor as center and config.thickness as
 * line width.
 */
class CircleRenderer {
  public:
    static std::vector<Stroke> render(Vector2 position,
                                      const CircleConfig &config,
                                      float progress, bool pressed);

    /**
     * @brief Paints strokes into the active raylib render target
     * @param strokes Strokes produced by render()
     * @param offset Translation applied to every stroke center
     */
    static void paint(const std::vector<Stroke> &strokes,
                      Vector2 offset = {0.0f, 0.0f});

    /**
     * @brief Scales an 8-bit alpha by factor, rounding and clamping to 0..255
     */
    static unsigned char scaled_alpha(unsigned char alpha, float factor);

    static float pulse_amount(float intensity);

  private:
    static void render_ripple(std::vector<Stroke> &out, Vector2 position,
                              const CircleConfig &config, float progress,
                              bool pressed);
    static void render_pulse(std::vector<Stroke> &out, Vector2 position,
                             const CircleConfig &config, float progress,
                             bool pressed);

    static Color with_alpha(Color c, unsigned char a) {
        c.a = a;
        return c;
    }
};
