#pragma once

#include <fmt/format.h>
#include <raylib.h>

#include "../render/types/config.hpp"

template <>
struct fmt::formatter<Color> {
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const Color &color, FormatContext &ctx) const
        -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "({},{},{},{})", color.r, color.g,
                              color.b, color.a);
    }
};

template <>
struct fmt::formatter<Vector2> {
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const Vector2 &v, FormatContext &ctx) const
        -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "({:.1f},{:.1f})", v.x, v.y);
    }
};

template <>
struct fmt::formatter<Rectangle> {
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const Rectangle &r, FormatContext &ctx) const
        -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}x{}@({},{})", r.width, r.height,
                              r.x, r.y);
    }
};

template <>
struct fmt::formatter<AnimationType> : fmt::formatter<fmt::string_view> {
    template <typename FormatContext>
    auto format(AnimationType type, FormatContext &ctx) const
        -> decltype(ctx.out()) {
        return fmt::formatter<fmt::string_view>::format(
            animation_type_name(type), ctx);
    }
};

template <>
struct fmt::formatter<CircleConfig> {
    constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
        return ctx.begin();
    }

    template <typename FormatContext>
    auto format(const CircleConfig &c, FormatContext &ctx) const
        -> decltype(ctx.out()) {
        return fmt::format_to(
            ctx.out(),
            "size={:.0f} thickness={:.1f} intensity={:.2f} opacity={:.2f} "
            "color={} animation={}",
            c.size, c.thickness, c.intensity, c.opacity, c.color, c.animation);
    }
};
