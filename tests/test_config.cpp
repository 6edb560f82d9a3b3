#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <string>

#include <fmt/format.h>

#include "render/types/config.hpp"
#include "utility/exceptions.hpp"
#include "utility/formatters.hpp"

TEST_CASE("CircleConfig - Defaults", "[config]") {
    CircleConfig config;

    REQUIRE(config.size == Catch::Approx(184.0f));
    REQUIRE(config.thickness == Catch::Approx(6.0f));
    REQUIRE(config.intensity == Catch::Approx(0.5f));
    REQUIRE(config.opacity == Catch::Approx(0.5f));
    REQUIRE(config.animation == AnimationType::Ripple);
    REQUIRE(config.color.r == 52);
    REQUIRE(config.color.g == 199);
    REQUIRE(config.color.b == 89);
    REQUIRE(config.color.a == 255);
}

TEST_CASE("CircleConfig - Clamping to bounds", "[config]") {
    SECTION("Values inside bounds are unchanged") {
        CircleConfig config;
        REQUIRE(clamp_to_bounds(config) == config);
    }

    SECTION("Values outside bounds are clamped") {
        CircleConfig config;
        config.size = 5000.0f;
        config.thickness = 0.0f;
        config.intensity = -1.0f;
        config.opacity = 3.0f;

        const CircleConfig clamped = clamp_to_bounds(config);
        REQUIRE(clamped.size == Catch::Approx(ConfigBounds::max_size));
        REQUIRE(clamped.thickness == Catch::Approx(ConfigBounds::min_thickness));
        REQUIRE(clamped.intensity == Catch::Approx(ConfigBounds::min_intensity));
        REQUIRE(clamped.opacity == Catch::Approx(ConfigBounds::max_opacity));
    }

    SECTION("Non-finite values are rejected") {
        CircleConfig config;
        config.size = std::numeric_limits<float>::quiet_NaN();
        REQUIRE_THROWS_AS(clamp_to_bounds(config), halo::ConfigError);

        config.size = 184.0f;
        config.opacity = std::numeric_limits<float>::infinity();
        REQUIRE_THROWS_AS(clamp_to_bounds(config), halo::ConfigError);
    }
}

TEST_CASE("CircleConfig - Equality", "[config]") {
    CircleConfig a;
    CircleConfig b;
    REQUIRE(a == b);

    b.color.a = 128;
    REQUIRE(a != b);

    b = a;
    b.animation = AnimationType::Pulse;
    REQUIRE(a != b);
}

TEST_CASE("Exceptions - Category prefixes", "[config]") {
    REQUIRE(std::string(halo::ConfigError("bad").what()) ==
            "Configuration error: bad");
    REQUIRE(std::string(halo::StateError("bad").what()) == "State error: bad");

    // Everything is catchable as the common base
    REQUIRE_THROWS_AS(throw halo::PlatformError("no window"),
                      halo::HaloException);
}

TEST_CASE("Formatters - Log output", "[config]") {
    REQUIRE(fmt::format("{}", AnimationType::Pulse) == "Pulse");
    REQUIRE(fmt::format("{}", Color{1, 2, 3, 4}) == "(1,2,3,4)");
}
