#pragma once

#include <chrono>

namespace halo::constants {

using Seconds = std::chrono::duration<double>;

// Display reconfiguration handling
inline constexpr Seconds screen_change_debounce{0.3};
inline constexpr Seconds window_recreation_delay{0.1};
inline constexpr Seconds tracking_reenable_delay{0.2};

// 60 Hz animation cadence
inline constexpr Seconds animation_frame_interval{1.0 / 60.0};

inline constexpr Seconds ripple_duration{0.3};
inline constexpr Seconds pulse_duration{0.15};
inline constexpr float ripple_max_scale = 2.0f;

// Pulse shrink factor: pulse_base + pulse_gain * intensity
inline constexpr float pulse_base = 0.1f;
inline constexpr float pulse_gain = 0.4f;

// Color panel layout. Presses below this offset from the panel's top edge
// land on the panel's opacity control and must not animate the overlay.
inline constexpr float color_panel_width = 270.0f;
inline constexpr float color_panel_height = 400.0f;
inline constexpr float color_panel_opacity_threshold = 300.0f;

// Menu glyph placement, relative to the primary display's top-right corner
inline constexpr float glyph_size = 22.0f;
inline constexpr float glyph_margin = 10.0f;
inline constexpr float menu_width = 240.0f;

// Global pointer sampling period
inline constexpr std::chrono::milliseconds pointer_poll_interval{8};

} // namespace halo::constants
