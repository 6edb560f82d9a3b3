#pragma once

#include <vector>

#include <raylib.h>

/**
 * @brief One active display as reported by the window server
 */
struct DisplayInfo {
    int id = -1;          ///< Toolkit monitor index, not stable across changes
    Rectangle frame = {}; ///< Bounds in global coordinates

    bool has_valid_size() const {
        return frame.width > 0.0f && frame.height > 0.0f;
    }
    Vector2 origin() const { return {frame.x, frame.y}; }
};

// Converts a global pointer location into a window's local space.
inline Vector2 to_local(Vector2 global, Vector2 window_origin) {
    return {global.x - window_origin.x, global.y - window_origin.y};
}

/**
 * @brief Screen enumeration and cursor query provided by the host toolkit
 */
class IDisplayProvider {
  public:
    virtual ~IDisplayProvider() = default;

    /**
     * @brief Enumerate active displays in toolkit order
     */
    virtual std::vector<DisplayInfo> displays() const = 0;

    /**
     * @brief Current cursor location in global coordinates
     */
    virtual Vector2 mouse_location() const = 0;
};
