#pragma once

#include <functional>
#include <vector>

#include "../overlay/display.hpp"

/**
 * @brief Monitor enumeration through raylib
 *
 * raylib has no display-change callback, so the provider keeps a signature
 * of the last seen layout and reports a change when it differs.
 */
class RaylibDisplayProvider : public IDisplayProvider {
  public:
    using MouseSource = std::function<Vector2()>;

    explicit RaylibDisplayProvider(MouseSource mouse);

    std::vector<DisplayInfo> displays() const override;
    Vector2 mouse_location() const override { return m_mouse(); }

    /**
     * @brief Compare the current layout against the last one seen
     * @return true once per change
     */
    bool poll_configuration_changed();

    /**
     * @brief Bounding box of every display with a valid size
     */
    static Rectangle union_of(const std::vector<DisplayInfo> &displays);

  private:
    MouseSource m_mouse;
    std::vector<DisplayInfo> m_last_layout;
};
