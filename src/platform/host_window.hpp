#pragma once

#include <raylib.h>

/**
 * @brief The single raylib window that hosts every overlay.
 *
 * Undecorated, transparent, always on top and click-through. It is resized
 * to span the union of all displays after every rebuild. Owns the raylib and
 * rlImGui lifetimes, so it must outlive every render texture.
 */
class HostWindow {
  public:
    /**
     * @throws halo::PlatformError if the window could not be created
     */
    explicit HostWindow(const char *title);
    ~HostWindow();
    HostWindow(const HostWindow &) = delete;
    HostWindow &operator=(const HostWindow &) = delete;

    /**
     * @brief Move and resize the window to cover bounds (global coordinates)
     */
    void fit(Rectangle bounds);

    /**
     * @brief Toggle click-through. Off while the settings surface is open.
     */
    void set_passthrough(bool enabled);
    bool passthrough() const { return m_passthrough; }

    Vector2 origin() const { return m_origin; }

  private:
    Vector2 m_origin = {0.0f, 0.0f};
    bool m_passthrough = true;
};
