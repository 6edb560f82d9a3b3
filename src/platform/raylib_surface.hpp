#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <raylib.h>

#include "../overlay/surface.hpp"

class RaylibSurfaceFactory;

/**
 * @brief Overlay surface backed by a raylib render texture.
 *
 * raylib drives a single OS window, so every display's overlay is an
 * off-screen texture sized to that display; the host window spans all
 * displays and composites the visible textures at their display origins.
 */
class RaylibSurface : public IOverlaySurface {
  public:
    RaylibSurface(RaylibSurfaceFactory &factory, const DisplayInfo &display);
    ~RaylibSurface() override;
    RaylibSurface(const RaylibSurface &) = delete;
    RaylibSurface &operator=(const RaylibSurface &) = delete;
    RaylibSurface(RaylibSurface &&) = delete;
    RaylibSurface &operator=(RaylibSurface &&) = delete;

    std::optional<DisplayInfo> screen() const override;
    Rectangle frame() const override { return m_display.frame; }
    bool is_visible() const override { return m_visible && !m_closed; }
    void order_front() override;
    void order_out() override { m_visible = false; }
    void close() override;
    void present(const std::vector<Stroke> &strokes) override;

    void attach_events(WindowEventChannel &channel, WindowId id) override {
        m_channel = &channel;
        m_id = id;
    }
    void detach_events() override { m_channel = nullptr; }

    /**
     * @brief Draw the texture into the host window
     * @param host_origin Global position of the host window's top-left
     */
    void composite(Vector2 host_origin) const;

    /**
     * @brief Post ScreenLost once if the backing monitor disappeared
     */
    void check_screen();

    int z_order() const { return m_z_order; }

  private:
    void notify(WindowEvent::Kind kind);

    RaylibSurfaceFactory &m_factory;
    DisplayInfo m_display;
    RenderTexture2D m_rt{};
    bool m_visible = false;
    bool m_closed = false;
    bool m_screen_lost = false;
    int m_z_order = 0;

    WindowEventChannel *m_channel = nullptr;
    WindowId m_id = 0;
};

class RaylibSurfaceFactory : public ISurfaceFactory {
  public:
    RaylibSurfaceFactory() = default;
    RaylibSurfaceFactory(const RaylibSurfaceFactory &) = delete;
    RaylibSurfaceFactory &operator=(const RaylibSurfaceFactory &) = delete;

    std::unique_ptr<IOverlaySurface> create(const DisplayInfo &display) override;

    /**
     * @brief Composite every visible surface, lowest z-order first
     */
    void composite(Vector2 host_origin) const;

    /**
     * @brief Let each live surface check that its monitor still exists
     */
    void poll_screens();

    /**
     * @brief Close every live surface on behalf of the window manager, e.g.
     * when the host window is asked to close. Attached surfaces post
     * WillClose to their owner.
     */
    void close_all();

    std::size_t live_surfaces() const { return m_live.size(); }

  private:
    friend class RaylibSurface;

    void add(RaylibSurface *surface) { m_live.push_back(surface); }
    void remove(RaylibSurface *surface);
    int next_z_order() { return ++m_z_counter; }

    std::vector<RaylibSurface *> m_live;
    int m_z_counter = 0;
};
