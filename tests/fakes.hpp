#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "overlay/display.hpp"
#include "overlay/surface.hpp"

/**
 * @brief Display provider whose layout and cursor the test controls.
 */
class FakeDisplayProvider : public IDisplayProvider {
  public:
    std::vector<DisplayInfo> displays() const override { return layout; }
    Vector2 mouse_location() const override { return mouse; }

    std::vector<DisplayInfo> layout;
    Vector2 mouse = {0.0f, 0.0f};
};

/**
 * @brief In-memory surface. Its display can be removed from under it and
 * it records everything presented.
 */
class FakeSurface : public IOverlaySurface {
  public:
    struct Shared {
        bool screen_present = true;
        bool visible = false;
        bool closed = false;
        int close_calls = 0;
        int present_calls = 0;
        std::vector<Stroke> last_strokes;
        WindowEventChannel *channel = nullptr;
        WindowId id = 0;
        FakeSurface *self = nullptr; ///< Null once destroyed
    };

    FakeSurface(const DisplayInfo &display, std::shared_ptr<Shared> shared)
        : m_display(display), m_shared(std::move(shared)) {
        m_shared->self = this;
    }
    ~FakeSurface() override { m_shared->self = nullptr; }

    std::optional<DisplayInfo> screen() const override {
        if (!m_shared->screen_present)
            return std::nullopt;
        return m_display;
    }
    Rectangle frame() const override { return m_display.frame; }
    bool is_visible() const override {
        return m_shared->visible && !m_shared->closed;
    }
    void order_front() override { m_shared->visible = true; }
    void order_out() override { m_shared->visible = false; }
    void close() override {
        if (m_shared->closed)
            return;
        // Like the real surface: still attached means the toolkit closed it
        if (m_shared->channel)
            m_shared->channel->post(WindowEvent{m_shared->id,
                                                WindowEvent::Kind::WillClose});
        m_shared->channel = nullptr;
        m_shared->closed = true;
        ++m_shared->close_calls;
    }
    void present(const std::vector<Stroke> &strokes) override {
        ++m_shared->present_calls;
        m_shared->last_strokes = strokes;
    }
    void attach_events(WindowEventChannel &channel, WindowId id) override {
        m_shared->channel = &channel;
        m_shared->id = id;
    }
    void detach_events() override { m_shared->channel = nullptr; }

  private:
    DisplayInfo m_display;
    std::shared_ptr<Shared> m_shared;
};

/**
 * @brief Creates FakeSurfaces and keeps a handle on each one's state,
 * including after the surface itself has been destroyed.
 */
class FakeSurfaceFactory : public ISurfaceFactory {
  public:
    std::unique_ptr<IOverlaySurface> create(const DisplayInfo &display) override {
        auto shared = std::make_shared<FakeSurface::Shared>();
        created.push_back(shared);
        return std::make_unique<FakeSurface>(display, shared);
    }

    // Close every surface still alive, as the window manager would
    void close_all() {
        for (auto &s : created)
            if (s->self)
                s->self->close();
    }

    // Post a notification the way a native surface would
    void notify(std::size_t index, WindowEvent::Kind kind) {
        auto &s = *created.at(index);
        if (s.channel)
            s.channel->post(WindowEvent{s.id, kind});
    }

    std::vector<std::shared_ptr<FakeSurface::Shared>> created;
};

inline DisplayInfo make_display(int id, float x, float y, float w, float h) {
    return DisplayInfo{id, Rectangle{x, y, w, h}};
}
