#include "raylib_surface.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/logger.hpp"

RaylibSurface::RaylibSurface(RaylibSurfaceFactory &factory,
                             const DisplayInfo &display)
    : m_factory(factory), m_display(display) {
    m_rt = LoadRenderTexture((int)display.frame.width,
                             (int)display.frame.height);
    if (m_rt.id == 0)
        throw halo::RenderError(
            fmt::format("could not allocate {}x{} overlay texture",
                        (int)display.frame.width, (int)display.frame.height));

    BeginTextureMode(m_rt);
    ClearBackground(BLANK);
    EndTextureMode();

    m_factory.add(this);
}

RaylibSurface::~RaylibSurface() {
    close();
    m_factory.remove(this);
}

std::optional<DisplayInfo> RaylibSurface::screen() const {
    if (m_display.id < 0 || m_display.id >= GetMonitorCount())
        return std::nullopt;
    const Vector2 pos = GetMonitorPosition(m_display.id);
    return DisplayInfo{m_display.id,
                       Rectangle{pos.x, pos.y,
                                 (float)GetMonitorWidth(m_display.id),
                                 (float)GetMonitorHeight(m_display.id)}};
}

void RaylibSurface::order_front() {
    if (m_closed)
        return;
    m_visible = true;
    m_z_order = m_factory.next_z_order();
}

void RaylibSurface::close() {
    if (m_closed)
        return;
    // The toolkit closing a window it still reports for tells its owner
    notify(WindowEvent::Kind::WillClose);
    m_channel = nullptr;
    m_visible = false;
    m_closed = true;
    UnloadRenderTexture(m_rt);
    m_rt = RenderTexture2D{};
}

void RaylibSurface::present(const std::vector<Stroke> &strokes) {
    if (m_closed)
        return;
    BeginTextureMode(m_rt);
    ClearBackground(BLANK);
    CircleRenderer::paint(strokes);
    EndTextureMode();
}

void RaylibSurface::composite(Vector2 host_origin) const {
    if (!is_visible())
        return;
    const float w = (float)m_rt.texture.width;
    const float h = (float)m_rt.texture.height;
    // render textures are stored upside down
    DrawTextureRec(m_rt.texture, Rectangle{0, 0, w, -h},
                   Vector2{m_display.frame.x - host_origin.x,
                           m_display.frame.y - host_origin.y},
                   WHITE);
}

void RaylibSurface::check_screen() {
    if (m_closed || m_screen_lost)
        return;
    auto current = screen();
    if (current && current->has_valid_size())
        return;
    m_screen_lost = true;
    notify(WindowEvent::Kind::ScreenLost);
}

void RaylibSurface::notify(WindowEvent::Kind kind) {
    if (m_channel)
        m_channel->post(WindowEvent{m_id, kind});
}

std::unique_ptr<IOverlaySurface>
RaylibSurfaceFactory::create(const DisplayInfo &display) {
    LOG_DEBUG(fmt::format("Creating overlay surface for monitor {}",
                          display.id));
    return std::make_unique<RaylibSurface>(*this, display);
}

void RaylibSurfaceFactory::composite(Vector2 host_origin) const {
    std::vector<RaylibSurface *> ordered = m_live;
    std::sort(ordered.begin(), ordered.end(),
              [](const RaylibSurface *a, const RaylibSurface *b) {
                  return a->z_order() < b->z_order();
              });
    for (const auto *surface : ordered)
        surface->composite(host_origin);
}

void RaylibSurfaceFactory::poll_screens() {
    // check_screen() only posts to a channel, it never destroys surfaces
    for (auto *surface : m_live)
        surface->check_screen();
}

void RaylibSurfaceFactory::close_all() {
    for (auto *surface : m_live)
        surface->close();
}

void RaylibSurfaceFactory::remove(RaylibSurface *surface) {
    m_live.erase(std::remove(m_live.begin(), m_live.end(), surface),
                 m_live.end());
}
