#include "raylib_display_provider.hpp"

#include <algorithm>

#include <raylib.h>

RaylibDisplayProvider::RaylibDisplayProvider(MouseSource mouse)
    : m_mouse(std::move(mouse)), m_last_layout(displays()) {}

std::vector<DisplayInfo> RaylibDisplayProvider::displays() const {
    std::vector<DisplayInfo> out;
    const int count = GetMonitorCount();
    out.reserve(count);
    for (int i = 0; i < count; ++i) {
        const Vector2 pos = GetMonitorPosition(i);
        out.push_back(DisplayInfo{
            i, Rectangle{pos.x, pos.y, (float)GetMonitorWidth(i),
                         (float)GetMonitorHeight(i)}});
    }
    return out;
}

bool RaylibDisplayProvider::poll_configuration_changed() {
    auto layout = displays();
    const bool same = std::equal(
        layout.begin(), layout.end(), m_last_layout.begin(),
        m_last_layout.end(), [](const DisplayInfo &a, const DisplayInfo &b) {
            return a.id == b.id && a.frame.x == b.frame.x &&
                   a.frame.y == b.frame.y && a.frame.width == b.frame.width &&
                   a.frame.height == b.frame.height;
        });
    if (same)
        return false;
    m_last_layout = std::move(layout);
    return true;
}

Rectangle RaylibDisplayProvider::union_of(
    const std::vector<DisplayInfo> &displays) {
    bool first = true;
    float min_x = 0, min_y = 0, max_x = 0, max_y = 0;
    for (const auto &d : displays) {
        if (!d.has_valid_size())
            continue;
        if (first) {
            min_x = d.frame.x;
            min_y = d.frame.y;
            max_x = d.frame.x + d.frame.width;
            max_y = d.frame.y + d.frame.height;
            first = false;
            continue;
        }
        min_x = std::min(min_x, d.frame.x);
        min_y = std::min(min_y, d.frame.y);
        max_x = std::max(max_x, d.frame.x + d.frame.width);
        max_y = std::max(max_y, d.frame.y + d.frame.height);
    }
    return Rectangle{min_x, min_y, max_x - min_x, max_y - min_y};
}
