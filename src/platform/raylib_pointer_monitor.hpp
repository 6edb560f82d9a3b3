#pragma once

#include <functional>

#include "../input/pointer_queue.hpp"

/**
 * @brief In-app pointer monitor sampling raylib input once per frame.
 *
 * Only reports while the host window accepts input (settings surface open),
 * because click-through windows receive nothing from the toolkit.
 */
class RaylibPointerMonitor : public input::IPointerMonitor {
  public:
    using TagFn = std::function<input::WindowTag(Vector2)>;

    /**
     * @param tag_of Classifies which app window a global point is over
     */
    explicit RaylibPointerMonitor(TagFn tag_of) : m_tag_of(std::move(tag_of)) {}

    bool start(input::PointerQueue &queue) override;
    void stop() override { m_queue = nullptr; }
    void poll() override;
    input::PointerSource source() const override {
        return input::PointerSource::InApp;
    }

  private:
    input::PointerQueue *m_queue = nullptr;
    TagFn m_tag_of;
    Vector2 m_last = {-1.0f, -1.0f};
};
