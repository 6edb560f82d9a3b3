#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "../render/circle_renderer.hpp"
#include "display.hpp"
#include "window_event.hpp"

/**
 * @brief Native overlay window: borderless, transparent, always on top,
 * click-through and visible on every workspace
 */
class IOverlaySurface {
  public:
    virtual ~IOverlaySurface() = default;

    /**
     * @brief The display currently backing this surface, if it still exists
     */
    virtual std::optional<DisplayInfo> screen() const = 0;

    /**
     * @brief Frame the surface was created with, in global coordinates
     */
    virtual Rectangle frame() const = 0;

    virtual bool is_visible() const = 0;
    virtual void order_front() = 0;
    virtual void order_out() = 0;
    virtual void close() = 0;

    /**
     * @brief Replace the surface content with the given strokes
     */
    virtual void present(const std::vector<Stroke> &strokes) = 0;

    /**
     * @brief Route this surface's notifications to a channel, tagged with id
     */
    virtual void attach_events(WindowEventChannel &channel, WindowId id) = 0;

    /**
     * @brief Stop sending notifications; must be called before closing
     */
    virtual void detach_events() = 0;
};

class ISurfaceFactory {
  public:
    virtual ~ISurfaceFactory() = default;

    /**
     * @brief Create a hidden overlay surface covering display
     */
    virtual std::unique_ptr<IOverlaySurface>
    create(const DisplayInfo &display) = 0;
};
