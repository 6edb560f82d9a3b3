#pragma once

#include <mutex>
#include <vector>

#include "pointer_event.hpp"

namespace input {

/**
 * @brief Marshal point between pointer monitors and the UI thread.
 * Monitors push from whatever thread the OS calls them on; the router drains
 * on the UI thread.
 */
class PointerQueue {
  public:
    void push(const PointerEvent &event) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_queue.push_back(event);
    }

    std::vector<PointerEvent> drain() {
        std::vector<PointerEvent> out;
        std::lock_guard<std::mutex> lock(m_mutex);

        out.swap(m_queue);

        return out;
    }

  private:
    std::mutex m_mutex;
    std::vector<PointerEvent> m_queue;
};

/**
 * @brief Subscription to a stream of pointer events
 */
class IPointerMonitor {
  public:
    virtual ~IPointerMonitor() = default;

    /**
     * @brief Begin delivering events into queue
     * @return false if the monitor is unavailable on this system
     */
    virtual bool start(PointerQueue &queue) = 0;

    virtual void stop() = 0;

    /**
     * @brief Per-frame hook on the UI thread for monitors that sample
     */
    virtual void poll() {}

    virtual PointerSource source() const = 0;
};

} // namespace input
