#pragma once

#include <cstdint>
#include <mutex>
#include <vector>

using WindowId = std::uint32_t;

/**
 * @brief Notification sent by a native surface about its window
 */
struct WindowEvent {
    enum class Kind {
        ScreenLost, ///< The backing display went away
        WillClose   ///< The toolkit is closing the window on its own
    };

    WindowId window;
    Kind kind;
};

/**
 * @brief Message channel from native surfaces to their owning manager.
 *
 * Surfaces only hold the channel and their own id, never a pointer to the
 * manager. Toolkit callbacks may fire on any thread; the manager drains the
 * channel on the UI thread.
 */
class WindowEventChannel {
  public:
    void post(const WindowEvent &event) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.push_back(event);
    }

    std::vector<WindowEvent> drain() {
        std::vector<WindowEvent> out;
        std::lock_guard<std::mutex> lock(m_mutex);
        out.swap(m_events);
        return out;
    }

  private:
    std::mutex m_mutex;
    std::vector<WindowEvent> m_events;
};
