#pragma once

#include <memory>

// Kept free of X11 and raylib headers: both declare a type named Font.
namespace x11 {

struct PointerSample {
    int x = 0;
    int y = 0;
    bool left_down = false;
};

/**
 * @brief Private connection to the X server used for pointer queries.
 * Not thread-safe; use from one thread only.
 */
class PointerConnection {
  public:
    /**
     * @brief Connect to $DISPLAY
     * @return nullptr if no X server is reachable
     */
    static std::unique_ptr<PointerConnection> open();

    ~PointerConnection();
    PointerConnection(const PointerConnection &) = delete;
    PointerConnection &operator=(const PointerConnection &) = delete;

    /**
     * @brief Query pointer location on the root window and button state
     * @return false if the pointer is on another screen
     */
    bool sample(PointerSample &out);

  private:
    PointerConnection(void *display, unsigned long root)
        : m_display(display), m_root(root) {}

    void *m_display;
    unsigned long m_root;
};

} // namespace x11
