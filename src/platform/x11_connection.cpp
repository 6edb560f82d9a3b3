#include "x11_connection.hpp"

#include <X11/Xlib.h>

namespace x11 {

std::unique_ptr<PointerConnection> PointerConnection::open() {
    ::Display *display = XOpenDisplay(nullptr);
    if (!display)
        return nullptr;
    return std::unique_ptr<PointerConnection>(
        new PointerConnection(display, DefaultRootWindow(display)));
}

PointerConnection::~PointerConnection() {
    XCloseDisplay(static_cast<::Display *>(m_display));
}

bool PointerConnection::sample(PointerSample &out) {
    ::Window root_ret = 0, child_ret = 0;
    int root_x = 0, root_y = 0, win_x = 0, win_y = 0;
    unsigned int mask = 0;

    if (!XQueryPointer(static_cast<::Display *>(m_display), m_root, &root_ret,
                       &child_ret, &root_x, &root_y, &win_x, &win_y, &mask))
        return false;

    out.x = root_x;
    out.y = root_y;
    out.left_down = (mask & Button1Mask) != 0;
    return true;
}

} // namespace x11
