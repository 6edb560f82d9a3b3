#include "x11_pointer_monitor.hpp"

#include "../utility/constants.hpp"
#include "../utility/logger.hpp"

X11PointerMonitor::~X11PointerMonitor() { stop(); }

bool X11PointerMonitor::start(input::PointerQueue &queue) {
    if (m_running)
        return true;

    auto connection = x11::PointerConnection::open();
    if (!connection)
        return false;

    m_running = true;
    m_thread = std::thread(
        [this, conn = std::move(connection), &queue]() mutable {
            run(std::move(conn), queue);
        });
    LOG_INFO("Global pointer monitor started");
    return true;
}

void X11PointerMonitor::stop() {
    if (!m_running)
        return;
    m_running = false;
    if (m_thread.joinable())
        m_thread.join();
    LOG_INFO("Global pointer monitor stopped");
}

void X11PointerMonitor::run(std::unique_ptr<x11::PointerConnection> connection,
                            input::PointerQueue &queue) {
    bool have_last = false;
    x11::PointerSample last;

    while (m_running) {
        x11::PointerSample s;
        if (connection->sample(s)) {
            const Vector2 pos = {(float)s.x, (float)s.y};

            if (!have_last || s.x != last.x || s.y != last.y) {
                queue.push({s.left_down ? input::PointerKind::Drag
                                        : input::PointerKind::Move,
                            pos, input::PointerSource::Global,
                            input::WindowTag::None});
            }
            if (have_last && s.left_down != last.left_down) {
                queue.push({s.left_down ? input::PointerKind::Press
                                        : input::PointerKind::Release,
                            pos, input::PointerSource::Global,
                            input::WindowTag::None});
            }
            last = s;
            have_last = true;
        }

        std::this_thread::sleep_for(halo::constants::pointer_poll_interval);
    }
}
