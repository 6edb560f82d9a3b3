#pragma once

#include <atomic>
#include <memory>
#include <thread>

#include "../input/pointer_queue.hpp"
#include "x11_connection.hpp"

/**
 * @brief System-wide pointer monitor for X11 sessions.
 *
 * The overlay window is click-through, so the toolkit never sees pointer
 * events over other applications. This monitor samples the pointer and
 * button state from the X server on its own thread and pushes moves, drags,
 * presses and releases into the router's queue.
 */
class X11PointerMonitor : public input::IPointerMonitor {
  public:
    X11PointerMonitor() = default;
    ~X11PointerMonitor() override;
    X11PointerMonitor(const X11PointerMonitor &) = delete;
    X11PointerMonitor &operator=(const X11PointerMonitor &) = delete;

    bool start(input::PointerQueue &queue) override;
    void stop() override;
    input::PointerSource source() const override {
        return input::PointerSource::Global;
    }

  private:
    void run(std::unique_ptr<x11::PointerConnection> connection,
             input::PointerQueue &queue);

    std::thread m_thread;
    std::atomic<bool> m_running{false};
};
