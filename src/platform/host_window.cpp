#include "host_window.hpp"

#include <imgui.h>
#include <rlImGui.h>

#include <fmt/format.h>

#include "../utility/exceptions.hpp"
#include "../utility/formatters.hpp"
#include "../utility/logger.hpp"

HostWindow::HostWindow(const char *title) {
    SetConfigFlags(FLAG_WINDOW_UNDECORATED | FLAG_WINDOW_TRANSPARENT |
                   FLAG_WINDOW_TOPMOST | FLAG_WINDOW_MOUSE_PASSTHROUGH |
                   FLAG_MSAA_4X_HINT);
    InitWindow(1, 1, title);
    if (!IsWindowReady())
        throw halo::PlatformError("could not create the host window");

    SetExitKey(KEY_NULL);
    SetTargetFPS(60);
    rlImGuiSetup(true);

    ImGui::GetIO().IniFilename = nullptr;
}

HostWindow::~HostWindow() {
    rlImGuiShutdown();
    CloseWindow();
}

void HostWindow::fit(Rectangle bounds) {
    if (bounds.width <= 0 || bounds.height <= 0)
        return;
    SetWindowPosition((int)bounds.x, (int)bounds.y);
    SetWindowSize((int)bounds.width, (int)bounds.height);
    m_origin = {bounds.x, bounds.y};
    LOG_DEBUG(fmt::format("Host window spans {}", bounds));
}

void HostWindow::set_passthrough(bool enabled) {
    if (enabled == m_passthrough)
        return;
    if (enabled)
        SetWindowState(FLAG_WINDOW_MOUSE_PASSTHROUGH);
    else
        ClearWindowState(FLAG_WINDOW_MOUSE_PASSTHROUGH);
    m_passthrough = enabled;
}
