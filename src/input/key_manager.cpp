#include "key_manager.hpp"

void KeyManager::on_key_pressed(int key, std::function<void()> handler,
                                Modifiers mods) {
    m_handlers.push_back(Handler{key, mods, std::move(handler)});
}

void KeyManager::process(bool imgui_captured) {
    if (imgui_captured)
        return;

    const Modifiers held = current_modifiers();
    for (const auto &handler : m_handlers) {
        if (handler.mods.ctrl != held.ctrl || handler.mods.shift != held.shift)
            continue;
        if (IsKeyPressed(handler.key))
            handler.callback();
    }
}

KeyManager::Modifiers KeyManager::current_modifiers() {
    Modifiers m;
    m.ctrl = IsKeyDown(KEY_LEFT_CONTROL) || IsKeyDown(KEY_RIGHT_CONTROL) ||
             IsKeyDown(KEY_LEFT_SUPER) || IsKeyDown(KEY_RIGHT_SUPER);
    m.shift = IsKeyDown(KEY_LEFT_SHIFT) || IsKeyDown(KEY_RIGHT_SHIFT);
    return m;
}
