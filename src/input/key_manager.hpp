#pragma once

#include <functional>
#include <vector>

#include <raylib.h>

/**
 * @brief Keyboard shortcuts for the overlay host window.
 *
 * Handlers fire once per key press when the modifier state matches exactly.
 * Nothing fires while ImGui owns the keyboard (a slider being typed into).
 */
class KeyManager {
  public:
    struct Modifiers {
        bool ctrl = false; ///< Ctrl or Super
        bool shift = false;
    };

    /**
     * @brief Register a handler for a key press
     * @param key The raylib key code
     * @param handler Function to call when the key is pressed
     * @param mods Modifiers that must be held, and only those
     */
    void on_key_pressed(int key, std::function<void()> handler,
                        Modifiers mods = {});

    /**
     * @brief Run the handlers whose key was pressed this frame
     * @param imgui_captured Whether ImGui has captured keyboard input
     */
    void process(bool imgui_captured);

    void clear() { m_handlers.clear(); }
    std::size_t size() const { return m_handlers.size(); }

  private:
    struct Handler {
        int key;
        Modifiers mods;
        std::function<void()> callback;
    };

    static Modifiers current_modifiers();

    std::vector<Handler> m_handlers;
};
