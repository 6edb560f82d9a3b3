#include "keys.hpp"

#include "../utility/logger.hpp"

void setup_keys(KeyManager &key_manager, SettingsState &settings,
                bool &should_exit) {
    key_manager.on_key_pressed(
        KEY_COMMA,
        [&settings]() {
            settings.menu_open = !settings.menu_open;
            if (settings.menu_open)
                settings.color_panel_open = false;
        },
        {.ctrl = true}); // Ctrl+,

    key_manager.on_key_pressed(
        KEY_Q,
        [&should_exit]() {
            LOG_INFO("Quit requested from keyboard");
            should_exit = true;
        },
        {.ctrl = true}); // Ctrl+Q

    key_manager.on_key_pressed(KEY_ESCAPE, [&settings]() {
        if (settings.menu_open)
            settings.menu_open = false;
        else
            settings.color_panel_open = false;
    });
}
