#pragma once

#include "key_manager.hpp"

#include "../render/types/context.hpp"

/**
 * @brief Registers the keyboard shortcuts of the settings surface.
 *
 * Shortcuts only reach the host window while it accepts input, i.e. while
 * the settings menu or the color panel is open.
 *
 * @param key_manager The KeyManager instance to register handlers with
 * @param settings Settings surface state toggled by the shortcuts
 * @param should_exit Set when quitting is requested
 */
void setup_keys(KeyManager &key_manager, SettingsState &settings,
                bool &should_exit);
