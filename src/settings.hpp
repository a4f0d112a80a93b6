#pragma once

/**
 * Settings persistence for the memomark CLI.
 *
 * Settings live in a small JSON file (.memomark.json in the working
 * directory by default). Every field is optional in the file; missing
 * fields keep their built-in defaults.
 */

#include "config.hpp"
#include <optional>
#include <string>

namespace memomark {

/**
 * Application settings stored in .memomark.json.
 */
struct Settings {
    std::string images_dir = DEFAULT_IMAGES_DIR;            // Image store directory.
    bool colors = true;                                     // ANSI output when the terminal allows it.
    int watch_debounce_ms = DEFAULT_WATCH_DEBOUNCE_MS;      // Delay after the last change before re-rendering.
    std::string server_address = DEFAULT_SERVER_ADDRESS;    // Preview API bind address.
    int server_port = DEFAULT_SERVER_PORT;                  // Preview API port.
};

// Loads settings from path. Returns empty optional if the file doesn't exist
// or is not valid JSON.
std::optional<Settings> load_settings(const std::string& path = SETTINGS_FILE);

// Saves settings to path. Throws std::runtime_error if the file cannot be written.
void save_settings(const Settings& settings, const std::string& path = SETTINGS_FILE);

} // namespace memomark
