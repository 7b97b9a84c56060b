#pragma once

/**
 * Settings persistence for mdstream.
 *
 * Rendering preferences are stored in a local JSON file so they do not have
 * to be repeated on every invocation. Command-line flags override them.
 */

#include "config.hpp"

#include <optional>
#include <string>

namespace mdstream {

/**
 * Settings stored in .mdstream.json.
 */
struct Settings {
    std::string style = config::DEFAULT_STYLE;               // Render style name.
    int width = 0;                                           // Terminal width, 0 = auto-detect.
    bool partial_preview = false;                            // Preview the open block.
    int chunk_size = config::DEFAULT_CHUNK_SIZE;             // Bytes per simulated token chunk.
    int chunk_delay_ms = config::DEFAULT_CHUNK_DELAY_MS;     // Pause between chunks.
};

// Loads settings from path. Returns empty optional if the file doesn't exist
// or is not valid JSON.
std::optional<Settings> load_settings(const std::string& path = config::SETTINGS_FILE);

// Saves settings to path. Throws std::runtime_error if the file can't be written.
void save_settings(const Settings& settings, const std::string& path = config::SETTINGS_FILE);

} // namespace mdstream
