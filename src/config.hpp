#pragma once

/**
 * Application configuration constants.
 *
 * Defines the settings file name and the defaults used when neither the
 * settings file nor the command line provides a value.
 */

namespace mdstream {
namespace config {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = ".mdstream.json";  // Local settings file.

// ========== Rendering ==========

constexpr const char* DEFAULT_STYLE = "dark";  // Style used when none is given.
constexpr int DEFAULT_WRAP_WIDTH = 80;         // Wrap width when no terminal width is known.
constexpr int TAB_WIDTH = 2;                   // Spaces substituted for each tab.

// ========== Simulated Streaming ==========

constexpr int DEFAULT_CHUNK_SIZE = 16;     // Bytes per write() when reading files.
constexpr int DEFAULT_CHUNK_DELAY_MS = 0;  // Pause between chunks.

} // namespace config
} // namespace mdstream
