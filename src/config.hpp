#pragma once

/**
 * Application configuration constants.
 *
 * Defines file names, defaults and the recognized link and image syntax for
 * the memomark CLI.
 */

#include <string>

namespace memomark {

// ========== File Paths ==========

constexpr const char* SETTINGS_FILE = ".memomark.json";  // Local settings file.
constexpr const char* DEFAULT_IMAGES_DIR = "images";     // Image store directory.

// ========== Defaults ==========

constexpr int DEFAULT_WATCH_DEBOUNCE_MS = 300;
constexpr const char* DEFAULT_SERVER_ADDRESS = "127.0.0.1";
constexpr int DEFAULT_SERVER_PORT = 8190;

// ========== Markdown ==========

constexpr int MAX_HEADING_LEVEL = 6;  // Render-time clamp; parsing keeps the raw count.

// Schemes accepted in ![alt](scheme://ref). "image" is resolved through the
// image store, "cache" only from memory.
constexpr const char* IMAGE_SCHEME = "image";
constexpr const char* CACHE_SCHEME = "cache";
inline const char* const IMAGE_SCHEMES[] = {IMAGE_SCHEME, CACHE_SCHEME};

// Prefixes that start a bare autolink. "https://" precedes "http://" so the
// longer prefix is tried first.
inline const char* const AUTOLINK_PREFIXES[] = {"https://", "http://", "ftp://", "www."};

constexpr const char* DEFAULT_IMAGE_EXTENSION = "png";

} // namespace memomark
