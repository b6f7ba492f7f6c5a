#pragma once

#include <cstddef>

// ── Pipeline limits ─────────────────────────────────────────
constexpr size_t DEFAULT_CACHE_SIZE        = 64;    // Render cache entries
constexpr size_t MAX_ACTIVE_BLOCKS         = 128;   // Oldest-first eviction above this
constexpr size_t QUICK_MATCH_LINES         = 30;    // Lines handed to quick_match()

// ── Boundary detection ──────────────────────────────────────
constexpr size_t DEFAULT_MAX_SCAN_LINES    = 500;
constexpr unsigned DEFAULT_DEBOUNCE_MS     = 100;
constexpr size_t DEFAULT_BLANK_THRESHOLD   = 2;
constexpr size_t MIN_FENCE_LENGTH          = 3;     // ``` or ~~~

// ── Rendering ───────────────────────────────────────────────
constexpr size_t DEFAULT_TERMINAL_WIDTH    = 80;
constexpr size_t DEFAULT_TERMINAL_HEIGHT   = 24;
constexpr int JSON_INDENT                  = 2;

// ── Logging ─────────────────────────────────────────────────
constexpr size_t LOG_PREVIEW_CHARS         = 60;    // Line excerpts in debug log
