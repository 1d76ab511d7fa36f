#pragma once

// ── Screen layout ───────────────────────────────────────────
constexpr int DEFAULT_CHROME_ROWS   = 4;      // filter prompt plus margin
// Header plus the newline ending the last item row; fewer scrolls the screen.
constexpr int MIN_CHROME_ROWS       = 2;
constexpr int ROW_PREFIX_WIDTH      = 2;      // "> " or "  " before every item
constexpr int DEFAULT_TERM_WIDTH    = 80;
constexpr int DEFAULT_TERM_HEIGHT   = 24;

// ── Input ───────────────────────────────────────────────────
// Longest recognized sequence is ESC [ A/B.
constexpr int INPUT_READ_BUF_SIZE   = 3;

// ── Display ─────────────────────────────────────────────────
constexpr const char* DEFAULT_SEPARATOR   = " - ";
constexpr const char* TABLE_COLUMN_GAP    = "  ";
constexpr const char* ELLIPSIS            = "...";
constexpr const char* NO_MATCHES_TEXT     = "(no matches)";
constexpr const char* LINE_MODE_FIELD     = "line";

// ── Files ───────────────────────────────────────────────────
constexpr const char* TTY_DEVICE          = "/dev/tty";
constexpr const char* CONFIG_DIR_NAME     = ".jpick";
constexpr const char* CONFIG_FILE_NAME    = "config.yaml";
constexpr const char* CONFIG_PATH_ENV     = "JPICK_CONFIG";
constexpr const char* DEBUG_ENV           = "JPICK_DEBUG";
constexpr const char* DEBUG_LOG_FILE      = "jpick_debug.log";

constexpr const char* JPICK_VERSION       = "0.4.0";
