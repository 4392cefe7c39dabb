#pragma once

#include <cstddef>

// ── Remote service ──────────────────────────────────────────
constexpr const char* HORIZONS_HOST = "horizons.jpl.nasa.gov";
constexpr int HORIZONS_PORT         = 6775;

// ── Timeouts ────────────────────────────────────────────────
constexpr int STEP_TIMEOUT_SECS      = 30;    // Max wait for any single prompt
constexpr int CONNECT_TIMEOUT_SECS   = 30;    // Max wait for TCP connect
constexpr int EXPECT_POLL_MS         = 50;    // Upper bound on one read wait inside expect

// ── Buffer sizes ────────────────────────────────────────────
constexpr int TELNET_READ_BUF_SIZE   = 4096;

// ── Dialogue ────────────────────────────────────────────────
constexpr const char* LINE_ENDING    = "\r\n";
constexpr const char* TABLE_START_MARKER = "$$SOE";
constexpr const char* TABLE_END_MARKER   = "$$EOE";

// Placeholder value written after the start time when the remote side
// rejects the observer/target combination at the start-date step.
constexpr const char* DISALLOWED_PLACEHOLDER = "0";

// ── Query defaults ──────────────────────────────────────────
constexpr const char* DEFAULT_STEP_SIZE     = "7d";
constexpr const char* DEFAULT_QUANTITY_CODE = "21";

// ── Output ──────────────────────────────────────────────────
constexpr const char* TABLE_FILE_EXTENSION = ".txt";

// ── Echo replies ────────────────────────────────────────────
constexpr const char* MENTION_HANDLE      = "@celestial_echo";
constexpr size_t REPLY_MAX_CHARS          = 280;
