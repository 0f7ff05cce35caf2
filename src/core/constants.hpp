#pragma once

#include <cstdint>

constexpr const char* CREDGUARD_VERSION = "0.1.0";

// ── Stored item address ─────────────────────────────────────
// One item per process; overridable in ~/.credguard/config.yaml.
constexpr const char* DEFAULT_ITEM_SERVICE   = "credguard-biometric-token";
constexpr const char* DEFAULT_ITEM_ACCOUNT   = "api-token";

// ── Authentication prompt ───────────────────────────────────
constexpr const char* DEFAULT_PROMPT_REASON  = "Access your API credentials";
constexpr const char* DEFAULT_CANCEL_LABEL   = "Cancel";

// ── Advisory auth cache ─────────────────────────────────────
constexpr int AUTH_CACHE_INTERVAL_SECS       = 3600;  // 1 hour, not configurable

// ── Passcode factor ─────────────────────────────────────────
constexpr int DEFAULT_MAX_ATTEMPTS           = 3;     // Tries per ceremony
constexpr int DEFAULT_LOCKOUT_SECS           = 30;    // Lockout after exhausting tries
constexpr int PASSCODE_READ_TIMEOUT_MS       = 60000; // Terminal input timeout
constexpr const char* PASSCODE_LOCKOUT_FILE  = "passcode_lockout.yaml";  // Under the config dir
constexpr int PBKDF2_ITERATIONS              = 210000;
constexpr int PBKDF2_SALT_BYTES              = 16;
constexpr int PBKDF2_HASH_BYTES              = 32;

// ── Payload envelope ────────────────────────────────────────
constexpr uint8_t ENVELOPE_VERSION           = 0x01;
constexpr int ENVELOPE_HEADER_BYTES          = 5;     // version + u32 length

// ── Store status codes (FileSecureStore) ────────────────────
// Raw codes surfaced through StorageError / StoreWriteFailed for diagnostics.
constexpr int STORE_ERR_IO                   = -1;
constexpr int STORE_ERR_FORMAT               = -2;
constexpr int STORE_ERR_PERMISSIONS          = -3;
constexpr int STORE_ERR_AUTH_UNAVAILABLE     = -4;
