#pragma once

// ── API ─────────────────────────────────────────────────────
constexpr const char* DEFAULT_API_URI     = "https://api.grid5000.fr";
constexpr const char* DEFAULT_API_VERSION = "sid";
constexpr const char* JSON_CONTENT_TYPE   = "application/json";

// ── Timeouts ────────────────────────────────────────────────
constexpr int HTTP_TIMEOUT_SECS          = 15;     // Per-request transport timeout
constexpr int HTTP_RETRY_DELAY_SECS      = 1;      // Delay between GET retries on timeout
constexpr int JOB_POLL_SECS              = 5;      // Seconds between job state polls
constexpr int JOB_WAIT_TIMEOUT_SECS      = 36000;  // 10h, covers scheduling queues
constexpr int DEPLOY_POLL_SECS           = 5;      // Seconds between deployment polls
constexpr int DEPLOY_WAIT_TIMEOUT_SECS   = 3600;
constexpr int RELEASE_ALL_TIMEOUT_SECS   = 20;

// ── Retry counts ────────────────────────────────────────────
constexpr int HTTP_MAX_RETRIES           = 3;      // GET retries on transport timeout

// ── Log truncation ──────────────────────────────────────────
constexpr int LOG_BODY_MAX               = 500;

// ── Default reservation values ──────────────────────────────
constexpr int DEFAULT_WALLTIME_SECS      = 3600;
constexpr const char* DEFAULT_WALLTIME   = "1:00:00";
constexpr const char* DEFAULT_JOB_NAME   = "g5kctl job";

// ── Job / deployment state strings ──────────────────────────
constexpr const char* STATE_RUNNING      = "running";
constexpr const char* DEPLOY_PROCESSING  = "processing";
constexpr const char* DEPLOY_ERROR       = "error";
constexpr const char* NODE_RESULT_OK     = "OK";
constexpr const char* ALREADY_KILLED     = "already killed";

// ── Submission job types ────────────────────────────────────
constexpr const char* JOB_TYPE_DEPLOY    = "deploy";
constexpr const char* JOB_TYPE_NORMAL    = "allow_classic_ssh";

// ── Resource grammar ────────────────────────────────────────
// Predefined subnet widths, in priority order when several are given.
constexpr int SLASH_22_BITS              = 22;
constexpr int SLASH_18_BITS              = 18;
constexpr const char* KAVLAN_ISOLATED    = "kavlan";
constexpr const char* KAVLAN_ROUTED      = "kavlan-global";
