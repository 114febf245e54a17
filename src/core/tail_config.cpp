#include "core/tail_config.h"

// Runtime retry settings shared by every OplogStream built from
// TailConfig::currentPolicy(). Atomic so the CLI can reload them while a
// stream is being consumed on another thread.
std::atomic<size_t> TailConfig::MAX_CONSECUTIVE_ERRORS =
    TailConfig::DEFAULT_MAX_CONSECUTIVE_ERRORS;
std::atomic<size_t> TailConfig::INITIAL_BACKOFF_MS =
    TailConfig::DEFAULT_INITIAL_BACKOFF_MS;
std::atomic<size_t> TailConfig::MAX_BACKOFF_MS =
    TailConfig::DEFAULT_MAX_BACKOFF_MS;
std::atomic<size_t> TailConfig::IDLE_POLL_INTERVAL_MS =
    TailConfig::DEFAULT_IDLE_POLL_INTERVAL_MS;
