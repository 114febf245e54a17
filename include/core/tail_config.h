#ifndef TAIL_CONFIG_H
#define TAIL_CONFIG_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

// Retry behaviour of an OplogStream. maxConsecutiveErrors == 0 retries
// failed pulls forever.
struct RetryPolicy {
  size_t maxConsecutiveErrors{0};
  std::chrono::milliseconds initialBackoff{100};
  std::chrono::milliseconds maxBackoff{5000};
  std::chrono::milliseconds idlePollInterval{0};

  // Delay before the retry that follows the n-th consecutive error
  // (n >= 1): initialBackoff doubled n-1 times, capped at maxBackoff.
  std::chrono::milliseconds backoffFor(size_t consecutiveErrors) const {
    if (consecutiveErrors == 0 || initialBackoff.count() <= 0) {
      return std::chrono::milliseconds(0);
    }
    auto delay = initialBackoff;
    for (size_t i = 1; i < consecutiveErrors && delay < maxBackoff; ++i) {
      delay *= 2;
    }
    return delay < maxBackoff ? delay : maxBackoff;
  }
};

struct TailConfig {
  static std::atomic<size_t> MAX_CONSECUTIVE_ERRORS;
  static std::atomic<size_t> INITIAL_BACKOFF_MS;
  static std::atomic<size_t> MAX_BACKOFF_MS;
  static std::atomic<size_t> IDLE_POLL_INTERVAL_MS;

  static constexpr size_t DEFAULT_MAX_CONSECUTIVE_ERRORS = 0;
  static constexpr size_t DEFAULT_INITIAL_BACKOFF_MS = 100;
  static constexpr size_t DEFAULT_MAX_BACKOFF_MS = 5000;
  static constexpr size_t DEFAULT_IDLE_POLL_INTERVAL_MS = 0;

  // Budget oplog_tail starts from. A failed libmongoc cursor keeps failing,
  // so at the default backoff cap this ends the tool after about five
  // minutes instead of retrying forever. The "tailing" config overrides it.
  static constexpr size_t TOOL_MAX_CONSECUTIVE_ERRORS = 60;

  static constexpr size_t MAX_MAX_CONSECUTIVE_ERRORS = 1000000;
  static constexpr size_t MAX_INITIAL_BACKOFF_MS = 60000;
  static constexpr size_t MAX_MAX_BACKOFF_MS = 300000;
  static constexpr size_t MAX_IDLE_POLL_INTERVAL_MS = 10000;

  static void setMaxConsecutiveErrors(size_t v) {
    if (v > MAX_MAX_CONSECUTIVE_ERRORS) {
      throw std::invalid_argument("MAX_CONSECUTIVE_ERRORS must be between 0 "
                                  "and " +
                                  std::to_string(MAX_MAX_CONSECUTIVE_ERRORS));
    }
    MAX_CONSECUTIVE_ERRORS = v;
  }

  static size_t getMaxConsecutiveErrors() { return MAX_CONSECUTIVE_ERRORS; }

  static void setInitialBackoffMs(size_t v) {
    if (v > MAX_INITIAL_BACKOFF_MS) {
      throw std::invalid_argument("INITIAL_BACKOFF_MS must be between 0 and " +
                                  std::to_string(MAX_INITIAL_BACKOFF_MS));
    }
    if (v > MAX_BACKOFF_MS) {
      throw std::invalid_argument(
          "INITIAL_BACKOFF_MS must not exceed MAX_BACKOFF_MS (" +
          std::to_string(MAX_BACKOFF_MS.load()) + ")");
    }
    INITIAL_BACKOFF_MS = v;
  }

  static size_t getInitialBackoffMs() { return INITIAL_BACKOFF_MS; }

  static void setMaxBackoffMs(size_t v) {
    if (v > MAX_MAX_BACKOFF_MS) {
      throw std::invalid_argument("MAX_BACKOFF_MS must be between 0 and " +
                                  std::to_string(MAX_MAX_BACKOFF_MS));
    }
    if (v < INITIAL_BACKOFF_MS) {
      throw std::invalid_argument(
          "MAX_BACKOFF_MS must not be below INITIAL_BACKOFF_MS (" +
          std::to_string(INITIAL_BACKOFF_MS.load()) + ")");
    }
    MAX_BACKOFF_MS = v;
  }

  static size_t getMaxBackoffMs() { return MAX_BACKOFF_MS; }

  // Replaces both backoff bounds at once. The pair is checked as it will
  // end up, then stored in the order that keeps initial <= max throughout.
  static void setBackoffMs(size_t initial, size_t max) {
    if (initial > MAX_INITIAL_BACKOFF_MS) {
      throw std::invalid_argument("INITIAL_BACKOFF_MS must be between 0 and " +
                                  std::to_string(MAX_INITIAL_BACKOFF_MS));
    }
    if (max > MAX_MAX_BACKOFF_MS) {
      throw std::invalid_argument("MAX_BACKOFF_MS must be between 0 and " +
                                  std::to_string(MAX_MAX_BACKOFF_MS));
    }
    if (initial > max) {
      throw std::invalid_argument(
          "INITIAL_BACKOFF_MS (" + std::to_string(initial) +
          ") must not exceed MAX_BACKOFF_MS (" + std::to_string(max) + ")");
    }
    if (initial <= MAX_BACKOFF_MS) {
      INITIAL_BACKOFF_MS = initial;
      MAX_BACKOFF_MS = max;
    } else {
      MAX_BACKOFF_MS = max;
      INITIAL_BACKOFF_MS = initial;
    }
  }

  static void setIdlePollIntervalMs(size_t v) {
    if (v > MAX_IDLE_POLL_INTERVAL_MS) {
      throw std::invalid_argument(
          "IDLE_POLL_INTERVAL_MS must be between 0 and " +
          std::to_string(MAX_IDLE_POLL_INTERVAL_MS));
    }
    IDLE_POLL_INTERVAL_MS = v;
  }

  static size_t getIdlePollIntervalMs() { return IDLE_POLL_INTERVAL_MS; }

  static void resetToDefaults() {
    MAX_CONSECUTIVE_ERRORS = DEFAULT_MAX_CONSECUTIVE_ERRORS;
    INITIAL_BACKOFF_MS = DEFAULT_INITIAL_BACKOFF_MS;
    MAX_BACKOFF_MS = DEFAULT_MAX_BACKOFF_MS;
    IDLE_POLL_INTERVAL_MS = DEFAULT_IDLE_POLL_INTERVAL_MS;
  }

  static RetryPolicy currentPolicy() {
    RetryPolicy policy;
    policy.maxConsecutiveErrors = MAX_CONSECUTIVE_ERRORS;
    policy.initialBackoff = std::chrono::milliseconds(INITIAL_BACKOFF_MS);
    policy.maxBackoff = std::chrono::milliseconds(MAX_BACKOFF_MS);
    policy.idlePollInterval = std::chrono::milliseconds(IDLE_POLL_INTERVAL_MS);
    return policy;
  }
};

#endif
