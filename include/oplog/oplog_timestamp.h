#ifndef OPLOG_TIMESTAMP_H
#define OPLOG_TIMESTAMP_H

#include <chrono>
#include <cstdint>
#include <string>

// Calendar time decoded from an oplog "ts" field.
struct OplogTimestamp {
  int64_t seconds{0};
  uint32_t nanoseconds{0};

  std::chrono::system_clock::time_point toTimePoint() const;

  // UTC, e.g. 2016-11-17T21:52:15.000000000Z
  std::string toIsoString() const;

  bool operator==(const OplogTimestamp &other) const {
    return seconds == other.seconds && nanoseconds == other.nanoseconds;
  }
  bool operator!=(const OplogTimestamp &other) const {
    return !(*this == other);
  }
};

// Packs a BSON timestamp (t = epoch seconds, i = ordinal within the second)
// into the signed 64-bit form used by decodeOplogTimestamp().
inline int64_t packOplogTimestamp(uint32_t t, uint32_t i) {
  return static_cast<int64_t>((static_cast<uint64_t>(t) << 32) | i);
}

// seconds = raw >> 32 (sign preserving)
// nanoseconds = (raw & 0xFFFFFFFF) * 1000000, truncated to 32 bits
//
// The low word is an ordinal counter, not a sub-second value. Existing
// consumers depend on it being scaled as milliseconds, so the arithmetic is
// kept exactly as is, wrap-around included.
OplogTimestamp decodeOplogTimestamp(int64_t raw);

#endif
