#include "oplog/oplog_timestamp.h"
#include <ctime>
#include <iomanip>
#include <sstream>

OplogTimestamp decodeOplogTimestamp(int64_t raw) {
  OplogTimestamp ts;
  ts.seconds = raw >> 32;
  ts.nanoseconds = static_cast<uint32_t>((raw & 0xFFFFFFFF) * 1000000);
  return ts;
}

std::chrono::system_clock::time_point OplogTimestamp::toTimePoint() const {
  auto sinceEpoch = std::chrono::seconds(seconds) +
                    std::chrono::nanoseconds(nanoseconds);
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          sinceEpoch));
}

std::string OplogTimestamp::toIsoString() const {
  // nanoseconds can exceed one second after the ordinal scaling.
  std::time_t wholeSeconds =
      static_cast<std::time_t>(seconds + nanoseconds / 1000000000);
  uint32_t fraction = nanoseconds % 1000000000;

  struct tm tm_buf;
  gmtime_r(&wholeSeconds, &tm_buf);

  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << "."
      << std::setfill('0') << std::setw(9) << fraction << "Z";
  return oss.str();
}
