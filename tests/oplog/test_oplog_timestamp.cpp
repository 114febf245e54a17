#include "oplog/oplog_timestamp.h"
#include "test_runner.h"
#include <cstdint>

int main() {
  TestRunner runner;

  runner.runTest("Whole seconds decode with zero nanoseconds", [&]() {
    OplogTimestamp ts = decodeOplogTimestamp(int64_t(1479419535) << 32);
    runner.assertEquals(int64_t(1479419535), ts.seconds, "seconds");
    runner.assertEquals(uint32_t(0), ts.nanoseconds, "nanoseconds");
  });

  runner.runTest("Ordinal is scaled by one million", [&]() {
    OplogTimestamp ts = decodeOplogTimestamp(packOplogTimestamp(1479561394, 5));
    runner.assertEquals(int64_t(1479561394), ts.seconds, "seconds");
    runner.assertEquals(uint32_t(5000000), ts.nanoseconds,
                        "ordinal 5 becomes 5000000");
  });

  runner.runTest("Scaled ordinal wraps at 32 bits", [&]() {
    OplogTimestamp ts = decodeOplogTimestamp(packOplogTimestamp(100, 4295));
    runner.assertEquals(uint32_t(32704), ts.nanoseconds,
                        "4295000000 truncates to 32704");

    OplogTimestamp maxOrdinal =
        decodeOplogTimestamp(packOplogTimestamp(100, 0xFFFFFFFF));
    runner.assertEquals(uint32_t(4293967296U), maxOrdinal.nanoseconds,
                        "0xFFFFFFFF * 1000000 truncates to 4293967296");
    runner.assertEquals(int64_t(100), maxOrdinal.seconds,
                        "ordinal never leaks into seconds");
  });

  runner.runTest("Negative raw values keep their sign", [&]() {
    OplogTimestamp ts = decodeOplogTimestamp(-(int64_t(1) << 32) + 3);
    runner.assertEquals(int64_t(-1), ts.seconds,
                        "arithmetic shift preserves the sign");
    runner.assertEquals(uint32_t(3000000), ts.nanoseconds,
                        "low word still scales");

    OplogTimestamp packed =
        decodeOplogTimestamp(packOplogTimestamp(0xFFFFFFFF, 0));
    runner.assertEquals(int64_t(-1), packed.seconds,
                        "t = 0xFFFFFFFF reads back as -1");
    runner.assertEquals(std::string("1969-12-31T23:59:59.000000000Z"),
                        packed.toIsoString(), "pre-epoch rendering");
  });

  runner.runTest("ISO rendering carries overflowing nanoseconds", [&]() {
    OplogTimestamp ts{1479419535, 1500000000U};
    runner.assertEquals(std::string("2016-11-17T21:52:16.500000000Z"),
                        ts.toIsoString(),
                        "1.5 seconds of nanoseconds roll into the seconds");
  });

  runner.runTest("Time point conversion", [&]() {
    OplogTimestamp ts{1479561394, 250000000U};
    auto sinceEpoch = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.toTimePoint().time_since_epoch());
    runner.assertEquals(static_cast<long long>(1479561394250LL),
                        static_cast<long long>(sinceEpoch.count()),
                        "milliseconds since epoch");
  });

  return runner.printSummary();
}
