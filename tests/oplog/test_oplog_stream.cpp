#include "core/logger.h"
#include "core/tail_config.h"
#include "oplog/oplog_decoder.h"
#include "oplog/oplog_error.h"
#include "oplog/oplog_stream.h"
#include "test_runner.h"
#include <bson/bson.h>
#include <deque>
#include <vector>

namespace {

struct Step {
  PullStatus status;
  std::string name;
};

// Replays a fixed sequence of pull results. Once the script runs out it
// keeps answering with `tail` (EMPTY by default, like an idle tailable
// cursor).
class ScriptedCursor : public IOplogCursor {
  std::deque<Step> steps_;
  PullStatus tail_;
  size_t *pulls_;

public:
  ScriptedCursor(std::vector<Step> steps, PullStatus tail, size_t *pulls)
      : steps_(steps.begin(), steps.end()), tail_(tail), pulls_(pulls) {}

  PullStatus pull(OplogRecord &out, std::string &errorMessage) override {
    if (pulls_)
      ++*pulls_;

    if (steps_.empty()) {
      if (tail_ == PullStatus::ERROR)
        errorMessage = "connection refused";
      return tail_;
    }

    Step step = steps_.front();
    steps_.pop_front();

    switch (step.status) {
    case PullStatus::DOCUMENT:
      out = OplogRecord::adopt(BCON_NEW(
          "ts", BCON_TIMESTAMP(1479419535, 0), "h", BCON_INT64(1), "op",
          BCON_UTF8("n"), "o", "{", "msg", BCON_UTF8(step.name.c_str()),
          "}"));
      break;
    case PullStatus::ERROR:
      errorMessage = "socket timeout";
      break;
    case PullStatus::EMPTY:
    case PullStatus::EXHAUSTED:
      break;
    }
    return step.status;
  }
};

std::string messageOf(const OplogRecord &record) {
  bson_iter_t iter;
  bson_iter_t msg;
  if (bson_iter_init(&iter, record.get()) &&
      bson_iter_find_descendant(&iter, "o.msg", &msg) &&
      BSON_ITER_HOLDS_UTF8(&msg)) {
    return bson_iter_utf8(&msg, nullptr);
  }
  return "";
}

RetryPolicy immediatePolicy(size_t maxConsecutiveErrors) {
  RetryPolicy policy;
  policy.maxConsecutiveErrors = maxConsecutiveErrors;
  policy.initialBackoff = std::chrono::milliseconds(0);
  policy.maxBackoff = std::chrono::milliseconds(0);
  policy.idlePollInterval = std::chrono::milliseconds(0);
  return policy;
}

} // namespace

int main() {
  TestRunner runner;
  Logger::setLogLevel(LogLevel::CRITICAL);

  runner.runTest("Transient states are never observed", [&]() {
    std::vector<Step> script = {
        {PullStatus::EMPTY, ""},       {PullStatus::EMPTY, ""},
        {PullStatus::ERROR, ""},       {PullStatus::DOCUMENT, "A"},
        {PullStatus::EMPTY, ""},       {PullStatus::DOCUMENT, "B"},
        {PullStatus::EXHAUSTED, ""}};
    size_t pulls = 0;
    OplogStream stream(std::make_unique<ScriptedCursor>(
                           script, PullStatus::EXHAUSTED, &pulls),
                       immediatePolicy(0));

    std::vector<std::string> seen;
    while (auto record = stream.next()) {
      seen.push_back(messageOf(*record));
    }

    runner.assertEquals(size_t(2), seen.size(), "exactly two documents");
    runner.assertEquals(std::string("A"), seen.at(0), "first is A");
    runner.assertEquals(std::string("B"), seen.at(1), "second is B");
    runner.assertEquals(size_t(7), pulls, "every scripted step was pulled");
  });

  runner.runTest("Yielded records decode independently", [&]() {
    OplogStream stream(std::make_unique<ScriptedCursor>(
                           std::vector<Step>{{PullStatus::DOCUMENT, "hello"}},
                           PullStatus::EXHAUSTED, nullptr),
                       immediatePolicy(0));

    auto record = stream.next();
    runner.assertTrue(record.has_value(), "a record should be yielded");
    Operation operation = OplogDecoder::decode(*record);
    runner.assertTrue(operation.getType() == OperationKind::NOOP,
                      "record should decode as a noop");
    runner.assertTrue(operation.getDocument().toJson().find("hello") !=
                          std::string::npos,
                      "payload should be carried through");
  });

  runner.runTest("Exhaustion is sticky", [&]() {
    size_t pulls = 0;
    OplogStream stream(std::make_unique<ScriptedCursor>(
                           std::vector<Step>{{PullStatus::EXHAUSTED, ""}},
                           PullStatus::DOCUMENT, &pulls),
                       immediatePolicy(0));

    runner.assertFalse(stream.isExhausted(), "fresh stream is not exhausted");
    runner.assertFalse(stream.next().has_value(), "first call ends");
    runner.assertTrue(stream.isExhausted(), "stream reports exhaustion");
    runner.assertFalse(stream.next().has_value(), "later calls end too");
    runner.assertEquals(size_t(1), pulls,
                        "cursor is not pulled after exhaustion");
  });

  runner.runTest("Null cursor behaves as exhausted", [&]() {
    OplogStream stream(nullptr, immediatePolicy(0));
    runner.assertTrue(stream.isExhausted(), "no cursor means no records");
    runner.assertFalse(stream.next().has_value(), "next returns nothing");
  });

  runner.runTest("Error budget surfaces DatabaseError", [&]() {
    size_t pulls = 0;
    OplogStream stream(std::make_unique<ScriptedCursor>(
                           std::vector<Step>{}, PullStatus::ERROR, &pulls),
                       immediatePolicy(3));

    bool threw = false;
    try {
      stream.next();
    } catch (const DatabaseError &e) {
      threw = true;
      runner.assertTrue(std::string(e.what()).find("connection refused") !=
                            std::string::npos,
                        "error should carry the cursor message");
      runner.assertTrue(e.kind() == OplogErrorKind::DATABASE,
                        "kind should be DATABASE");
    }
    runner.assertTrue(threw, "next should throw after the budget");
    runner.assertEquals(size_t(4), pulls,
                        "three retries are allowed before giving up");
  });

  runner.runTest("Error budget resets after a document", [&]() {
    std::vector<Step> script = {
        {PullStatus::ERROR, ""},       {PullStatus::ERROR, ""},
        {PullStatus::DOCUMENT, "A"},   {PullStatus::ERROR, ""},
        {PullStatus::ERROR, ""},       {PullStatus::DOCUMENT, "B"}};
    OplogStream stream(std::make_unique<ScriptedCursor>(
                           script, PullStatus::EXHAUSTED, nullptr),
                       immediatePolicy(2));

    auto first = stream.next();
    auto second = stream.next();
    runner.assertTrue(first.has_value() && messageOf(*first) == "A",
                      "A survives two errors");
    runner.assertTrue(second.has_value() && messageOf(*second) == "B",
                      "B survives two more errors");
  });

  runner.runTest("Backoff doubles and idle polls wait", [&]() {
    std::vector<Step> script = {
        {PullStatus::ERROR, ""},       {PullStatus::ERROR, ""},
        {PullStatus::ERROR, ""},       {PullStatus::ERROR, ""},
        {PullStatus::EMPTY, ""},       {PullStatus::DOCUMENT, "A"}};

    RetryPolicy policy;
    policy.maxConsecutiveErrors = 0;
    policy.initialBackoff = std::chrono::milliseconds(100);
    policy.maxBackoff = std::chrono::milliseconds(250);
    policy.idlePollInterval = std::chrono::milliseconds(10);

    OplogStream stream(std::make_unique<ScriptedCursor>(
                           script, PullStatus::EXHAUSTED, nullptr),
                       policy);

    std::vector<long long> delays;
    stream.setSleepFunction([&delays](std::chrono::milliseconds delay) {
      delays.push_back(delay.count());
    });

    auto record = stream.next();
    runner.assertTrue(record.has_value(), "document arrives");
    std::vector<long long> expected = {100, 200, 250, 250, 10};
    runner.assertEquals(expected.size(), delays.size(), "five pauses");
    for (size_t i = 0; i < expected.size() && i < delays.size(); ++i) {
      runner.assertEquals(expected[i], delays[i],
                          "pause " + std::to_string(i));
    }
  });

  runner.runTest("Tool budget ends a permanently failed cursor", [&]() {
    TailConfig::resetToDefaults();
    TailConfig::setMaxConsecutiveErrors(
        TailConfig::TOOL_MAX_CONSECUTIVE_ERRORS);

    size_t pulls = 0;
    OplogStream stream(std::make_unique<ScriptedCursor>(
                           std::vector<Step>{}, PullStatus::ERROR, &pulls),
                       TailConfig::currentPolicy());
    long long waitedMs = 0;
    stream.setSleepFunction([&waitedMs](std::chrono::milliseconds delay) {
      waitedMs += delay.count();
    });

    bool threw = false;
    try {
      stream.next();
    } catch (const DatabaseError &) {
      threw = true;
    }
    runner.assertTrue(threw, "sticky cursor errors must surface");
    runner.assertEquals(TailConfig::TOOL_MAX_CONSECUTIVE_ERRORS + 1, pulls,
                        "every retry in the budget is used");
    runner.assertTrue(waitedMs > 0 && waitedMs <= 5 * 60 * 1000,
                      "backoff stays within five minutes");
    TailConfig::resetToDefaults();
  });

  runner.runTest("Unlimited retries keep going", [&]() {
    std::vector<Step> script(500, Step{PullStatus::ERROR, ""});
    script.push_back(Step{PullStatus::DOCUMENT, "late"});
    OplogStream stream(std::make_unique<ScriptedCursor>(
                           script, PullStatus::EXHAUSTED, nullptr),
                       immediatePolicy(0));

    auto record = stream.next();
    runner.assertTrue(record.has_value() && messageOf(*record) == "late",
                      "document after 500 errors is delivered");
  });

  runner.runTest("RetryPolicy backoff schedule", [&]() {
    RetryPolicy policy;
    policy.initialBackoff = std::chrono::milliseconds(50);
    policy.maxBackoff = std::chrono::milliseconds(1000);
    runner.assertEquals(0LL, (long long)policy.backoffFor(0).count(),
                        "no errors, no delay");
    runner.assertEquals(50LL, (long long)policy.backoffFor(1).count(),
                        "first retry uses the initial delay");
    runner.assertEquals(400LL, (long long)policy.backoffFor(4).count(),
                        "fourth retry doubles three times");
    runner.assertEquals(1000LL, (long long)policy.backoffFor(40).count(),
                        "delay is capped");
  });

  return runner.printSummary();
}
