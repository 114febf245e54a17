#ifndef OPLOG_STREAM_H
#define OPLOG_STREAM_H

#include "core/tail_config.h"
#include "oplog/oplog_cursor.h"
#include "oplog/oplog_record.h"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

class MongoDBEngine;

// Blocking, pull-based view of the change-log. next() hides empty pulls
// and transient fetch errors from the caller and only returns once a
// document is available. Not thread-safe; the stream is the sole owner of
// its cursor.
class OplogStream {
public:
  using SleepFunction = std::function<void(std::chrono::milliseconds)>;

  explicit OplogStream(std::unique_ptr<IOplogCursor> cursor,
                       RetryPolicy policy = TailConfig::currentPolicy());

  OplogStream(OplogStream &&) = default;
  OplogStream &operator=(OplogStream &&) = default;

  // Opens a tailable, await-data, no-timeout cursor over the configured
  // oplog collection (local.oplog.rs by default). Throws DatabaseError when
  // the cursor cannot be opened.
  static OplogStream open(MongoDBEngine &engine,
                          RetryPolicy policy = TailConfig::currentPolicy());

  // Returns the next document, std::nullopt once the cursor is exhausted.
  // Throws DatabaseError when more than policy.maxConsecutiveErrors pulls
  // fail in a row (never, when the limit is 0).
  std::optional<OplogRecord> next();

  bool isExhausted() const { return exhausted_; }
  const RetryPolicy &getPolicy() const { return policy_; }

  void setSleepFunction(SleepFunction sleeper) { sleeper_ = std::move(sleeper); }

private:
  std::unique_ptr<IOplogCursor> cursor_;
  RetryPolicy policy_;
  SleepFunction sleeper_;
  bool exhausted_;

  void pause(std::chrono::milliseconds delay);
};

#endif
