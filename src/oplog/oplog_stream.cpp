#include "oplog/oplog_stream.h"
#include "core/database_config.h"
#include "core/logger.h"
#include "engines/mongodb_engine.h"
#include "oplog/oplog_error.h"
#include <thread>

OplogStream::OplogStream(std::unique_ptr<IOplogCursor> cursor,
                         RetryPolicy policy)
    : cursor_(std::move(cursor)), policy_(policy),
      sleeper_([](std::chrono::milliseconds delay) {
        std::this_thread::sleep_for(delay);
      }),
      exhausted_(cursor_ == nullptr) {}

OplogStream OplogStream::open(MongoDBEngine &engine, RetryPolicy policy) {
  std::string database = DatabaseConfig::getOplogDatabase();
  std::string collection = DatabaseConfig::getOplogCollection();

  auto cursor = engine.openOplogCursor(database, collection);

  Logger::info(LogCategory::STREAM, "OplogStream",
               "Tailing " + database + "." + collection +
                   " (max consecutive errors: " +
                   (policy.maxConsecutiveErrors == 0
                        ? std::string("unlimited")
                        : std::to_string(policy.maxConsecutiveErrors)) +
                   ")");
  return OplogStream(std::move(cursor), policy);
}

void OplogStream::pause(std::chrono::milliseconds delay) {
  if (delay.count() > 0 && sleeper_) {
    sleeper_(delay);
  }
}

// Pulls until the cursor yields a document. Empty pulls are the normal
// idle state of an await-data cursor and are retried after
// idlePollInterval. Failed pulls are retried with exponential backoff; the
// error budget covers consecutive failures within this call only.
// Exhaustion is sticky: once the cursor reports it, every later call
// returns std::nullopt without touching the cursor.
std::optional<OplogRecord> OplogStream::next() {
  if (exhausted_) {
    return std::nullopt;
  }

  size_t consecutiveErrors = 0;

  while (true) {
    OplogRecord record;
    std::string errorMessage;

    switch (cursor_->pull(record, errorMessage)) {
    case PullStatus::DOCUMENT:
      if (consecutiveErrors > 0) {
        Logger::info(LogCategory::STREAM, "OplogStream::next",
                     "Cursor recovered after " +
                         std::to_string(consecutiveErrors) + " failed pulls");
      }
      return std::optional<OplogRecord>(std::move(record));

    case PullStatus::EMPTY:
      pause(policy_.idlePollInterval);
      break;

    case PullStatus::ERROR:
      ++consecutiveErrors;
      if (policy_.maxConsecutiveErrors > 0 &&
          consecutiveErrors > policy_.maxConsecutiveErrors) {
        Logger::error(LogCategory::STREAM, "OplogStream::next",
                      "Giving up after " + std::to_string(consecutiveErrors) +
                          " consecutive failed pulls: " + errorMessage);
        throw DatabaseError("Oplog cursor failed " +
                            std::to_string(consecutiveErrors) +
                            " consecutive times: " + errorMessage);
      }
      Logger::warning(LogCategory::STREAM, "OplogStream::next",
                      "Pull failed (attempt " +
                          std::to_string(consecutiveErrors) +
                          "), retrying: " + errorMessage);
      pause(policy_.backoffFor(consecutiveErrors));
      break;

    case PullStatus::EXHAUSTED:
      exhausted_ = true;
      Logger::warning(LogCategory::STREAM, "OplogStream::next",
                      "Oplog cursor exhausted, no further records");
      return std::nullopt;
    }
  }
}
