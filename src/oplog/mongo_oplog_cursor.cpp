#include "oplog/mongo_oplog_cursor.h"

MongoOplogCursor::~MongoOplogCursor() {
  if (cursor_)
    mongoc_cursor_destroy(cursor_);
  if (collection_)
    mongoc_collection_destroy(collection_);
}

// mongoc_cursor_next() returns false both when an await-data getMore times
// out empty and when the cursor fails or dies, so the three cases are told
// apart through mongoc_cursor_error() and mongoc_cursor_more(). The
// document returned by the driver is only valid until the next call, hence
// the copy into an OplogRecord.
PullStatus MongoOplogCursor::pull(OplogRecord &out, std::string &errorMessage) {
  if (!cursor_)
    return PullStatus::EXHAUSTED;

  const bson_t *doc = nullptr;
  if (mongoc_cursor_next(cursor_, &doc)) {
    out = OplogRecord(doc);
    return PullStatus::DOCUMENT;
  }

  bson_error_t error;
  if (mongoc_cursor_error(cursor_, &error)) {
    errorMessage = error.message;
    return PullStatus::ERROR;
  }

  if (!mongoc_cursor_more(cursor_))
    return PullStatus::EXHAUSTED;

  return PullStatus::EMPTY;
}
