#ifndef MONGO_OPLOG_CURSOR_H
#define MONGO_OPLOG_CURSOR_H

#include "oplog/oplog_cursor.h"
#include <mongoc/mongoc.h>

// IOplogCursor over a libmongoc tailable cursor. Owns both the cursor and
// the collection handle it was opened from; the mongoc_client_t behind
// them must outlive this object.
class MongoOplogCursor : public IOplogCursor {
  mongoc_collection_t *collection_;
  mongoc_cursor_t *cursor_;

public:
  MongoOplogCursor(mongoc_collection_t *collection, mongoc_cursor_t *cursor)
      : collection_(collection), cursor_(cursor) {}
  ~MongoOplogCursor() override;

  MongoOplogCursor(const MongoOplogCursor &) = delete;
  MongoOplogCursor &operator=(const MongoOplogCursor &) = delete;

  PullStatus pull(OplogRecord &out, std::string &errorMessage) override;
};

#endif
