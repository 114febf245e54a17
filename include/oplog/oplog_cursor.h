#ifndef OPLOG_CURSOR_H
#define OPLOG_CURSOR_H

#include "oplog/oplog_record.h"
#include <string>

enum class PullStatus {
  DOCUMENT = 0,  // out holds a new record
  EMPTY = 1,     // no record available yet; the cursor is still alive
  ERROR = 2,     // the fetch failed; errorMessage describes why
  EXHAUSTED = 3  // the cursor is closed and will never yield again
};

// Source of raw change-log documents consumed by OplogStream.
class IOplogCursor {
public:
  virtual ~IOplogCursor() = default;

  virtual PullStatus pull(OplogRecord &out, std::string &errorMessage) = 0;
};

#endif
