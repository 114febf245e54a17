#ifndef OPLOG_RECORD_H
#define OPLOG_RECORD_H

#include <bson/bson.h>
#include <string>

// One raw change-log document. Owns a heap bson_t whose buffer never moves
// for the lifetime of the record, so Operations decoded from it stay valid
// when the record object itself is moved.
class OplogRecord {
  bson_t *doc_;

public:
  OplogRecord() : doc_(nullptr) {}
  explicit OplogRecord(const bson_t *doc);
  ~OplogRecord();

  OplogRecord(const OplogRecord &) = delete;
  OplogRecord &operator=(const OplogRecord &) = delete;
  OplogRecord(OplogRecord &&other) noexcept;
  OplogRecord &operator=(OplogRecord &&other) noexcept;

  // Takes ownership of a document allocated with bson_new() or bson_copy().
  static OplogRecord adopt(bson_t *doc);

  // Parses MongoDB extended JSON. Throws std::invalid_argument on malformed
  // input.
  static OplogRecord fromJson(const std::string &json);

  const bson_t *get() const { return doc_; }
  bool empty() const { return doc_ == nullptr; }

  std::string toJson() const;
};

#endif
