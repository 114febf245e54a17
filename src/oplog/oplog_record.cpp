#include "oplog/oplog_record.h"
#include <stdexcept>

OplogRecord::OplogRecord(const bson_t *doc)
    : doc_(doc ? bson_copy(doc) : nullptr) {}

OplogRecord::~OplogRecord() {
  if (doc_)
    bson_destroy(doc_);
}

OplogRecord::OplogRecord(OplogRecord &&other) noexcept : doc_(other.doc_) {
  other.doc_ = nullptr;
}

OplogRecord &OplogRecord::operator=(OplogRecord &&other) noexcept {
  if (this != &other) {
    if (doc_)
      bson_destroy(doc_);
    doc_ = other.doc_;
    other.doc_ = nullptr;
  }
  return *this;
}

OplogRecord OplogRecord::adopt(bson_t *doc) {
  OplogRecord record;
  record.doc_ = doc;
  return record;
}

OplogRecord OplogRecord::fromJson(const std::string &json) {
  bson_error_t error;
  bson_t *doc = bson_new_from_json(
      reinterpret_cast<const uint8_t *>(json.data()),
      static_cast<ssize_t>(json.size()), &error);
  if (!doc) {
    throw std::invalid_argument("Invalid oplog JSON: " +
                                std::string(error.message));
  }
  return adopt(doc);
}

std::string OplogRecord::toJson() const {
  if (!doc_)
    return "{}";

  char *json = bson_as_canonical_extended_json(doc_, nullptr);
  if (!json)
    return "{}";
  std::string result(json);
  bson_free(json);
  return result;
}
