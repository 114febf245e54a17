#ifndef OPLOG_DECODER_H
#define OPLOG_DECODER_H

#include "oplog/operation.h"
#include "oplog/oplog_error.h"
#include "oplog/oplog_record.h"
#include <optional>
#include <string>

// Converts raw change-log documents into Operations. Stateless and
// reentrant; safe to call from any thread.
class OplogDecoder {
public:
  struct DecodeResult {
    std::optional<Operation> operation;
    OplogErrorKind errorKind{OplogErrorKind::MISSING_FIELD};
    std::string errorMessage;

    bool ok() const { return operation.has_value(); }
  };

  // Throws MissingFieldError or UnknownOperationError.
  static Operation decode(const OplogRecord &record);
  static Operation decode(const OplogRecord &&record) = delete;

  // Same as decode() but reports failures in the result instead of
  // throwing.
  static DecodeResult tryDecode(const OplogRecord &record);
  static DecodeResult tryDecode(const OplogRecord &&record) = delete;

private:
  static Operation decodeNoop(const bson_t *doc);
  static Operation decodeInsert(const bson_t *doc);
  static Operation withKind(const bson_t *doc, Kind kind);
};

#endif
