#ifndef OPERATION_H
#define OPERATION_H

#include "oplog/oplog_record.h"
#include "oplog/oplog_timestamp.h"
#include <bson/bson.h>
#include <cstdint>
#include <string>
#include <string_view>

// Categories of change-log entries. The decoder only produces INSERT and
// NOOP; UPDATE, DELETE, COMMAND and DATABASE are recognized categories
// whose records are currently rejected as unknown operations.
enum class OperationKind { INSERT, UPDATE, DELETE, COMMAND, DATABASE, NOOP };

const char *operationKindName(OperationKind kind);

// Operation category plus its kind-specific data. Only INSERT carries a
// namespace; it points into the record the operation was decoded from.
struct Kind {
  OperationKind type{OperationKind::NOOP};
  std::string_view ns;

  static Kind insert(std::string_view ns) {
    return Kind{OperationKind::INSERT, ns};
  }
  static Kind update() { return Kind{OperationKind::UPDATE, {}}; }
  static Kind remove() { return Kind{OperationKind::DELETE, {}}; }
  static Kind command() { return Kind{OperationKind::COMMAND, {}}; }
  static Kind database() { return Kind{OperationKind::DATABASE, {}}; }
  static Kind noop() { return Kind{OperationKind::NOOP, {}}; }

  bool operator==(const Kind &other) const {
    return type == other.type && ns == other.ns;
  }
  bool operator!=(const Kind &other) const { return !(*this == other); }
};

// Non-owning view of an embedded BSON document.
class DocumentRef {
  const uint8_t *data_;
  uint32_t length_;

public:
  DocumentRef() : data_(nullptr), length_(0) {}
  DocumentRef(const uint8_t *data, uint32_t length)
      : data_(data), length_(length) {}

  // Views any bson_t without copying; the document must outlive the ref.
  static DocumentRef of(const bson_t *doc) {
    return DocumentRef(bson_get_data(doc), doc->len);
  }

  const uint8_t *data() const { return data_; }
  uint32_t length() const { return length_; }
  bool empty() const { return data_ == nullptr; }

  // Initializes *out as a read-only bson_t over the viewed bytes.
  bool view(bson_t *out) const;

  std::string toJson() const;

  // Structural equality: identical BSON encodings. Doubles compare by bit
  // pattern, so 0.0 and -0.0 differ and a NaN equals the same NaN payload.
  bool operator==(const DocumentRef &other) const;
  bool operator!=(const DocumentRef &other) const { return !(*this == other); }
};

// A decoded change-log entry. Borrows the payload document and the insert
// namespace from the OplogRecord it was decoded from, which must outlive
// it.
class Operation {
  int64_t id_;
  OplogTimestamp timestamp_;
  DocumentRef document_;
  Kind kind_;

public:
  Operation(int64_t id, OplogTimestamp timestamp, DocumentRef document,
            Kind kind)
      : id_(id), timestamp_(timestamp), document_(document), kind_(kind) {}

  // Throws MissingFieldError or UnknownOperationError.
  static Operation fromRecord(const OplogRecord &record);
  static Operation fromRecord(const OplogRecord &&record) = delete;

  int64_t getId() const { return id_; }
  const OplogTimestamp &getTimestamp() const { return timestamp_; }
  const DocumentRef &getDocument() const { return document_; }
  const Kind &getKind() const { return kind_; }
  OperationKind getType() const { return kind_.type; }
  std::string_view getNamespace() const { return kind_.ns; }

  std::string describe() const;

  bool operator==(const Operation &other) const {
    return id_ == other.id_ && timestamp_ == other.timestamp_ &&
           document_ == other.document_ && kind_ == other.kind_;
  }
  bool operator!=(const Operation &other) const { return !(*this == other); }
};

#endif
