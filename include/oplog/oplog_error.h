#ifndef OPLOG_ERROR_H
#define OPLOG_ERROR_H

#include <stdexcept>
#include <string>

enum class OplogErrorKind { MISSING_FIELD, UNKNOWN_OPERATION, DATABASE };

class OplogError : public std::runtime_error {
  OplogErrorKind kind_;

public:
  OplogError(OplogErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  OplogErrorKind kind() const { return kind_; }
};

// A required field is absent or holds a value of the wrong BSON type.
class MissingFieldError : public OplogError {
  std::string field_;
  std::string reason_;

public:
  MissingFieldError(const std::string &field, const std::string &reason)
      : OplogError(OplogErrorKind::MISSING_FIELD,
                   "Field '" + field + "': " + reason),
        field_(field), reason_(reason) {}

  const std::string &field() const { return field_; }
  const std::string &reason() const { return reason_; }
};

// The op field names an operation the decoder does not handle. Terminal for
// the record; retrying the same record yields the same error.
class UnknownOperationError : public OplogError {
  std::string code_;

public:
  explicit UnknownOperationError(const std::string &code)
      : OplogError(OplogErrorKind::UNKNOWN_OPERATION,
                   "Unknown operation '" + code + "'"),
        code_(code) {}

  const std::string &code() const { return code_; }
};

class DatabaseError : public OplogError {
public:
  explicit DatabaseError(const std::string &message)
      : OplogError(OplogErrorKind::DATABASE, message) {}
};

inline const char *oplogErrorKindName(OplogErrorKind kind) {
  switch (kind) {
  case OplogErrorKind::MISSING_FIELD:
    return "MissingField";
  case OplogErrorKind::UNKNOWN_OPERATION:
    return "UnknownOperation";
  case OplogErrorKind::DATABASE:
    return "Database";
  }
  return "Unknown";
}

#endif
