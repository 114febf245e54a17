#include "oplog/operation.h"
#include "oplog/oplog_decoder.h"
#include <cstring>
#include <sstream>

const char *operationKindName(OperationKind kind) {
  switch (kind) {
  case OperationKind::INSERT:
    return "insert";
  case OperationKind::UPDATE:
    return "update";
  case OperationKind::DELETE:
    return "delete";
  case OperationKind::COMMAND:
    return "command";
  case OperationKind::DATABASE:
    return "database";
  case OperationKind::NOOP:
    return "noop";
  }
  return "unknown";
}

bool DocumentRef::view(bson_t *out) const {
  if (!data_)
    return false;
  return bson_init_static(out, data_, length_);
}

std::string DocumentRef::toJson() const {
  bson_t doc;
  if (!view(&doc))
    return "{}";

  char *json = bson_as_relaxed_extended_json(&doc, nullptr);
  if (!json)
    return "{}";
  std::string result(json);
  bson_free(json);
  return result;
}

bool DocumentRef::operator==(const DocumentRef &other) const {
  if (length_ != other.length_)
    return false;
  if (data_ == other.data_)
    return true;
  if (!data_ || !other.data_)
    return false;
  return std::memcmp(data_, other.data_, length_) == 0;
}

Operation Operation::fromRecord(const OplogRecord &record) {
  return OplogDecoder::decode(record);
}

std::string Operation::describe() const {
  std::ostringstream oss;
  oss << operationKindName(kind_.type) << " id=" << id_
      << " ts=" << timestamp_.toIsoString();
  if (kind_.type == OperationKind::INSERT) {
    oss << " ns=" << kind_.ns;
  }
  oss << " o=" << document_.toJson();
  return oss.str();
}
