#include "oplog/oplog_decoder.h"
#include <string_view>

namespace {

const char *bsonTypeName(bson_type_t type) {
  switch (type) {
  case BSON_TYPE_DOUBLE:
    return "double";
  case BSON_TYPE_UTF8:
    return "string";
  case BSON_TYPE_DOCUMENT:
    return "document";
  case BSON_TYPE_ARRAY:
    return "array";
  case BSON_TYPE_BINARY:
    return "binary";
  case BSON_TYPE_UNDEFINED:
    return "undefined";
  case BSON_TYPE_OID:
    return "objectId";
  case BSON_TYPE_BOOL:
    return "bool";
  case BSON_TYPE_DATE_TIME:
    return "date";
  case BSON_TYPE_NULL:
    return "null";
  case BSON_TYPE_REGEX:
    return "regex";
  case BSON_TYPE_CODE:
    return "javascript";
  case BSON_TYPE_SYMBOL:
    return "symbol";
  case BSON_TYPE_CODEWSCOPE:
    return "javascriptWithScope";
  case BSON_TYPE_INT32:
    return "int32";
  case BSON_TYPE_TIMESTAMP:
    return "timestamp";
  case BSON_TYPE_INT64:
    return "int64";
  case BSON_TYPE_DECIMAL128:
    return "decimal128";
  case BSON_TYPE_MAXKEY:
    return "maxKey";
  case BSON_TYPE_MINKEY:
    return "minKey";
  default:
    return "unknown";
  }
}

// Positions iter on field `key` and checks its type, throwing
// MissingFieldError when the field is absent or holds another type.
void findField(const bson_t *doc, const char *key, bson_type_t expected,
               bson_iter_t *iter) {
  if (!bson_iter_init_find(iter, doc, key)) {
    throw MissingFieldError(key, "missing");
  }
  bson_type_t actual = bson_iter_type(iter);
  if (actual != expected) {
    throw MissingFieldError(key, std::string("expected ") +
                                     bsonTypeName(expected) + ", found " +
                                     bsonTypeName(actual));
  }
}

std::string_view getStr(const bson_t *doc, const char *key) {
  bson_iter_t iter;
  findField(doc, key, BSON_TYPE_UTF8, &iter);
  uint32_t length = 0;
  const char *value = bson_iter_utf8(&iter, &length);
  return std::string_view(value, length);
}

int64_t getInt64(const bson_t *doc, const char *key) {
  bson_iter_t iter;
  findField(doc, key, BSON_TYPE_INT64, &iter);
  return bson_iter_int64(&iter);
}

int64_t getTimestamp(const bson_t *doc, const char *key) {
  bson_iter_t iter;
  findField(doc, key, BSON_TYPE_TIMESTAMP, &iter);
  uint32_t t = 0;
  uint32_t i = 0;
  bson_iter_timestamp(&iter, &t, &i);
  return packOplogTimestamp(t, i);
}

DocumentRef getDocument(const bson_t *doc, const char *key) {
  bson_iter_t iter;
  findField(doc, key, BSON_TYPE_DOCUMENT, &iter);
  uint32_t length = 0;
  const uint8_t *data = nullptr;
  bson_iter_document(&iter, &length, &data);
  return DocumentRef(data, length);
}

} // namespace

// Dispatches on the "op" code. Only no-ops ("n") and inserts ("i") are
// decoded; every other code, including the update, delete, command and
// database codes ("u", "d", "c", "db"), is rejected with
// UnknownOperationError.
Operation OplogDecoder::decode(const OplogRecord &record) {
  const bson_t *doc = record.get();
  if (!doc) {
    throw MissingFieldError("op", "missing");
  }

  std::string_view op = getStr(doc, "op");

  if (op == "n") {
    return decodeNoop(doc);
  }
  if (op == "i") {
    return decodeInsert(doc);
  }
  throw UnknownOperationError(std::string(op));
}

OplogDecoder::DecodeResult OplogDecoder::tryDecode(const OplogRecord &record) {
  DecodeResult result;
  try {
    result.operation.emplace(decode(record));
  } catch (const OplogError &e) {
    result.errorKind = e.kind();
    result.errorMessage = e.what();
  }
  return result;
}

Operation OplogDecoder::decodeNoop(const bson_t *doc) {
  return withKind(doc, Kind::noop());
}

Operation OplogDecoder::decodeInsert(const bson_t *doc) {
  return withKind(doc, Kind::insert(getStr(doc, "ns")));
}

// Fields shared by every decoded kind: h (id), ts (timestamp) and o
// (payload). The payload is referenced in place, not copied.
Operation OplogDecoder::withKind(const bson_t *doc, Kind kind) {
  int64_t id = getInt64(doc, "h");
  OplogTimestamp timestamp = decodeOplogTimestamp(getTimestamp(doc, "ts"));
  DocumentRef document = getDocument(doc, "o");

  return Operation(id, timestamp, document, kind);
}
