#include "engines/mongodb_engine.h"
#include "oplog/mongo_oplog_cursor.h"
#include "oplog/oplog_error.h"
#include <algorithm>
#include <mutex>

namespace {
constexpr int DEFAULT_MONGODB_PORT = 27017;
}

MongoDBEngine::MongoDBEngine(std::string connectionString)
    : connectionString_(std::move(connectionString)), client_(nullptr),
      port_(DEFAULT_MONGODB_PORT), valid_(false) {
  if (parseConnectionString(connectionString_, host_, port_, databaseName_)) {
    valid_ = connect();
  } else {
    Logger::error(LogCategory::DATABASE, "MongoDBEngine",
                  "Failed to parse connection string");
  }
}

MongoDBEngine::~MongoDBEngine() { disconnect(); }

// Extracts host, port and the optional database path from a mongodb:// or
// mongodb+srv:// URI. For multi-host seed lists only the first host is
// reported; libmongoc still receives the full URI. Authentication
// credentials are skipped.
bool MongoDBEngine::parseConnectionString(const std::string &connectionString,
                                          std::string &host, int &port,
                                          std::string &databaseName) {
  const std::string plain = "mongodb://";
  const std::string srv = "mongodb+srv://";

  size_t hostStart;
  if (connectionString.compare(0, plain.size(), plain) == 0) {
    hostStart = plain.size();
  } else if (connectionString.compare(0, srv.size(), srv) == 0) {
    hostStart = srv.size();
  } else {
    Logger::error(LogCategory::DATABASE, "MongoDBEngine",
                  "Invalid MongoDB connection string format");
    return false;
  }

  size_t slashPos = connectionString.find('/', hostStart);
  size_t queryPos = connectionString.find('?', hostStart);
  size_t authorityEnd = std::min(slashPos, queryPos);
  if (authorityEnd == std::string::npos) {
    authorityEnd = connectionString.size();
  }

  std::string authority =
      connectionString.substr(hostStart, authorityEnd - hostStart);
  size_t atPos = authority.rfind('@');
  if (atPos != std::string::npos) {
    authority = authority.substr(atPos + 1);
  }

  std::string firstHost = authority.substr(0, authority.find(','));
  if (firstHost.empty()) {
    Logger::error(LogCategory::DATABASE, "MongoDBEngine",
                  "Host not found in connection string");
    return false;
  }

  port = DEFAULT_MONGODB_PORT;
  size_t colonPos = std::string::npos;
  if (firstHost[0] == '[') {
    size_t bracket = firstHost.find("]:");
    if (bracket != std::string::npos)
      colonPos = bracket + 1;
  } else {
    colonPos = firstHost.rfind(':');
  }

  if (colonPos != std::string::npos) {
    host = firstHost.substr(0, colonPos);
    std::string portStr = firstHost.substr(colonPos + 1);
    try {
      if (!portStr.empty() && portStr.length() <= 5) {
        int parsed = std::stoi(portStr);
        if (parsed > 0 && parsed <= 65535) {
          port = parsed;
        }
      }
    } catch (const std::exception &e) {
      Logger::warning(LogCategory::DATABASE, "MongoDBEngine",
                      "Failed to parse port '" + portStr +
                          "', using default: " + std::string(e.what()));
    }
  } else {
    host = firstHost;
  }

  databaseName.clear();
  if (slashPos != std::string::npos && slashPos < queryPos) {
    size_t dbEnd =
        queryPos == std::string::npos ? connectionString.size() : queryPos;
    databaseName = connectionString.substr(slashPos + 1, dbEnd - slashPos - 1);
  }

  return true;
}

// Creates the client and verifies the deployment is reachable with a ping
// against the admin database.
bool MongoDBEngine::connect() {
  static std::once_flag initFlag;
  std::call_once(initFlag, []() { mongoc_init(); });

  bson_error_t error;
  client_ = mongoc_client_new(connectionString_.c_str());

  if (!client_) {
    Logger::error(LogCategory::DATABASE, "MongoDBEngine",
                  "Failed to create MongoDB client");
    return false;
  }

  mongoc_client_set_appname(client_, "oplog-stream");

  bson_t *ping = BCON_NEW("ping", BCON_INT32(1));
  bool ret = mongoc_client_command_simple(client_, "admin", ping, nullptr,
                                          nullptr, &error);
  bson_destroy(ping);

  if (!ret) {
    Logger::error(LogCategory::DATABASE, "MongoDBEngine",
                  "Failed to ping MongoDB: " + std::string(error.message));
    mongoc_client_destroy(client_);
    client_ = nullptr;
    return false;
  }

  Logger::info(LogCategory::DATABASE, "MongoDBEngine",
               "Connected to MongoDB: " + host_ + ":" + std::to_string(port_));
  return true;
}

void MongoDBEngine::disconnect() {
  if (client_) {
    mongoc_client_destroy(client_);
    client_ = nullptr;
  }
}

std::unique_ptr<IOplogCursor>
MongoDBEngine::openOplogCursor(const std::string &database,
                               const std::string &collection) {
  if (!isValid()) {
    throw DatabaseError("Cannot open oplog cursor: not connected to MongoDB");
  }

  struct ResourceGuard {
    mongoc_database_t *db_;
    mongoc_collection_t *coll_;
    bson_t *filter_;
    bson_t *opts_;
    ResourceGuard() : db_(nullptr), coll_(nullptr), filter_(nullptr),
                      opts_(nullptr) {}
    ~ResourceGuard() {
      if (opts_)
        bson_destroy(opts_);
      if (filter_)
        bson_destroy(filter_);
      if (coll_)
        mongoc_collection_destroy(coll_);
      if (db_)
        mongoc_database_destroy(db_);
    }
  };

  ResourceGuard guard;
  bson_error_t error{};

  guard.db_ = mongoc_client_get_database(client_, database.c_str());
  bool exists = mongoc_database_has_collection(guard.db_, collection.c_str(),
                                               &error);
  if (!exists) {
    std::string reason = error.code != 0
                             ? std::string(error.message)
                             : "collection not found; tailing the oplog "
                               "requires a replica set member";
    throw DatabaseError("Cannot open " + database + "." + collection + ": " +
                        reason);
  }

  guard.coll_ = mongoc_client_get_collection(client_, database.c_str(),
                                             collection.c_str());
  guard.filter_ = bson_new();
  guard.opts_ = BCON_NEW("tailable", BCON_BOOL(true), "awaitData",
                         BCON_BOOL(true), "noCursorTimeout", BCON_BOOL(true));

  mongoc_cursor_t *cursor = mongoc_collection_find_with_opts(
      guard.coll_, guard.filter_, guard.opts_, nullptr);
  if (!cursor) {
    throw DatabaseError("Failed to create cursor over " + database + "." +
                        collection);
  }

  if (mongoc_cursor_error(cursor, &error)) {
    mongoc_cursor_destroy(cursor);
    throw DatabaseError("Failed to open tailable cursor over " + database +
                        "." + collection + ": " + std::string(error.message));
  }

  Logger::debug(LogCategory::DATABASE, "MongoDBEngine",
                "Opened tailable cursor over " + database + "." + collection);

  mongoc_collection_t *coll = guard.coll_;
  guard.coll_ = nullptr;
  return std::make_unique<MongoOplogCursor>(coll, cursor);
}
