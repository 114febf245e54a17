#ifndef MONGODB_ENGINE_H
#define MONGODB_ENGINE_H

#include "core/logger.h"
#include "oplog/oplog_cursor.h"
#include <bson/bson.h>
#include <memory>
#include <mongoc/mongoc.h>
#include <string>

// Connection to a MongoDB deployment. Cursors returned by
// openOplogCursor() borrow the client and must be destroyed first.
class MongoDBEngine {
  std::string connectionString_;
  mongoc_client_t *client_;
  std::string databaseName_;
  std::string host_;
  int port_;
  bool valid_;

public:
  explicit MongoDBEngine(std::string connectionString);
  ~MongoDBEngine();

  MongoDBEngine(const MongoDBEngine &) = delete;
  MongoDBEngine &operator=(const MongoDBEngine &) = delete;

  // Opens find({}) over database.collection with tailable, awaitData and
  // noCursorTimeout set. Throws DatabaseError when the engine is not
  // connected or the collection does not exist (the server is not a
  // replica set member).
  std::unique_ptr<IOplogCursor> openOplogCursor(const std::string &database,
                                                const std::string &collection);

  bool isValid() const { return valid_ && client_ != nullptr; }
  mongoc_client_t *getClient() const { return client_; }
  std::string getDatabaseName() const { return databaseName_; }
  std::string getHost() const { return host_; }
  int getPort() const { return port_; }

  static bool parseConnectionString(const std::string &connectionString,
                                    std::string &host, int &port,
                                    std::string &databaseName);

private:
  bool connect();
  void disconnect();
};

#endif
