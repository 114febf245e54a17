#ifndef DATABASE_LOG_WRITER_H
#define DATABASE_LOG_WRITER_H

#include "core/log_writer.h"
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>

// Persists log entries into a PostgreSQL table (metadata.logs by default)
// through a single long-lived connection and a prepared INSERT.
class DatabaseLogWriter : public ILogWriter {
private:
  std::unique_ptr<pqxx::connection> conn_;
  std::string connectionString_;
  std::string tableName_;
  bool statementPrepared_;
  bool enabled_;
  mutable std::mutex mutex_;

public:
  explicit DatabaseLogWriter(const std::string &connectionString,
                             const std::string &tableName = "metadata.logs");
  ~DatabaseLogWriter() override { close(); }

  DatabaseLogWriter(const DatabaseLogWriter &) = delete;
  DatabaseLogWriter &operator=(const DatabaseLogWriter &) = delete;

  bool write(const std::string &formattedMessage) override;
  void flush() override {}
  void close() override;
  bool isOpen() const override;
  bool isEnabled() const;
  void disable();

  bool writeParsed(const std::string &levelStr, const std::string &categoryStr,
                   const std::string &function, const std::string &message);

private:
  void ensureTableUnlocked();
  void prepareStatementUnlocked();
};

#endif
