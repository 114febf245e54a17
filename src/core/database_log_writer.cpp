#include "core/database_log_writer.h"
#include <iostream>

namespace {
constexpr const char *LOG_INSERT_STATEMENT = "oplog_log_insert";

// Drops bytes that do not form a well-formed UTF-8 sequence. Oplog payloads
// rendered into log messages may carry arbitrary binary data and PostgreSQL
// rejects the whole INSERT on a single invalid byte.
std::string sanitizeUTF8(const std::string &input) {
  std::string result;
  result.reserve(input.size());

  size_t i = 0;
  while (i < input.size()) {
    unsigned char c = static_cast<unsigned char>(input[i]);

    size_t length = 0;
    if (c < 0x80) {
      if (c >= 0x20 || c == '\n' || c == '\r' || c == '\t')
        result += static_cast<char>(c);
      ++i;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      length = 2;
    } else if ((c & 0xF0) == 0xE0) {
      length = 3;
    } else if ((c & 0xF8) == 0xF0) {
      length = 4;
    } else {
      ++i;
      continue;
    }

    bool valid = i + length <= input.size();
    for (size_t k = 1; valid && k < length; ++k) {
      valid = (static_cast<unsigned char>(input[i + k]) & 0xC0) == 0x80;
    }

    if (valid) {
      result.append(input, i, length);
      i += length;
    } else {
      ++i;
    }
  }

  return result;
}
} // namespace

// Connects to PostgreSQL, creates the log table when missing and prepares
// the INSERT statement. Any failure leaves the writer disabled; the Logger
// then falls back to its other sinks.
DatabaseLogWriter::DatabaseLogWriter(const std::string &connectionString,
                                     const std::string &tableName)
    : connectionString_(connectionString), tableName_(tableName),
      statementPrepared_(false), enabled_(true) {
  std::lock_guard<std::mutex> lock(mutex_);
  try {
    conn_ = std::make_unique<pqxx::connection>(connectionString_);
    ensureTableUnlocked();
    prepareStatementUnlocked();
  } catch (const std::exception &e) {
    enabled_ = false;
    conn_.reset();
    std::cerr << "DatabaseLogWriter: Failed to establish connection: "
              << e.what() << std::endl;
  }
}

void DatabaseLogWriter::ensureTableUnlocked() {
  pqxx::work txn(*conn_);
  auto dot = tableName_.find('.');
  if (dot != std::string::npos) {
    txn.exec("CREATE SCHEMA IF NOT EXISTS " +
             txn.quote_name(tableName_.substr(0, dot)));
  }
  txn.exec("CREATE TABLE IF NOT EXISTS " + tableName_ +
           " (id BIGSERIAL PRIMARY KEY, ts TIMESTAMP NOT NULL DEFAULT NOW(), "
           "level VARCHAR(50) NOT NULL, category VARCHAR(50) NOT NULL, "
           "function VARCHAR(255), message TEXT NOT NULL)");
  txn.commit();
}

void DatabaseLogWriter::prepareStatementUnlocked() {
  if (!conn_ || !conn_->is_open() || statementPrepared_)
    return;

  try {
    conn_->prepare(LOG_INSERT_STATEMENT,
                   "INSERT INTO " + tableName_ +
                       " (ts, level, category, function, message) "
                       "VALUES (NOW(), $1, $2, $3, $4)");
    statementPrepared_ = true;
  } catch (const std::exception &e) {
    enabled_ = false;
    std::cerr << "DatabaseLogWriter: Failed to prepare statement: " << e.what()
              << std::endl;
  }
}

// Unstructured lines are stored with level RAW so they stay queryable next
// to the entries written through writeParsed().
bool DatabaseLogWriter::write(const std::string &formattedMessage) {
  return writeParsed("RAW", "SYSTEM", "", formattedMessage);
}

bool DatabaseLogWriter::writeParsed(const std::string &levelStr,
                                    const std::string &categoryStr,
                                    const std::string &function,
                                    const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!enabled_ || !conn_ || !conn_->is_open()) {
    enabled_ = false;
    return false;
  }

  if (levelStr.length() > 50 || categoryStr.length() > 50 ||
      function.length() > 255)
    return false;

  try {
    if (!statementPrepared_) {
      prepareStatementUnlocked();
      if (!statementPrepared_)
        return false;
    }

    std::string body = message.length() > 10000 ? message.substr(0, 10000)
                                                 : message;

    pqxx::work txn(*conn_);
    txn.exec_prepared(LOG_INSERT_STATEMENT, sanitizeUTF8(levelStr),
                      sanitizeUTF8(categoryStr), sanitizeUTF8(function),
                      sanitizeUTF8(body));
    txn.commit();
    return true;
  } catch (const pqxx::broken_connection &e) {
    enabled_ = false;
    conn_.reset();
    std::cerr << "DatabaseLogWriter: Connection broken: " << e.what()
              << std::endl;
    return false;
  } catch (const pqxx::sql_error &e) {
    std::cerr << "DatabaseLogWriter: SQL error writing log entry: " << e.what()
              << std::endl;
    return false;
  } catch (const std::exception &e) {
    std::cerr << "DatabaseLogWriter: Failed to write log entry: " << e.what()
              << std::endl;
    return false;
  }
}

void DatabaseLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  conn_.reset();
  enabled_ = false;
}

bool DatabaseLogWriter::isEnabled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return enabled_;
}

void DatabaseLogWriter::disable() {
  std::lock_guard<std::mutex> lock(mutex_);
  enabled_ = false;
}

bool DatabaseLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return conn_ && conn_->is_open() && enabled_;
}
