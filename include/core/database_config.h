#ifndef DATABASE_CONFIG_H
#define DATABASE_CONFIG_H

#include <mutex>
#include <string>

// Process-wide connection settings: the MongoDB deployment whose oplog is
// tailed and the optional PostgreSQL instance that receives log entries.
class DatabaseConfig {
private:
  static std::string mongodb_uri_;
  static std::string oplog_database_;
  static std::string oplog_collection_;
  static std::string postgres_host_;
  static std::string postgres_db_;
  static std::string postgres_user_;
  static std::string postgres_password_;
  static std::string postgres_port_;
  static std::string log_file_;
  static bool postgres_logging_;
  static bool initialized_;
  static std::mutex configMutex_;

  static std::string escapeConnectionParam(const std::string &param);
  static void loadFromEnvUnlocked();

public:
  static constexpr const char *DEFAULT_MONGODB_URI =
      "mongodb://localhost:27017/local";
  static constexpr const char *DEFAULT_OPLOG_DATABASE = "local";
  static constexpr const char *DEFAULT_OPLOG_COLLECTION = "oplog.rs";

  static void loadFromFile(const std::string &configPath = "config.json");
  static void loadFromString(const std::string &jsonText);
  static void loadFromEnv();
  static void reset();

  static std::string getMongoDBUri() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return mongodb_uri_;
  }
  static std::string getOplogDatabase() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return oplog_database_;
  }
  static std::string getOplogCollection() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return oplog_collection_;
  }
  static std::string getPostgresHost() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_host_;
  }
  static std::string getPostgresPort() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_port_;
  }
  static std::string getLogFile() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return log_file_;
  }
  static bool isPostgresLoggingEnabled() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return postgres_logging_;
  }

  static std::string getPostgresConnectionString() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return "host=" + escapeConnectionParam(postgres_host_) +
           " dbname=" + escapeConnectionParam(postgres_db_) +
           " user=" + escapeConnectionParam(postgres_user_) +
           " password=" + escapeConnectionParam(postgres_password_) +
           " port=" + escapeConnectionParam(postgres_port_);
  }

  static std::string getPostgresConnectionStringForLogging() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return "host=" + escapeConnectionParam(postgres_host_) +
           " dbname=" + escapeConnectionParam(postgres_db_) +
           " user=" + escapeConnectionParam(postgres_user_) +
           " password=*** port=" + escapeConnectionParam(postgres_port_);
  }

  static bool isInitialized() {
    std::lock_guard<std::mutex> lock(configMutex_);
    return initialized_;
  }
};

#endif
