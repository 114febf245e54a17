#include "core/database_config.h"
#include "core/logger.h"
#include "core/tail_config.h"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

// Defaults target a local single-node replica set. PostgreSQL logging is
// off until a "postgres" section or a POSTGRES_HOST variable is supplied.
std::string DatabaseConfig::mongodb_uri_ = DatabaseConfig::DEFAULT_MONGODB_URI;
std::string DatabaseConfig::oplog_database_ =
    DatabaseConfig::DEFAULT_OPLOG_DATABASE;
std::string DatabaseConfig::oplog_collection_ =
    DatabaseConfig::DEFAULT_OPLOG_COLLECTION;
std::string DatabaseConfig::postgres_host_ = "localhost";
std::string DatabaseConfig::postgres_db_ = "oplog";
std::string DatabaseConfig::postgres_user_ = "postgres";
std::string DatabaseConfig::postgres_password_ = "";
std::string DatabaseConfig::postgres_port_ = "5432";
std::string DatabaseConfig::log_file_ = "";
bool DatabaseConfig::postgres_logging_ = false;
bool DatabaseConfig::initialized_ = false;
std::mutex DatabaseConfig::configMutex_;

namespace {
bool validateAndSetPort(const std::string &portStr, std::string &targetPort) {
  if (portStr.empty() || portStr.length() > 5)
    return false;

  for (char c : portStr) {
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
  }

  int portNum = std::stoi(portStr);
  if (portNum > 0 && portNum <= 65535) {
    targetPort = portStr;
    return true;
  }
  return false;
}

// Port may be written as a JSON string or number.
std::string jsonToString(const json &value) {
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_number_integer())
    return std::to_string(value.get<long long>());
  return "";
}

// Reads a non-negative integer setting. Absent keys return false silently;
// present but unusable values are reported and also return false.
bool readTailingValue(const json &tailing, const char *key, size_t &out) {
  if (!tailing.contains(key))
    return false;
  const json &value = tailing[key];
  if (!value.is_number_unsigned() &&
      !(value.is_number_integer() && value.get<long long>() >= 0)) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    std::string("Ignoring non-numeric tailing.") + key);
    return false;
  }
  out = value.get<size_t>();
  return true;
}

void applyTailingSection(const json &tailing) {
  struct Setting {
    const char *key;
    void (*setter)(size_t);
  };
  const Setting settings[] = {
      {"max_consecutive_errors", TailConfig::setMaxConsecutiveErrors},
      {"idle_poll_interval_ms", TailConfig::setIdlePollIntervalMs}};

  for (const auto &setting : settings) {
    size_t value = 0;
    if (!readTailingValue(tailing, setting.key, value))
      continue;
    try {
      setting.setter(value);
    } catch (const std::invalid_argument &e) {
      Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                      std::string("Ignoring tailing.") + setting.key + ": " +
                          e.what());
    }
  }

  // The backoff bounds constrain each other, so a file may move both past
  // the current values in either direction. Validate them as a pair.
  size_t initial = TailConfig::getInitialBackoffMs();
  size_t max = TailConfig::getMaxBackoffMs();
  bool hasInitial = readTailingValue(tailing, "initial_backoff_ms", initial);
  bool hasMax = readTailingValue(tailing, "max_backoff_ms", max);
  if (!hasInitial && !hasMax)
    return;
  try {
    TailConfig::setBackoffMs(initial, max);
  } catch (const std::invalid_argument &e) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    std::string("Ignoring tailing backoff settings: ") +
                        e.what());
  }
}
} // namespace

// libpq keyword/value syntax: values containing spaces, quotes or
// backslashes must be single-quoted with ' and \ escaped.
std::string DatabaseConfig::escapeConnectionParam(const std::string &param) {
  bool needsQuoting = param.empty();
  for (char c : param) {
    if (std::isspace(static_cast<unsigned char>(c)) || c == '\'' ||
        c == '\\') {
      needsQuoting = true;
      break;
    }
  }
  if (!needsQuoting)
    return param;

  std::string quoted = "'";
  for (char c : param) {
    if (c == '\'' || c == '\\')
      quoted += '\\';
    quoted += c;
  }
  quoted += "'";
  return quoted;
}

// Loads settings from a JSON file. Expected layout:
//
//   {
//     "database": {
//       "mongodb":  { "uri": ..., "oplog_database": ..., "oplog_collection": ... },
//       "postgres": { "host": ..., "port": ..., "database": ..., "user": ...,
//                     "password": ... }
//     },
//     "logging": { "file": ... },
//     "tailing": { "max_consecutive_errors": ..., "initial_backoff_ms": ...,
//                  "max_backoff_ms": ..., "idle_poll_interval_ms": ... }
//   }
//
// A missing or unparsable file falls back to environment variables.
void DatabaseConfig::loadFromFile(const std::string &configPath) {
  std::ifstream configFile(configPath);
  if (!configFile.is_open()) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    "Could not open config file '" + configPath +
                        "', using defaults or environment variables");
    loadFromEnv();
    return;
  }

  std::stringstream buffer;
  buffer << configFile.rdbuf();

  try {
    loadFromString(buffer.str());
  } catch (const json::exception &e) {
    Logger::error(LogCategory::CONFIG, "DatabaseConfig",
                  "Error loading config from file: " + std::string(e.what()) +
                      ", falling back to environment variables");
    loadFromEnv();
  }
}

// Parses a JSON document with the layout described in loadFromFile().
// Throws nlohmann::json::exception when the text is not valid JSON.
void DatabaseConfig::loadFromString(const std::string &jsonText) {
  json config = json::parse(jsonText);

  std::lock_guard<std::mutex> lock(configMutex_);

  if (config.contains("database")) {
    const json &database = config["database"];

    if (database.contains("mongodb")) {
      const json &mongo = database["mongodb"];
      if (mongo.contains("uri") && mongo["uri"].is_string() &&
          !mongo["uri"].get<std::string>().empty())
        mongodb_uri_ = mongo["uri"].get<std::string>();
      if (mongo.contains("oplog_database") &&
          mongo["oplog_database"].is_string())
        oplog_database_ = mongo["oplog_database"].get<std::string>();
      if (mongo.contains("oplog_collection") &&
          mongo["oplog_collection"].is_string())
        oplog_collection_ = mongo["oplog_collection"].get<std::string>();
    }

    if (database.contains("postgres")) {
      const json &pgConfig = database["postgres"];
      postgres_logging_ = true;

      if (pgConfig.contains("host")) {
        std::string host = jsonToString(pgConfig["host"]);
        if (!host.empty())
          postgres_host_ = host;
      }
      if (pgConfig.contains("port")) {
        std::string port = jsonToString(pgConfig["port"]);
        if (!validateAndSetPort(port, postgres_port_)) {
          Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                          "Invalid port number: " + port +
                              ", using: " + postgres_port_);
        }
      }
      if (pgConfig.contains("database")) {
        std::string db = jsonToString(pgConfig["database"]);
        if (!db.empty())
          postgres_db_ = db;
      }
      if (pgConfig.contains("user")) {
        std::string user = jsonToString(pgConfig["user"]);
        if (!user.empty())
          postgres_user_ = user;
      }
      if (pgConfig.contains("password"))
        postgres_password_ = jsonToString(pgConfig["password"]);
    }
  }

  if (config.contains("logging") && config["logging"].contains("file") &&
      config["logging"]["file"].is_string()) {
    log_file_ = config["logging"]["file"].get<std::string>();
  }

  if (config.contains("tailing") && config["tailing"].is_object()) {
    applyTailingSection(config["tailing"]);
  }

  initialized_ = true;
}

void DatabaseConfig::loadFromEnv() {
  std::lock_guard<std::mutex> lock(configMutex_);
  loadFromEnvUnlocked();
}

// Reads MONGODB_URI, OPLOG_DATABASE, OPLOG_COLLECTION, OPLOG_LOG_FILE and
// the POSTGRES_* family. Unset variables keep their current value.
void DatabaseConfig::loadFromEnvUnlocked() {
  const char *uri = std::getenv("MONGODB_URI");
  const char *oplogDb = std::getenv("OPLOG_DATABASE");
  const char *oplogColl = std::getenv("OPLOG_COLLECTION");
  const char *logFile = std::getenv("OPLOG_LOG_FILE");
  const char *host = std::getenv("POSTGRES_HOST");
  const char *port = std::getenv("POSTGRES_PORT");
  const char *db = std::getenv("POSTGRES_DB");
  const char *user = std::getenv("POSTGRES_USER");
  const char *password = std::getenv("POSTGRES_PASSWORD");

  if (uri && strlen(uri) > 0)
    mongodb_uri_ = uri;
  if (oplogDb && strlen(oplogDb) > 0)
    oplog_database_ = oplogDb;
  if (oplogColl && strlen(oplogColl) > 0)
    oplog_collection_ = oplogColl;
  if (logFile)
    log_file_ = logFile;

  if (host && strlen(host) > 0) {
    postgres_host_ = host;
    postgres_logging_ = true;
  }
  if (port && strlen(port) > 0) {
    std::string portStr(port);
    if (!validateAndSetPort(portStr, postgres_port_)) {
      Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                      "Invalid port number: " + portStr +
                          ", using: " + postgres_port_);
    }
  }
  if (db && strlen(db) > 0)
    postgres_db_ = db;
  if (user && strlen(user) > 0)
    postgres_user_ = user;
  if (password)
    postgres_password_ = password;

  if (postgres_logging_ && postgres_password_.empty()) {
    Logger::warning(LogCategory::CONFIG, "DatabaseConfig",
                    "POSTGRES_PASSWORD not set in config.json or environment. "
                    "Database logging may fail to connect.");
  }

  initialized_ = true;
}

void DatabaseConfig::reset() {
  std::lock_guard<std::mutex> lock(configMutex_);
  mongodb_uri_ = DEFAULT_MONGODB_URI;
  oplog_database_ = DEFAULT_OPLOG_DATABASE;
  oplog_collection_ = DEFAULT_OPLOG_COLLECTION;
  postgres_host_ = "localhost";
  postgres_db_ = "oplog";
  postgres_user_ = "postgres";
  postgres_password_ = "";
  postgres_port_ = "5432";
  log_file_ = "";
  postgres_logging_ = false;
  initialized_ = false;
}
