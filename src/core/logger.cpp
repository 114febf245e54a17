#include "core/logger.h"
#include "core/database_config.h"
#include <algorithm>

std::unique_ptr<DatabaseLogWriter> Logger::dbWriter_;
std::unique_ptr<FileLogWriter> Logger::fileWriter_;
std::mutex Logger::logMutex;

// Output settings. currentLogLevel is the minimum level written;
// consoleOutput mirrors every line to stderr even when another sink
// accepted it.
LogLevel Logger::currentLogLevel = LogLevel::INFO;
bool Logger::showTimestamps = true;
bool Logger::consoleOutput = false;
std::mutex Logger::configMutex;

const std::unordered_map<std::string, LogCategory> Logger::categoryMap = {
    {"SYSTEM", LogCategory::SYSTEM},
    {"DATABASE", LogCategory::DATABASE},
    {"CONFIG", LogCategory::CONFIG},
    {"DECODE", LogCategory::DECODE},
    {"STREAM", LogCategory::STREAM}};

const std::unordered_map<std::string, LogLevel> Logger::levelMap = {
    {"DEBUG", LogLevel::DEBUG},      {"INFO", LogLevel::INFO},
    {"WARN", LogLevel::WARNING},     {"WARNING", LogLevel::WARNING},
    {"ERROR", LogLevel::ERROR},      {"FATAL", LogLevel::CRITICAL},
    {"CRITICAL", LogLevel::CRITICAL}};

LogCategory Logger::stringToCategory(const std::string &categoryStr) {
  auto it = categoryMap.find(categoryStr);
  return (it != categoryMap.end()) ? it->second : LogCategory::UNKNOWN;
}

LogLevel Logger::stringToLogLevel(const std::string &levelStr) {
  std::string upper = levelStr;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
  auto it = levelMap.find(upper);
  return (it != levelMap.end()) ? it->second : LogLevel::INFO;
}

// Reads debug_level and debug_show_timestamps from metadata.config in the
// PostgreSQL log database. Only consulted when PostgreSQL logging is
// configured; any failure keeps the current settings.
void Logger::loadDebugConfig() {
  if (!DatabaseConfig::isPostgresLoggingEnabled()) {
    return;
  }

  try {
    pqxx::connection conn(DatabaseConfig::getPostgresConnectionString());
    if (!conn.is_open()) {
      return;
    }

    pqxx::work txn(conn);
    auto result = txn.exec("SELECT key, value FROM metadata.config WHERE key "
                           "IN ('debug_level', 'debug_show_timestamps')");
    txn.commit();

    std::lock_guard<std::mutex> lock(configMutex);
    for (const auto &row : result) {
      std::string key = row[0].as<std::string>();
      std::string value = row[1].is_null() ? "" : row[1].as<std::string>();
      if (key == "debug_level" && !value.empty()) {
        currentLogLevel = stringToLogLevel(value);
      } else if (key == "debug_show_timestamps") {
        showTimestamps = (value == "true");
      }
    }
  } catch (const pqxx::sql_error &e) {
    std::cerr << "Logger: metadata.config unavailable (" << e.what()
              << "), keeping current log settings" << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Logger: could not load debug config: " << e.what()
              << std::endl;
  }
}

void Logger::setDefaultConfig() {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = LogLevel::INFO;
  showTimestamps = true;
  consoleOutput = false;
}

void Logger::setLogLevel(LogLevel level) {
  std::lock_guard<std::mutex> lock(configMutex);
  currentLogLevel = level;
}

// Accepts DEBUG, INFO, WARN/WARNING, ERROR, FATAL/CRITICAL in any case.
// Unrecognized strings leave the level unchanged.
void Logger::setLogLevel(const std::string &levelStr) {
  std::string upper = levelStr;
  std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);
  if (levelMap.find(upper) == levelMap.end()) {
    return;
  }
  setLogLevel(stringToLogLevel(upper));
}

LogLevel Logger::getCurrentLogLevel() {
  std::lock_guard<std::mutex> lock(configMutex);
  return currentLogLevel;
}

void Logger::setConsoleOutput(bool enabled) {
  std::lock_guard<std::mutex> lock(configMutex);
  consoleOutput = enabled;
}

void Logger::refreshConfig() { loadDebugConfig(); }

// Sets up the configured sinks: a rotating file when logFile (or the
// configured logging.file) is non-empty, and the PostgreSQL writer when
// PostgreSQL logging is enabled. Without any sink, lines go to stderr.
void Logger::initialize(const std::string &logFile) {
  loadDebugConfig();

  std::string fileName = logFile.empty() ? DatabaseConfig::getLogFile()
                                         : logFile;

  std::lock_guard<std::mutex> lock(logMutex);

  if (!fileName.empty()) {
    fileWriter_ = std::make_unique<FileLogWriter>(fileName);
    if (!fileWriter_->isOpen()) {
      std::cerr << "Warning: Could not open log file '" << fileName
                << "'. File logging will be disabled." << std::endl;
      fileWriter_.reset();
    }
  }

  if (DatabaseConfig::isPostgresLoggingEnabled()) {
    dbWriter_ = std::make_unique<DatabaseLogWriter>(
        DatabaseConfig::getPostgresConnectionString());
    if (!dbWriter_->isEnabled()) {
      std::cerr << "Warning: Database log writer initialization failed. "
                   "Logging to database will be disabled."
                << std::endl;
      dbWriter_.reset();
    }
  }
}
