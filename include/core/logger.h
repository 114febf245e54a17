#ifndef LOGGER_H
#define LOGGER_H

#include "core/database_log_writer.h"
#include "core/file_log_writer.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_map>

enum class LogLevel {
  DEBUG = 0,
  INFO = 1,
  WARNING = 2,
  ERROR = 3,
  CRITICAL = 4
};

enum class LogCategory {
  SYSTEM = 0,
  DATABASE = 1,
  CONFIG = 2,
  DECODE = 3,
  STREAM = 4,
  UNKNOWN = 99
};

class Logger {
private:
  static std::unique_ptr<DatabaseLogWriter> dbWriter_;
  static std::unique_ptr<FileLogWriter> fileWriter_;
  static std::mutex logMutex;

  static LogLevel currentLogLevel;
  static bool showTimestamps;
  static bool consoleOutput;
  static std::mutex configMutex;

  static const std::unordered_map<std::string, LogCategory> categoryMap;
  static const std::unordered_map<std::string, LogLevel> levelMap;

  static std::string formatLogMessage(const std::string &timestamp,
                                      const std::string &levelStr,
                                      const std::string &categoryStr,
                                      const std::string &function,
                                      const std::string &message) {
    std::ostringstream oss;
    if (!timestamp.empty()) {
      oss << "[" << timestamp << "] ";
    }
    oss << "[" << levelStr << "] [" << categoryStr << "]";
    if (!function.empty()) {
      oss << " [" << function << "]";
    }
    oss << " " << message;
    return oss.str();
  }

  static std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) %
              1000;

    std::stringstream ss;
    localtime_r(&time_t, &tm_buf);
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    ss << "." << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
  }

  static std::string getLevelString(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG:
      return "DEBUG";
    case LogLevel::INFO:
      return "INFO";
    case LogLevel::WARNING:
      return "WARNING";
    case LogLevel::ERROR:
      return "ERROR";
    case LogLevel::CRITICAL:
      return "CRITICAL";
    default:
      return "UNKNOWN";
    }
  }

  static std::string getCategoryString(LogCategory category) {
    switch (category) {
    case LogCategory::SYSTEM:
      return "SYSTEM";
    case LogCategory::DATABASE:
      return "DATABASE";
    case LogCategory::CONFIG:
      return "CONFIG";
    case LogCategory::DECODE:
      return "DECODE";
    case LogCategory::STREAM:
      return "STREAM";
    default:
      return "UNKNOWN";
    }
  }

  static void writeLog(LogLevel level, LogCategory category,
                       const std::string &function,
                       const std::string &message) {
    LogLevel minLevel;
    bool withTimestamp;
    bool toConsole;
    {
      std::lock_guard<std::mutex> configLock(configMutex);
      minLevel = currentLogLevel;
      withTimestamp = showTimestamps;
      toConsole = consoleOutput;
    }

    if (level < minLevel) {
      return;
    }

    std::string levelStr = getLevelString(level);
    std::string categoryStr = getCategoryString(category);

    DatabaseLogWriter *dbWriter = nullptr;
    FileLogWriter *fileWriter = nullptr;
    {
      std::lock_guard<std::mutex> lock(logMutex);
      if (dbWriter_ && dbWriter_->isOpen()) {
        dbWriter = dbWriter_.get();
      }
      if (fileWriter_ && fileWriter_->isOpen()) {
        fileWriter = fileWriter_.get();
      }
    }

    bool written = false;
    if (dbWriter) {
      written = dbWriter->writeParsed(levelStr, categoryStr, function,
                                      message);
    }

    std::string line;
    if (fileWriter || toConsole || !written) {
      line = formatLogMessage(withTimestamp ? getCurrentTimestamp() : "",
                              levelStr, categoryStr, function, message);
    }

    if (fileWriter) {
      written = fileWriter->write(line) || written;
    }

    if (toConsole || !written) {
      std::cerr << line << std::endl;
    }
  }

public:
  static void initialize(const std::string &logFile = "");

  static void shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (dbWriter_) {
      dbWriter_->close();
    }
    dbWriter_.reset();
    if (fileWriter_) {
      fileWriter_->close();
    }
    fileWriter_.reset();
  }

  static void debug(const std::string &message) {
    writeLog(LogLevel::DEBUG, LogCategory::SYSTEM, "", message);
  }

  static void info(const std::string &message) {
    writeLog(LogLevel::INFO, LogCategory::SYSTEM, "", message);
  }

  static void warning(const std::string &message) {
    writeLog(LogLevel::WARNING, LogCategory::SYSTEM, "", message);
  }

  static void error(const std::string &message) {
    writeLog(LogLevel::ERROR, LogCategory::SYSTEM, "", message);
  }

  static void critical(const std::string &message) {
    writeLog(LogLevel::CRITICAL, LogCategory::SYSTEM, "", message);
  }

  // Categorized logging methods
  static void debug(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::DEBUG, category, function, message);
  }

  static void info(LogCategory category, const std::string &function,
                   const std::string &message) {
    writeLog(LogLevel::INFO, category, function, message);
  }

  static void warning(LogCategory category, const std::string &function,
                      const std::string &message) {
    writeLog(LogLevel::WARNING, category, function, message);
  }

  static void error(LogCategory category, const std::string &function,
                    const std::string &message) {
    writeLog(LogLevel::ERROR, category, function, message);
  }

  static void critical(LogCategory category, const std::string &function,
                       const std::string &message) {
    writeLog(LogLevel::CRITICAL, category, function, message);
  }

  static void log(LogLevel level, LogCategory category,
                  const std::string &function, const std::string &message) {
    writeLog(level, category, function, message);
  }

  // Configuration management
  static void loadDebugConfig();
  static void setDefaultConfig();
  static void setLogLevel(LogLevel level);
  static void setLogLevel(const std::string &levelStr);
  static LogLevel getCurrentLogLevel();
  static void setConsoleOutput(bool enabled);
  static LogCategory stringToCategory(const std::string &categoryStr);
  static LogLevel stringToLogLevel(const std::string &levelStr);
  static void refreshConfig();
};

#endif
