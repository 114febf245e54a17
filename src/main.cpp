#include "core/database_config.h"
#include "core/logger.h"
#include "core/tail_config.h"
#include "engines/mongodb_engine.h"
#include "oplog/oplog_decoder.h"
#include "oplog/oplog_stream.h"
#include <iostream>

namespace {
constexpr int EXIT_SUCCESS_CODE = 0;
constexpr int EXIT_STREAM_ERROR = 1;
constexpr int EXIT_CONFIG_ERROR = 6;

void cleanupLogger() {
  try {
    Logger::shutdown();
  } catch (const std::exception &e) {
    std::cerr << "Error shutting down logger: " << e.what() << std::endl;
  }
}
} // namespace

// oplog_tail [config.json]
//
// Tails the configured oplog collection and prints one line per decoded
// operation. Records that fail to decode are logged and skipped. Runs until
// the cursor is exhausted, the error budget runs out or the process is
// interrupted.
int main(int argc, char *argv[]) {
  std::string configPath = argc > 1 ? argv[1] : "config.json";

  TailConfig::setMaxConsecutiveErrors(TailConfig::TOOL_MAX_CONSECUTIVE_ERRORS);
  DatabaseConfig::loadFromFile(configPath);
  if (!DatabaseConfig::isInitialized()) {
    std::cerr << "Error: configuration failed to initialize. Please check "
              << configPath << " or environment variables." << std::endl;
    return EXIT_CONFIG_ERROR;
  }

  Logger::initialize();
  Logger::info(LogCategory::SYSTEM, "main", "oplog_tail started");

  int exitCode = EXIT_SUCCESS_CODE;
  try {
    MongoDBEngine engine(DatabaseConfig::getMongoDBUri());
    if (!engine.isValid()) {
      throw DatabaseError("Could not connect to " + engine.getHost() + ":" +
                          std::to_string(engine.getPort()));
    }

    OplogStream stream = OplogStream::open(engine);

    size_t decoded = 0;
    size_t skipped = 0;
    while (auto record = stream.next()) {
      auto result = OplogDecoder::tryDecode(*record);
      if (!result.ok()) {
        ++skipped;
        Logger::log(result.errorKind == OplogErrorKind::UNKNOWN_OPERATION
                        ? LogLevel::DEBUG
                        : LogLevel::WARNING,
                    LogCategory::DECODE, "main",
                    "Skipping record: " + result.errorMessage);
        continue;
      }

      ++decoded;
      std::cout << result.operation->describe() << std::endl;
    }

    Logger::info(LogCategory::SYSTEM, "main",
                 "Stream ended after " + std::to_string(decoded) +
                     " operations (" + std::to_string(skipped) + " skipped)");
  } catch (const OplogError &e) {
    Logger::critical(LogCategory::STREAM, "main",
                     std::string(oplogErrorKindName(e.kind())) + " error: " +
                         e.what());
    exitCode = EXIT_STREAM_ERROR;
  } catch (const std::exception &e) {
    Logger::critical(LogCategory::SYSTEM, "main",
                     "Unexpected error: " + std::string(e.what()));
    exitCode = EXIT_STREAM_ERROR;
  }

  cleanupLogger();
  return exitCode;
}
