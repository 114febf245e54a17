#include "core/database_config.h"
#include "core/file_log_writer.h"
#include "core/logger.h"
#include "test_runner.h"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace {

std::vector<std::string> readLines(const std::string &path) {
  std::vector<std::string> lines;
  std::ifstream in(path);
  std::string line;
  while (std::getline(in, line))
    lines.push_back(line);
  return lines;
}

// 39 characters plus the newline the writer appends.
std::string lineNumbered(int n) {
  std::string line = "line " + std::to_string(n) + " ";
  line.resize(39, 'x');
  return line;
}

} // namespace

int main() {
  TestRunner runner;

  fs::path dir =
      fs::temp_directory_path() /
      ("oplog_log_writer_" +
       std::to_string(
           std::chrono::steady_clock::now().time_since_epoch().count()));
  fs::create_directories(dir);
  const std::string logFile = (dir / "oplog.log").string();

  runner.runTest("Lines are appended", [&]() {
    FileLogWriter writer(logFile, 0, 2);
    runner.assertTrue(writer.isOpen(), "writer opens the file");
    runner.assertTrue(writer.write("first"), "first write");
    runner.assertTrue(writer.write("second"), "second write");
    writer.close();
    runner.assertFalse(writer.isOpen(), "closed");
    runner.assertFalse(writer.write("dropped"), "write after close fails");

    std::vector<std::string> lines = readLines(logFile);
    runner.assertEquals(size_t(2), lines.size(), "two lines");
    runner.assertTrue(lines.size() == 2 && lines[0] == "first" &&
                          lines[1] == "second",
                      "lines in order");
    fs::remove(logFile);
  });

  runner.runTest("Files rotate past the size limit", [&]() {
    {
      FileLogWriter writer(logFile, 64, 2);
      for (int i = 1; i <= 7; ++i)
        writer.write(lineNumbered(i));
    }

    std::vector<std::string> live = readLines(logFile);
    std::vector<std::string> first = readLines(logFile + ".1");
    std::vector<std::string> second = readLines(logFile + ".2");

    runner.assertEquals(size_t(1), live.size(), "live file holds one line");
    runner.assertTrue(!live.empty() && live[0] == lineNumbered(7),
                      "newest line is in the live file");
    runner.assertEquals(size_t(2), first.size(), ".1 holds two lines");
    runner.assertTrue(first.size() == 2 && first[0] == lineNumbered(5) &&
                          first[1] == lineNumbered(6),
                      ".1 holds lines 5 and 6");
    runner.assertTrue(second.size() == 2 && second[0] == lineNumbered(3),
                      ".2 holds lines 3 and 4");
    runner.assertFalse(fs::exists(logFile + ".3"),
                       "oldest backup beyond the limit is dropped");
  });

  runner.runTest("Reopening counts the existing size", [&]() {
    fs::remove(logFile);
    fs::remove(logFile + ".1");
    fs::remove(logFile + ".2");
    {
      FileLogWriter writer(logFile, 64, 2);
      writer.write(lineNumbered(1));
      writer.write(lineNumbered(2));
    }
    {
      FileLogWriter writer(logFile, 64, 2);
      writer.write(lineNumbered(3));
    }

    runner.assertTrue(fs::exists(logFile + ".1"),
                      "a restarted writer rotates the full file");
    runner.assertEquals(size_t(1), readLines(logFile).size(),
                        "live file starts over");
    runner.assertEquals(size_t(2), readLines(logFile + ".1").size(),
                        "previous contents moved to .1");
  });

  runner.runTest("Logger writes through the file sink", [&]() {
    const std::string loggerFile = (dir / "logger.log").string();
    DatabaseConfig::reset();
    Logger::setLogLevel(LogLevel::INFO);
    Logger::initialize(loggerFile);

    Logger::debug(LogCategory::STREAM, "tailer", "below the level");
    Logger::info(LogCategory::STREAM, "tailer", "cursor opened");

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
      threads.emplace_back([t]() {
        for (int i = 0; i < 50; ++i)
          Logger::warning(LogCategory::DECODE, "worker",
                          "thread " + std::to_string(t));
      });
    }
    for (auto &thread : threads)
      thread.join();
    Logger::shutdown();

    std::vector<std::string> lines = readLines(loggerFile);
    runner.assertEquals(size_t(201), lines.size(),
                        "every line from every thread is written once");
    runner.assertTrue(!lines.empty() &&
                          lines[0].find("[INFO]") != std::string::npos &&
                          lines[0].find("[STREAM]") != std::string::npos &&
                          lines[0].find("cursor opened") != std::string::npos,
                      "first line carries level, category and message");
  });

  std::error_code ec;
  fs::remove_all(dir, ec);
  return runner.printSummary();
}
