#ifndef FILE_LOG_WRITER_H
#define FILE_LOG_WRITER_H

#include "core/log_writer.h"
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>

// Appends formatted log lines to a file and rotates it to <name>.1 ..
// <name>.N once it grows past maxFileSize bytes.
class FileLogWriter : public ILogWriter {
private:
  std::ofstream file_;
  std::string fileName_;
  size_t maxFileSize_;
  int maxBackupFiles_;
  size_t bytesWritten_;
  mutable std::mutex mutex_;

public:
  explicit FileLogWriter(const std::string &fileName,
                         size_t maxFileSize = 10 * 1024 * 1024,
                         int maxBackupFiles = 5);
  ~FileLogWriter() override { close(); }

  FileLogWriter(const FileLogWriter &) = delete;
  FileLogWriter &operator=(const FileLogWriter &) = delete;

  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override;
  bool isOpen() const override;

  const std::string &getFileName() const { return fileName_; }

private:
  void openUnlocked();
  void rotateUnlocked();
};

#endif
