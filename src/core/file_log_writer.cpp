#include "core/file_log_writer.h"
#include <filesystem>
#include <system_error>

FileLogWriter::FileLogWriter(const std::string &fileName, size_t maxFileSize,
                             int maxBackupFiles)
    : fileName_(fileName), maxFileSize_(maxFileSize),
      maxBackupFiles_(maxBackupFiles < 1 ? 1 : maxBackupFiles),
      bytesWritten_(0) {
  std::lock_guard<std::mutex> lock(mutex_);
  openUnlocked();
}

// Opens the log file in append mode and seeds the byte counter with the
// current file size, so a process restart keeps rotating at the same
// threshold instead of starting over at zero.
void FileLogWriter::openUnlocked() {
  file_.open(fileName_, std::ios::app);

  std::error_code ec;
  auto size = std::filesystem::file_size(fileName_, ec);
  bytesWritten_ = ec ? 0 : static_cast<size_t>(size);
}

bool FileLogWriter::write(const std::string &formattedMessage) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!file_.is_open())
    return false;

  if (maxFileSize_ > 0 && bytesWritten_ >= maxFileSize_)
    rotateUnlocked();

  file_ << formattedMessage << '\n';
  bytesWritten_ += formattedMessage.size() + 1;
  return file_.good();
}

void FileLogWriter::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open())
    file_.flush();
}

void FileLogWriter::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

bool FileLogWriter::isOpen() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return file_.is_open();
}

// Shifts <name>.i to <name>.i+1, dropping the oldest backup, then moves the
// live file to <name>.1 and reopens a fresh one. Filesystem errors are
// ignored: a failed rename leaves the writer appending to the current file.
void FileLogWriter::rotateUnlocked() {
  if (file_.is_open())
    file_.close();

  std::error_code ec;
  std::filesystem::remove(fileName_ + "." + std::to_string(maxBackupFiles_),
                          ec);

  for (int i = maxBackupFiles_ - 1; i > 0; --i) {
    std::string oldFile = fileName_ + "." + std::to_string(i);
    if (std::filesystem::exists(oldFile, ec)) {
      std::filesystem::rename(oldFile,
                              fileName_ + "." + std::to_string(i + 1), ec);
    }
  }

  if (std::filesystem::exists(fileName_, ec))
    std::filesystem::rename(fileName_, fileName_ + ".1", ec);

  openUnlocked();
}
