#include "file_log_reader.hpp"
#include "core/logger.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

FileLogReader::FileLogReader(const std::string &filepath, size_t batch_size)
    : filepath_(filepath), batch_size_(batch_size == 0 ? 1 : batch_size) {
  log_file_stream_.open(filepath);
  if (!is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Failed to open log source file: " << filepath);
    throw std::runtime_error("Failed to open log source file: " + filepath);
  }
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Successfully opened log file: " << filepath);
}

FileLogReader::~FileLogReader() {
  if (log_file_stream_.is_open())
    log_file_stream_.close();
  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "FileLogReader closed. Total lines read: " << line_number_);
}

bool FileLogReader::is_open() const { return log_file_stream_.is_open(); }

std::vector<std::string> FileLogReader::get_next_batch() {
  std::vector<std::string> batch;
  if (!is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Log file is not open. Cannot read next batch.");
    return batch;
  }

  batch.reserve(batch_size_);
  std::string line;

  // Blank lines are kept: they are counted as malformed and keep line numbers
  // aligned with the file.
  while (batch.size() < batch_size_ && std::getline(log_file_stream_, line)) {
    line_number_++;
    batch.push_back(std::move(line));
  }

  if (log_file_stream_.bad())
    throw std::runtime_error("I/O error while reading " + filepath_ +
                             " after line " + std::to_string(line_number_));

  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "Read " << batch.size() << " lines from file, now at line number "
              << line_number_);
  return batch;
}
