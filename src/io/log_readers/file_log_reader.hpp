#ifndef FILE_LOG_READER_HPP
#define FILE_LOG_READER_HPP

#include "base_log_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <fstream>
#include <string>
#include <vector>

// An implementation of ILogReader that reads an access log from a text file
class FileLogReader : public ILogReader {
public:
  // Throws std::runtime_error when the file cannot be opened
  explicit FileLogReader(const std::string &filepath,
                         size_t batch_size = DEFAULT_BATCH_SIZE);
  ~FileLogReader() override;

  std::vector<std::string> get_next_batch() override;
  uint64_t lines_read() const override { return line_number_; }
  bool is_open() const;

  static constexpr size_t DEFAULT_BATCH_SIZE = 1000;

private:
  std::ifstream log_file_stream_;
  std::string filepath_;
  uint64_t line_number_ = 0;
  size_t batch_size_;
};

#endif // FILE_LOG_READER_HPP
