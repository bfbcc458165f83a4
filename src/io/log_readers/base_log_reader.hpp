#ifndef BASE_LOG_READER_HPP
#define BASE_LOG_READER_HPP

#include <cstdint>
#include <string>
#include <vector>

class ILogReader {
public:
  virtual ~ILogReader() = default;

  // Fetches the next batch of raw lines, in source order. Parsing is left to
  // the engine so skipped lines can be counted.
  // Returns an empty vector once the source is exhausted
  virtual std::vector<std::string> get_next_batch() = 0;

  // Number of lines handed out so far; the next line is lines_read() + 1
  virtual uint64_t lines_read() const = 0;
};

#endif // BASE_LOG_READER_HPP
