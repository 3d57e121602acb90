#ifndef BASE_LOG_READER_HPP
#define BASE_LOG_READER_HPP

#include "core/log_entry.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

// Raised when a log file cannot be opened or its stream is corrupt
class LogSourceError : public std::runtime_error {
public:
  LogSourceError(const std::string &path, const std::string &reason)
      : std::runtime_error(path + ": " + reason), path_(path) {}

  const std::string &path() const { return path_; }

private:
  std::string path_;
};

class ILogReader {
public:
  virtual ~ILogReader() = default;

  // Fetches the next batch of parsed log entries. Returns an empty vector
  // once the source is exhausted.
  virtual std::vector<LogEntry> get_next_batch() = 0;

  virtual bool is_open() const = 0;
  virtual bool exhausted() const = 0;
  virtual uint64_t lines_read() const = 0;
  virtual uint64_t parse_failures() const = 0;
};

#endif // BASE_LOG_READER_HPP
