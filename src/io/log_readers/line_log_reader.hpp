#ifndef LINE_LOG_READER_HPP
#define LINE_LOG_READER_HPP

#include "base_log_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Shared line handling for text-oriented sources. Subclasses only supply raw
// lines; this class strips terminators, skips blank lines, repairs invalid
// UTF-8 and counts lines that fail to parse.
class LineLogReader : public ILogReader {
public:
  std::vector<LogEntry> get_next_batch() override;

  bool exhausted() const override { return exhausted_; }
  uint64_t lines_read() const override { return line_number_; }
  uint64_t parse_failures() const override { return parse_failures_; }

  static constexpr size_t BATCH_SIZE = 1000;

protected:
  LineLogReader(std::string filepath, uint32_t file_index);

  // Reads one line without its terminator. Returns false at end of input
  // and throws LogSourceError on a read error.
  virtual bool read_raw_line(std::string &line) = 0;

  const std::string &filepath() const { return filepath_; }

private:
  std::string filepath_;
  uint32_t file_index_;
  uint64_t line_number_ = 0;
  uint64_t parse_failures_ = 0;
  bool exhausted_ = false;
};

#endif // LINE_LOG_READER_HPP
