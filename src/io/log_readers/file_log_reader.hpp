#ifndef FILE_LOG_READER_HPP
#define FILE_LOG_READER_HPP

#include "line_log_reader.hpp"

#include <cstdint>
#include <fstream>
#include <string>

// Reads log entries from a plain text file
class FileLogReader : public LineLogReader {
public:
  explicit FileLogReader(const std::string &filepath, uint32_t file_index = 0);
  ~FileLogReader() override;

  bool is_open() const override;

protected:
  bool read_raw_line(std::string &line) override;

private:
  std::ifstream log_file_stream_;
};

#endif // FILE_LOG_READER_HPP
