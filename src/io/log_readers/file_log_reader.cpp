#include "file_log_reader.hpp"
#include "core/logger.hpp"

#include <string>

FileLogReader::FileLogReader(const std::string &filepath, uint32_t file_index)
    : LineLogReader(filepath, file_index) {
  log_file_stream_.open(filepath, std::ios::in | std::ios::binary);
  if (!is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Failed to open log source file: " << filepath);
    throw LogSourceError(filepath, "could not open file");
  }
  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "Successfully opened log file: " << filepath);
}

FileLogReader::~FileLogReader() {
  if (log_file_stream_.is_open())
    log_file_stream_.close();
  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "FileLogReader closed " << filepath() << ". Total lines read: "
                              << lines_read());
}

bool FileLogReader::is_open() const { return log_file_stream_.is_open(); }

bool FileLogReader::read_raw_line(std::string &line) {
  if (std::getline(log_file_stream_, line))
    return true;
  if (log_file_stream_.bad())
    throw LogSourceError(filepath(), "read error");
  return false;
}
