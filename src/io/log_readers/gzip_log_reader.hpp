#ifndef GZIP_LOG_READER_HPP
#define GZIP_LOG_READER_HPP

#include "line_log_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <zlib.h>

// Reads log entries from a gzip-compressed file through zlib's gz* stream
// interface. Rotated logs (access.log.2.gz) are the usual input.
class GzipLogReader : public LineLogReader {
public:
  explicit GzipLogReader(const std::string &filepath, uint32_t file_index = 0);
  ~GzipLogReader() override;

  GzipLogReader(const GzipLogReader &) = delete;
  GzipLogReader &operator=(const GzipLogReader &) = delete;

  bool is_open() const override;

protected:
  bool read_raw_line(std::string &line) override;

private:
  gzFile gz_file_ = nullptr;
  std::vector<char> chunk_;
  std::string pending_;
  size_t pending_pos_ = 0;
  bool stream_ended_ = false;
  bool format_checked_ = false;

  static constexpr unsigned GZ_BUFFER_SIZE = 128 * 1024;
  static constexpr int CHUNK_SIZE = 8192;
};

#endif // GZIP_LOG_READER_HPP
