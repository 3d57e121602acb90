#include "gzip_log_reader.hpp"
#include "core/logger.hpp"

#include <string>

GzipLogReader::GzipLogReader(const std::string &filepath, uint32_t file_index)
    : LineLogReader(filepath, file_index), chunk_(CHUNK_SIZE) {
  gz_file_ = gzopen(filepath.c_str(), "rb");
  if (gz_file_ == nullptr) {
    LOG(LogLevel::ERROR, LogComponent::IO_READER,
        "Failed to open gzip log file: " << filepath);
    throw LogSourceError(filepath, "could not open gzip stream");
  }
  if (gzbuffer(gz_file_, GZ_BUFFER_SIZE) != 0)
    LOG(LogLevel::WARN, LogComponent::IO_READER,
        "Could not enlarge zlib buffer for " << filepath);

  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "Successfully opened gzip log file: " << filepath);
}

GzipLogReader::~GzipLogReader() {
  if (gz_file_ != nullptr) {
    int rc = gzclose(gz_file_);
    if (rc != Z_OK)
      LOG(LogLevel::WARN, LogComponent::IO_READER,
          "gzclose returned " << rc << " for " << filepath());
  }
  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "GzipLogReader closed " << filepath() << ". Total lines read: "
                              << lines_read());
}

bool GzipLogReader::is_open() const { return gz_file_ != nullptr; }

bool GzipLogReader::read_raw_line(std::string &line) {
  while (true) {
    size_t newline = pending_.find('\n', pending_pos_);
    if (newline != std::string::npos) {
      line.assign(pending_, pending_pos_, newline - pending_pos_);
      pending_pos_ = newline + 1;
      return true;
    }

    if (stream_ended_) {
      // Last line without a terminator
      if (pending_pos_ < pending_.size()) {
        line.assign(pending_, pending_pos_, std::string::npos);
        pending_pos_ = pending_.size();
        return true;
      }
      return false;
    }

    pending_.erase(0, pending_pos_);
    pending_pos_ = 0;

    int bytes = gzread(gz_file_, chunk_.data(), CHUNK_SIZE);
    int errnum = Z_OK;
    const char *message = gzerror(gz_file_, &errnum);
    if (bytes < 0 || (errnum != Z_OK && errnum != Z_STREAM_END))
      throw LogSourceError(filepath(),
                           std::string("corrupt gzip stream: ") + message);

    // zlib passes files without a gzip header through unchanged
    if (!format_checked_) {
      format_checked_ = true;
      if (bytes > 0 && gzdirect(gz_file_) != 0) {
        LOG(LogLevel::ERROR, LogComponent::IO_READER,
            "File has a .gz name but no gzip header: " << filepath());
        throw LogSourceError(filepath(), "not a gzip stream");
      }
    }

    if (bytes == 0)
      stream_ended_ = true;
    else
      pending_.append(chunk_.data(), static_cast<size_t>(bytes));
  }
}
