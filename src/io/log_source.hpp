#ifndef LOG_SOURCE_HPP
#define LOG_SOURCE_HPP

#include "core/log_entry.hpp"
#include "io/log_readers/base_log_reader.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct FileReadResult {
  std::vector<LogEntry> entries;
  uint64_t parse_failures = 0;
  uint64_t lines_read = 0;
};

struct ReadAllResult {
  std::vector<LogEntry> entries;
  uint64_t parse_failures = 0;
  uint64_t files_read = 0;
  uint64_t files_failed = 0;
  std::vector<std::string> failed_files;
};

// Turns an input location (one file or a directory tree) into parsed log
// entries. Files ending in .gz are read through zlib.
class LogSource {
public:
  // Called once per finished file with (files done, files total, path)
  using ProgressCallback =
      std::function<void(size_t, size_t, const std::string &)>;

  explicit LogSource(uint32_t threads = 1);

  void set_progress_callback(ProgressCallback callback);

  // A file resolves to itself. A directory is walked recursively for
  // .log, .log.gz, .txt and .gz files, sorted by path.
  static std::vector<std::string> resolve(const std::string &input_path);

  static bool is_log_file_name(const std::string &filename);

  static std::unique_ptr<ILogReader> open_reader(const std::string &filepath,
                                                 uint32_t file_index = 0);

  // Throws LogSourceError when the file cannot be opened or decompressed
  static FileReadResult read_file(const std::string &filepath,
                                  uint32_t file_index = 0);

  // Reads every resolved file. A single explicit file propagates its
  // LogSourceError; inside a directory a failing file is logged, counted
  // and skipped. Entry order is resolution order regardless of threads.
  ReadAllResult read_all(const std::string &input_path);

private:
  uint32_t threads_;
  ProgressCallback progress_callback_;
  std::mutex progress_mutex_;
};

#endif // LOG_SOURCE_HPP
