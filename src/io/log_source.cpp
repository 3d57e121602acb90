#include "log_source.hpp"
#include "core/logger.hpp"
#include "io/log_readers/file_log_reader.hpp"
#include "io/log_readers/gzip_log_reader.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <exception>
#include <filesystem>
#include <future>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace {

struct FileSlot {
  FileReadResult result;
  std::exception_ptr error;
};

} // namespace

LogSource::LogSource(uint32_t threads) : threads_(std::max<uint32_t>(1, threads)) {}

void LogSource::set_progress_callback(ProgressCallback callback) {
  progress_callback_ = std::move(callback);
}

bool LogSource::is_log_file_name(const std::string &filename) {
  // .log.gz is covered by .gz but listed for clarity
  static const char *extensions[] = {".log", ".log.gz", ".txt", ".gz"};
  for (const char *ext : extensions)
    if (Utils::ends_with(filename, ext))
      return true;
  return false;
}

std::vector<std::string> LogSource::resolve(const std::string &input_path) {
  std::error_code ec;
  if (!fs::is_directory(input_path, ec))
    return {input_path};

  std::vector<std::string> files;
  fs::recursive_directory_iterator it(
      input_path, fs::directory_options::skip_permission_denied, ec);
  if (ec)
    throw LogSourceError(input_path, "cannot walk directory: " + ec.message());

  for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      LOG(LogLevel::WARN, LogComponent::IO_READER,
          "Stopped walking " << input_path << ": " << ec.message());
      break;
    }
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec))
      continue;
    if (is_log_file_name(it->path().filename().string()))
      files.push_back(it->path().string());
  }

  std::sort(files.begin(), files.end());
  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Resolved " << files.size() << " log file(s) under " << input_path);
  return files;
}

std::unique_ptr<ILogReader> LogSource::open_reader(const std::string &filepath,
                                                   uint32_t file_index) {
  if (Utils::ends_with(filepath, ".gz"))
    return std::make_unique<GzipLogReader>(filepath, file_index);
  return std::make_unique<FileLogReader>(filepath, file_index);
}

FileReadResult LogSource::read_file(const std::string &filepath,
                                    uint32_t file_index) {
  FileReadResult result;
  auto reader = open_reader(filepath, file_index);

  while (!reader->exhausted()) {
    std::vector<LogEntry> batch = reader->get_next_batch();
    result.entries.insert(result.entries.end(),
                          std::make_move_iterator(batch.begin()),
                          std::make_move_iterator(batch.end()));
  }

  result.parse_failures = reader->parse_failures();
  result.lines_read = reader->lines_read();

  if (result.entries.empty())
    LOG(LogLevel::WARN, LogComponent::IO_READER,
        "No valid log lines in " << filepath << " (" << result.parse_failures
                                 << " unparseable)");
  else
    LOG(LogLevel::DEBUG, LogComponent::IO_READER,
        "Parsed " << result.entries.size() << " entries from "
                  << result.lines_read << " lines of " << filepath << ", "
                  << result.parse_failures << " failures");
  return result;
}

ReadAllResult LogSource::read_all(const std::string &input_path) {
  std::error_code ec;
  const bool single_file = !fs::is_directory(input_path, ec);
  const std::vector<std::string> files = resolve(input_path);

  ReadAllResult total;
  if (files.empty()) {
    LOG(LogLevel::WARN, LogComponent::IO_READER,
        "No log files found under " << input_path);
    return total;
  }

  std::vector<FileSlot> slots(files.size());
  size_t files_done = 0;

  auto read_slot = [&](size_t index) {
    try {
      slots[index].result =
          read_file(files[index], static_cast<uint32_t>(index));
    } catch (const LogSourceError &) {
      slots[index].error = std::current_exception();
    }

    if (progress_callback_) {
      std::lock_guard<std::mutex> lock(progress_mutex_);
      progress_callback_(++files_done, files.size(), files[index]);
    }
  };

  const size_t num_threads =
      std::min(static_cast<size_t>(threads_), files.size());
  if (num_threads <= 1) {
    for (size_t i = 0; i < files.size(); ++i)
      read_slot(i);
  } else {
    const size_t items_per_thread = files.size() / num_threads;
    std::vector<std::future<void>> futures;
    futures.reserve(num_threads);

    for (size_t t = 0; t < num_threads; ++t) {
      size_t start_idx = t * items_per_thread;
      size_t end_idx =
          (t == num_threads - 1) ? files.size() : (t + 1) * items_per_thread;
      futures.emplace_back(
          std::async(std::launch::async, [&, start_idx, end_idx]() {
            for (size_t j = start_idx; j < end_idx; ++j)
              read_slot(j);
          }));
    }

    // get() rather than wait() so anything other than LogSourceError
    // surfaces here
    for (auto &future : futures)
      future.get();
  }

  // Merge in resolution order so downstream tie-breaks are reproducible
  for (size_t i = 0; i < slots.size(); ++i) {
    FileSlot &slot = slots[i];
    if (slot.error) {
      if (single_file)
        std::rethrow_exception(slot.error);
      try {
        std::rethrow_exception(slot.error);
      } catch (const LogSourceError &e) {
        LOG(LogLevel::ERROR, LogComponent::IO_READER,
            "Skipping unreadable log file: " << e.what());
      }
      total.files_failed++;
      total.failed_files.push_back(files[i]);
      continue;
    }

    total.entries.insert(total.entries.end(),
                         std::make_move_iterator(slot.result.entries.begin()),
                         std::make_move_iterator(slot.result.entries.end()));
    total.parse_failures += slot.result.parse_failures;
    total.files_read++;
  }

  LOG(LogLevel::INFO, LogComponent::IO_READER,
      "Read " << total.entries.size() << " events from " << total.files_read
              << " file(s), " << total.parse_failures << " parse failures, "
              << total.files_failed << " unreadable file(s)");
  return total;
}
