#include "line_log_reader.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <string>
#include <utility>
#include <vector>

LineLogReader::LineLogReader(std::string filepath, uint32_t file_index)
    : filepath_(std::move(filepath)), file_index_(file_index) {}

std::vector<LogEntry> LineLogReader::get_next_batch() {
  std::vector<LogEntry> batch;
  if (!is_open() || exhausted_)
    return batch;

  batch.reserve(BATCH_SIZE);
  std::string line;

  while (batch.size() < BATCH_SIZE) {
    if (!read_raw_line(line)) {
      exhausted_ = true;
      break;
    }
    line_number_++;

    while (!line.empty() && (line.back() == '\n' || line.back() == '\r'))
      line.pop_back();
    if (line.empty())
      continue;

    std::string clean_line = Utils::sanitize_utf8(line);
    if (auto entry_opt =
            LogEntry::parse_from_string(clean_line, line_number_)) {
      entry_opt->source_file_index = file_index_;
      batch.push_back(std::move(*entry_opt));
    } else {
      parse_failures_++;
    }
  }

  LOG(LogLevel::DEBUG, LogComponent::IO_READER,
      "Read " << batch.size() << " log entries from " << filepath_
              << " at line number " << line_number_);

  return batch;
}
