#include "base_report_writer.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <fstream>

bool write_report_file(const std::string &output_path,
                       const std::string &content, const char *writer_name) {
  if (!Utils::create_directory_for_file(output_path)) {
    LOG(LogLevel::ERROR, LogComponent::IO_REPORT,
        writer_name << " could not create directory for: " << output_path);
    return false;
  }

  std::ofstream out(output_path, std::ios::out | std::ios::trunc |
                                     std::ios::binary);
  if (!out.is_open()) {
    LOG(LogLevel::ERROR, LogComponent::IO_REPORT,
        writer_name << " could not open report file: " << output_path);
    return false;
  }

  out << content;
  out.flush();
  if (!out.good()) {
    LOG(LogLevel::ERROR, LogComponent::IO_REPORT,
        writer_name << " failed to write report file: " << output_path);
    return false;
  }

  LOG(LogLevel::INFO, LogComponent::IO_REPORT,
      writer_name << " wrote " << content.size() << " bytes to "
                  << output_path);
  return true;
}
