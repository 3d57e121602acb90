#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Config {

namespace {

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.reader", LogComponent::IO_READER},
    {"io.report", LogComponent::IO_REPORT},
    {"parser", LogComponent::PARSER},
    {"detection", LogComponent::DETECTION},
    {"analysis", LogComponent::ANALYSIS}};

const std::vector<std::string> supported_formats = {"md", "json", "html"};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

std::vector<std::string> parse_list(const std::string &value) {
  std::vector<std::string> items;
  for (const auto &item : Utils::split_string(value, ',')) {
    std::string trimmed = Utils::to_lower_copy(Utils::trim_copy(item));
    if (!trimmed.empty())
      items.push_back(trimmed);
  }
  return items;
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    if (current_section.empty()) {
      if (key == Keys::INPUT_PATH)
        config.input_path = value;
      else
        config.custom_settings[key] = value;

    } else if (current_section == "Analysis") {
      if (key == Keys::AN_MIN_REQUESTS)
        config.analysis.min_requests =
            Utils::string_to_number<size_t>(value).value_or(
                config.analysis.min_requests);
      else if (key == Keys::AN_TOP_IPS)
        config.analysis.top_ips = Utils::string_to_number<size_t>(value).value_or(
            config.analysis.top_ips);

    } else if (current_section == "Output") {
      if (key == Keys::OUT_FORMATS) {
        auto formats = parse_list(value);
        if (!formats.empty())
          config.output.formats = formats;
      } else if (key == Keys::OUT_DIRECTORY)
        config.output.directory = value;
      else if (key == Keys::OUT_MARKDOWN_PATH)
        config.output.markdown_path = value;
      else if (key == Keys::OUT_JSON_PATH)
        config.output.json_path = value;
      else if (key == Keys::OUT_HTML_PATH)
        config.output.html_path = value;
      else if (key == Keys::OUT_EVENT_DUMP_LIMIT)
        config.output.event_dump_limit =
            Utils::string_to_number<size_t>(value).value_or(
                config.output.event_dump_limit);

    } else if (current_section == "Performance") {
      if (key == Keys::PERF_THREADS)
        config.performance.threads =
            Utils::string_to_number<uint32_t>(value).value_or(
                config.performance.threads);
      else if (key == Keys::PERF_SHOW_PROGRESS)
        config.performance.show_progress = string_to_bool(value);

    } else if (current_section == "Logging") {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto comp_it = key_to_component_map.find(key);
        if (comp_it != key_to_component_map.end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
          // Wildcard match, e.g., "io.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map)
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
        } else {
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown logging component '" << key << "'."
                    << std::endl;
        }
      }

    } else {
      std::cerr << "Warning (Config Line " << line_num << "): Unknown section '"
                << current_section << "'." << std::endl;
    }
  }

  return true;
}

} // namespace

AppConfig::AppConfig() {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    logging.log_levels[pair.second] = LogLevel::WARN;
  // Except for CORE, which we want to see INFO messages from by default
  logging.log_levels[LogComponent::CORE] = LogLevel::INFO;
}

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN" || level_str == "WARNING")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

bool validate_output_config(const OutputConfig &config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  for (const auto &format : config.formats) {
    if (std::find(supported_formats.begin(), supported_formats.end(),
                  format) == supported_formats.end()) {
      errors.push_back("Output format '" + format +
                       "' is not one of md, json, html");
      valid = false;
    }
  }

  if (config.event_dump_limit < 1) {
    errors.push_back("Output event_dump_limit must be at least 1");
    valid = false;
  }

  return valid;
}

bool validate_performance_config(const PerformanceConfig &config,
                                 std::vector<std::string> &errors) {
  if (config.threads < 1 || config.threads > 64) {
    errors.push_back("Performance threads must be between 1 and 64");
    return false;
  }
  return true;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_output_config(config.output, errors))
    valid = false;

  if (!validate_performance_config(config.performance, errors))
    valid = false;

  return valid;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Configuration loaded and validated successfully from "
          << config_filepath_);
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
