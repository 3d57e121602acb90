#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *INPUT_PATH = "input_path";

// Analysis Settings
constexpr const char *AN_MIN_REQUESTS = "min_requests";
constexpr const char *AN_TOP_IPS = "top_ips";

// Output Settings
constexpr const char *OUT_FORMATS = "formats";
constexpr const char *OUT_DIRECTORY = "directory";
constexpr const char *OUT_MARKDOWN_PATH = "markdown_path";
constexpr const char *OUT_JSON_PATH = "json_path";
constexpr const char *OUT_HTML_PATH = "html_path";
constexpr const char *OUT_EVENT_DUMP_LIMIT = "event_dump_limit";

// Performance Settings
constexpr const char *PERF_THREADS = "threads";
constexpr const char *PERF_SHOW_PROGRESS = "show_progress";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

struct AnalysisConfig {
  // Addresses with fewer requests are never scored
  // 0 behaves like 1
  size_t min_requests = 50;
  // 0 leaves the ranking empty
  size_t top_ips = 10;
};

struct OutputConfig {
  std::vector<std::string> formats = {"md"};
  std::string directory = ".";
  std::string markdown_path = "report.md";
  std::string json_path = "report.json";
  std::string html_path = "report.html";
  size_t event_dump_limit = 20000;
};

struct PerformanceConfig {
  uint32_t threads = 4;
  bool show_progress = true;
};

struct AppConfig {
  std::string input_path;

  AnalysisConfig analysis;
  OutputConfig output;
  PerformanceConfig performance;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig();
};

// Validation functions for configuration parameters
bool validate_output_config(const OutputConfig &config,
                            std::vector<std::string> &errors);
bool validate_performance_config(const PerformanceConfig &config,
                                 std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

LogLevel string_to_log_level(const std::string &level_str_raw);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
