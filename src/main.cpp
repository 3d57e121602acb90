#include "analysis/threat_analyzer.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "io/log_readers/base_log_reader.hpp"
#include "io/log_source.hpp"
#include "io/report_writers/html_report_writer.hpp"
#include "io/report_writers/json_report_writer.hpp"
#include "io/report_writers/markdown_report_writer.hpp"
#include "utils/utils.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

constexpr const char *VERSION = "1.0.0";

constexpr int EXIT_OK = 0;
constexpr int EXIT_RUNTIME_FAILURE = 1;
constexpr int EXIT_USAGE = 2;

struct CliOptions {
  std::optional<std::string> input;
  std::optional<std::string> out;
  std::optional<std::string> json;
  std::optional<std::string> html;
  std::optional<std::string> format;
  std::optional<std::string> config;
  std::optional<size_t> top;
  std::optional<size_t> min_requests;
  std::optional<uint32_t> threads;
  bool verbose = false;
  bool quiet = false;
  bool help = false;
  bool version = false;
};

void print_usage(std::ostream &os) {
  os << "Usage: weblog_hunter --input <file|dir> [options]\n\n"
     << "Offline threat hunting over Apache/Nginx combined access logs.\n\n"
     << "Options:\n"
     << "  --input PATH        Log file or directory (.log, .txt, .gz)\n"
     << "  --out PATH          Markdown report path (default report.md)\n"
     << "  --json PATH         Also write a JSON report\n"
     << "  --html PATH         Also write an HTML report\n"
     << "  --format FMT        md, json, html or all\n"
     << "  --top N             Number of suspicious IPs to report\n"
     << "  --min-req N         Minimum requests before an IP is scored\n"
     << "  --threads N         Files read in parallel\n"
     << "  --config FILE       INI configuration file\n"
     << "  -v, --verbose       Debug logging\n"
     << "  -q, --quiet         Errors only, no summary\n"
     << "  --version           Print version and exit\n"
     << "  -h, --help          Print this help and exit\n";
}

template <typename T>
bool parse_number_arg(const std::string &flag, const std::string &value,
                      std::optional<T> &out) {
  auto parsed = Utils::string_to_number<T>(value);
  if (!parsed || value.empty() || value == "-") {
    std::cerr << "Invalid numeric value for " << flag << ": '" << value
              << "'" << std::endl;
    return false;
  }
  out = *parsed;
  return true;
}

bool parse_cli(int argc, char *argv[], CliOptions &opts) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
      continue;
    }
    if (arg == "--version") {
      opts.version = true;
      continue;
    }
    if (arg == "-v" || arg == "--verbose") {
      opts.verbose = true;
      continue;
    }
    if (arg == "-q" || arg == "--quiet") {
      opts.quiet = true;
      continue;
    }

    // Everything else takes a value
    if (i + 1 >= argc) {
      std::cerr << "Missing value for " << arg << std::endl;
      return false;
    }
    const std::string value = argv[++i];

    if (arg == "--input") {
      opts.input = value;
    } else if (arg == "--out") {
      opts.out = value;
    } else if (arg == "--json") {
      opts.json = value;
    } else if (arg == "--html") {
      opts.html = value;
    } else if (arg == "--config") {
      opts.config = value;
    } else if (arg == "--format") {
      std::string fmt = Utils::to_lower_copy(value);
      if (fmt != "md" && fmt != "json" && fmt != "html" && fmt != "all") {
        std::cerr << "Unknown format: " << value << std::endl;
        return false;
      }
      opts.format = fmt;
    } else if (arg == "--top") {
      if (!parse_number_arg("--top", value, opts.top))
        return false;
    } else if (arg == "--min-req") {
      if (!parse_number_arg("--min-req", value, opts.min_requests))
        return false;
    } else if (arg == "--threads") {
      if (!parse_number_arg("--threads", value, opts.threads))
        return false;
    } else {
      std::cerr << "Unknown option: " << arg << std::endl;
      return false;
    }
  }

  if (opts.verbose && opts.quiet) {
    std::cerr << "--verbose and --quiet are mutually exclusive" << std::endl;
    return false;
  }
  return true;
}

void apply_cli_overrides(const CliOptions &opts, Config::AppConfig &config) {
  if (opts.input)
    config.input_path = *opts.input;
  if (opts.top)
    config.analysis.top_ips = *opts.top;
  if (opts.min_requests)
    config.analysis.min_requests = *opts.min_requests;
  if (opts.threads)
    config.performance.threads = *opts.threads;
  if (opts.quiet)
    config.performance.show_progress = false;

  if (opts.format) {
    if (*opts.format == "all")
      config.output.formats = {"md", "json", "html"};
    else
      config.output.formats = {*opts.format};
  } else {
    // --json / --html add to whatever the config asked for
    auto add_format = [&config](const std::string &fmt) {
      for (const auto &existing : config.output.formats)
        if (existing == fmt)
          return;
      config.output.formats.push_back(fmt);
    };
    if (opts.json)
      add_format("json");
    if (opts.html)
      add_format("html");
  }
}

std::string in_output_directory(const Config::OutputConfig &output,
                                const std::string &path) {
  std::filesystem::path p(path);
  if (p.is_absolute() || output.directory.empty() || output.directory == ".")
    return p.string();
  return (std::filesystem::path(output.directory) / p).string();
}

struct PlannedReport {
  std::unique_ptr<IReportWriter> writer;
  std::string path;
};

std::vector<PlannedReport> plan_reports(const CliOptions &opts,
                                        const Config::AppConfig &config) {
  const auto &output = config.output;
  const bool all_formats = opts.format && *opts.format == "all";

  // --format all derives every path from one stem
  std::string stem;
  if (all_formats) {
    std::filesystem::path base =
        opts.out ? std::filesystem::path(*opts.out)
                 : std::filesystem::path(in_output_directory(output, "report"));
    stem = base.replace_extension().string();
  }

  auto path_for = [&](const std::string &fmt) -> std::string {
    if (all_formats)
      return stem + "." + fmt;
    if (fmt == "md")
      return opts.out ? *opts.out
                      : in_output_directory(output, output.markdown_path);
    if (fmt == "json")
      return opts.json ? *opts.json
                       : in_output_directory(output, output.json_path);
    return opts.html ? *opts.html
                     : in_output_directory(output, output.html_path);
  };

  std::vector<PlannedReport> reports;
  for (const auto &fmt : output.formats) {
    PlannedReport report;
    if (fmt == "md")
      report.writer = std::make_unique<MarkdownReportWriter>();
    else if (fmt == "json")
      report.writer =
          std::make_unique<JsonReportWriter>(output.event_dump_limit);
    else
      report.writer = std::make_unique<HtmlReportWriter>();
    report.path = path_for(fmt);
    reports.push_back(std::move(report));
  }
  return reports;
}

void print_summary(const AnalysisResult &result,
                   const std::vector<PlannedReport> &reports) {
  std::cout << "\n---Analysis Summary---\n"
            << "Files read:     " << result.files_read << "\n"
            << "Parsed events:  " << result.parsed_events << "\n"
            << "Parse failures: " << result.parse_failures << "\n";
  if (result.top_suspicious_ips.empty()) {
    std::cout << "No IPs met the minimum request threshold.\n";
  } else {
    const auto &top = result.top_suspicious_ips.front();
    std::cout << "Top suspicious IP: " << top.ip << " (score " << std::fixed
              << std::setprecision(2) << top.score << ", "
              << top.request_count << " requests)\n";
  }
  for (const auto &report : reports)
    std::cout << "Report written: " << report.path << "\n";
  std::cout << std::flush;
}

} // namespace

int main(int argc, char *argv[]) {
  std::ios_base::sync_with_stdio(false);

  CliOptions opts;
  if (!parse_cli(argc, argv, opts)) {
    print_usage(std::cerr);
    return EXIT_USAGE;
  }
  if (opts.help) {
    print_usage(std::cout);
    return EXIT_OK;
  }
  if (opts.version) {
    std::cout << "weblog_hunter " << VERSION << std::endl;
    return EXIT_OK;
  }

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  if (opts.config && !config_manager.load_configuration(*opts.config))
    return EXIT_RUNTIME_FAILURE;

  Config::AppConfig config = *config_manager.get_config();
  apply_cli_overrides(opts, config);

  std::vector<std::string> validation_errors;
  if (!Config::validate_app_config(config, validation_errors)) {
    for (const auto &error : validation_errors)
      std::cerr << "  - " << error << std::endl;
    print_usage(std::cerr);
    return EXIT_USAGE;
  }
  if (config.input_path.empty()) {
    std::cerr << "No input given. Use --input or input_path in the config."
              << std::endl;
    print_usage(std::cerr);
    return EXIT_USAGE;
  }

  // --- Initialize Logging ---
  LogManager::instance().configure(config.logging);
  if (opts.verbose)
    LogManager::instance().set_all_levels(LogLevel::DEBUG);
  else if (opts.quiet)
    LogManager::instance().set_all_levels(LogLevel::ERROR);

  LOG(LogLevel::INFO, LogComponent::CORE,
      "weblog_hunter " << VERSION << " analysing " << config.input_path);
  auto time_start = std::chrono::steady_clock::now();

  // --- Ingestion ---
  LogSource log_source(config.performance.threads);
  if (config.performance.show_progress)
    log_source.set_progress_callback(
        [](size_t done, size_t total, const std::string &path) {
          std::cerr << "\r[" << done << "/" << total << "] " << path
                    << "\x1b[K" << std::flush;
          if (done == total)
            std::cerr << std::endl;
        });

  ReadAllResult ingest;
  try {
    ingest = log_source.read_all(config.input_path);
  } catch (const LogSourceError &e) {
    LOG(LogLevel::FATAL, LogComponent::IO_READER,
        "Cannot read input: " << e.what() << ". Exiting.");
    std::cerr << "Error: " << e.what() << std::endl;
    return EXIT_RUNTIME_FAILURE;
  }

  // --- Analysis ---
  ThreatAnalyzer analyzer(config.analysis.min_requests);
  AnalysisResult result =
      analyzer.analyze(std::move(ingest.entries), config.analysis.top_ips);
  result.files_read = ingest.files_read;
  result.parse_failures = ingest.parse_failures;

  // --- Reports ---
  std::vector<PlannedReport> reports = plan_reports(opts, config);
  bool all_written = true;
  for (auto &report : reports) {
    if (!report.writer->write(result, report.path)) {
      std::cerr << "Error: could not write " << report.path << std::endl;
      all_written = false;
    }
  }

  auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::steady_clock::now() - time_start)
                         .count();
  LOG(LogLevel::INFO, LogComponent::CORE,
      "Finished in " << duration_ms << " ms (" << ingest.files_failed
                     << " unreadable file(s))");

  if (!all_written)
    return EXIT_RUNTIME_FAILURE;
  if (!opts.quiet)
    print_summary(result, reports);
  return EXIT_OK;
}
