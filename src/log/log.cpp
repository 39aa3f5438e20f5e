#include "log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <vector>

#include "core/config.hpp"

namespace piacp {

namespace {

// Shift <stem>.log -> <stem>.0.log -> ... -> <stem>.<max_files-1>.log, dropping the oldest
void rotate_logs_on_startup(const std::filesystem::path& current_log, size_t max_files) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(current_log, ec) || max_files == 0) {
    return;
  }

  auto log_dir = current_log.parent_path();
  auto stem = current_log.stem().string();
  auto ext = current_log.extension().string();
  auto numbered = [&](size_t i) { return log_dir / (stem + "." + std::to_string(i) + ext); };

  fs::remove(numbered(max_files - 1), ec);

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    auto old_name = numbered(static_cast<size_t>(i));
    if (fs::exists(old_name, ec)) {
      fs::rename(old_name, numbered(static_cast<size_t>(i) + 1), ec);
    }
  }

  fs::rename(current_log, numbered(0), ec);
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level, bool to_stderr) {
  try {
    namespace fs = std::filesystem;

    fs::path actual_path = log_path.empty() ? config_paths::config_dir() / "log" / "pi_acp.log" : fs::path(log_path);

    std::error_code ec;
    fs::create_directories(actual_path.parent_path(), ec);
    if (ec) {
      std::cerr << "Failed to create log directory: " << ec.message() << "\n";
    }

    rotate_logs_on_startup(actual_path, max_files);

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true));
    if (to_stderr) {
      sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("pi_acp", sinks.begin(), sinks.end());

    auto log_level = spdlog::level::from_str(level);
    if (log_level == spdlog::level::off && level != "off") {
      log_level = spdlog::level::info;
    }
    logger->set_level(log_level);

    // [time] [level] [thread id] message
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");

    logger->flush_on(spdlog::level::trace);

    spdlog::drop("pi_acp");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== pi-acp started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace piacp
