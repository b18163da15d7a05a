#include "agentwire/log/log.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>

#include "agentwire/core/config.hpp"

namespace agentwire {

namespace {

namespace fs = std::filesystem;

void rotate_logs_on_startup(const fs::path& current_log, size_t max_files) {
  if (!fs::exists(current_log) || max_files == 0) {
    return;
  }

  const fs::path log_dir = current_log.parent_path();
  const std::string stem = current_log.stem().string();
  auto numbered = [&](size_t i) { return log_dir / (stem + "." + std::to_string(i) + ".log"); };

  std::error_code ec;
  fs::remove(numbered(max_files - 1), ec);

  for (int i = static_cast<int>(max_files) - 2; i >= 0; --i) {
    if (fs::exists(numbered(i))) {
      fs::rename(numbered(i), numbered(i + 1), ec);
    }
  }

  fs::rename(current_log, numbered(0), ec);
  if (ec) {
    std::cerr << "Failed to rotate log " << current_log << ": " << ec.message() << "\n";
  }
}

}  // namespace

void init_log(const std::string& log_path, size_t max_files, const std::string& level) {
  try {
    fs::path actual_path = log_path.empty() ? config_paths::default_log_file() : fs::path(log_path);

    std::error_code ec;
    if (actual_path.has_parent_path()) {
      fs::create_directories(actual_path.parent_path(), ec);
      if (ec) {
        std::cerr << "Failed to create log directory: " << ec.message() << "\n";
        return;
      }
    }

    rotate_logs_on_startup(actual_path, max_files);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(actual_path.string(), true);
    auto logger = std::make_shared<spdlog::logger>("agentwire", file_sink);

    logger->set_level(spdlog::level::from_str(level));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
    logger->flush_on(spdlog::level::trace);

    spdlog::drop("agentwire");
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    spdlog::info("=== agentwire started (log: {}) ===", actual_path.string());
  } catch (const spdlog::spdlog_ex& ex) {
    std::cerr << "Failed to init logger: " << ex.what() << "\n";
  }
}

std::shared_ptr<spdlog::logger> get_logger() {
  return spdlog::default_logger();
}

}  // namespace agentwire
