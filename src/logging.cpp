#include "logging.hpp"
#include <cstdlib>
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

static const char* kLoggerName = "oaview";

std::optional<std::filesystem::path> data_dir() {
  if (const char* d = std::getenv("OAVIEW_DATA"); d && *d) return std::filesystem::path(d);
  if (const char* x = std::getenv("XDG_DATA_HOME"); x && *x) return std::filesystem::path(x) / "oaview";
  if (const char* h = std::getenv("HOME"); h && *h) return std::filesystem::path(h) / ".local" / "share" / "oaview";
  return std::nullopt;
}

std::filesystem::path init_logging(const std::string& level) {
  std::string lvl = level;
  if (const char* env = std::getenv("OAVIEW_LOGLEVEL"); env && *env) lvl = env;

  std::shared_ptr<spdlog::logger> logger;
  std::filesystem::path file;
  if (auto dir = data_dir()) {
    std::error_code ec;
    std::filesystem::create_directories(*dir, ec);
    file = *dir / "oaview.log";
    try {
      logger = std::make_shared<spdlog::logger>(kLoggerName, std::make_shared<spdlog::sinks::basic_file_sink_mt>(file.string()));
    } catch (const spdlog::spdlog_ex&) {
      logger.reset();
    }
  }
  if (!logger) {
    logger = std::make_shared<spdlog::logger>(kLoggerName, std::make_shared<spdlog::sinks::null_sink_mt>());
    file.clear();
  }
  logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  logger->set_level(spdlog::level::from_str(lvl));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
  return file;
}
