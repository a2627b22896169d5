#include "log.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

static constexpr const char* kLoggerName = "tealoop";
static constexpr const char* kPattern = "[%H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v";

LoggerPtr null_logger() {
  return std::make_shared<spdlog::logger>(kLoggerName, std::make_shared<spdlog::sinks::null_sink_mt>());
}

LoggerPtr make_logger(const ProgramOptions& opts, LogTarget fallback, std::string& msg) {
  spdlog::sink_ptr sink;
  if (!opts.log_file.empty()) {
    try {
      sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(opts.log_file, false);
    } catch (const spdlog::spdlog_ex& e) {
      msg = std::string("can not open log file: ") + e.what();
    }
  }
  if (!sink) {
    if (fallback == LogTarget::Stderr) sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    else sink = std::make_shared<spdlog::sinks::null_sink_mt>();
  }
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, std::move(sink));
  logger->set_pattern(kPattern);
  logger->set_level(opts.debug ? spdlog::level::debug : spdlog::level::info);
  logger->flush_on(spdlog::level::warn);
  return logger;
}
