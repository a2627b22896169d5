#pragma once
/*
 * Log
 *
 * Purpose: build the spdlog logger handle that Program and CommandExecutor receive.
 * Note: no global registry; each owner keeps the shared_ptr it was given.
 */
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include "config.hpp"

using LoggerPtr = std::shared_ptr<spdlog::logger>;

enum class LogTarget { Stderr, Silent };

// Falls back to `fallback` (and explains why in msg) when the log file can't be opened.
LoggerPtr make_logger(const ProgramOptions& opts, LogTarget fallback, std::string& msg);
LoggerPtr null_logger();
