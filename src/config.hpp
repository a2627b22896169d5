#pragma once
/*
 * Config
 *
 * Purpose: program options, their validation, and the ~/.tealooprc / env overrides.
 * Usage: options are validated once in Program::run before anything is acquired.
 */
#include <filesystem>
#include <string>

/*compile-time defaults; override with -D*/

#ifndef TL_DEFAULT_FPS
#define TL_DEFAULT_FPS 60
#endif

#ifndef TL_CHANNEL_CAPACITY
#define TL_CHANNEL_CAPACITY 100
#endif

#ifndef TL_SEND_TIMEOUT_MS
#define TL_SEND_TIMEOUT_MS 1000
#endif

#define TL_RC_NAME ".tealooprc"

struct ProgramOptions {
  std::string window_title = "tealoop";
  int initial_width = 80;   // cells
  int initial_height = 24;  // cells
  std::string font_family = "Monospace";
  int font_size = 12;
  int fps = TL_DEFAULT_FPS; // 0 = uncapped
  int channel_capacity = TL_CHANNEL_CAPACITY;
  int send_timeout_ms = TL_SEND_TIMEOUT_MS;
  bool debug = false;
  std::string log_file;
};

bool validate_options(const ProgramOptions& opts, std::string& err);
// Applies "set name=value" lines; bad lines are reported in msg, the rest still apply.
bool load_options_rc(const std::filesystem::path& path, ProgramOptions& opts, std::string& msg);
bool apply_option(ProgramOptions& opts, const std::string& line, std::string& msg);
void options_from_env(ProgramOptions& opts);
std::filesystem::path default_rc_path();
