#include "config.hpp"
#include "log.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::filesystem::path write_rc(const std::string& body) {
  auto p = std::filesystem::temp_directory_path() / ("tealoop_rc_" + std::to_string(::getpid()));
  std::ofstream out(p, std::ios::binary);
  out << body;
  return p;
}

static void test_defaults_are_valid() {
  ProgramOptions o;
  std::string err;
  assert(validate_options(o, err));
  assert(o.window_title == "tealoop");
  assert(o.initial_width == 80 && o.initial_height == 24);
  assert(o.font_family == "Monospace" && o.font_size == 12);
  assert(o.fps == 60 && o.channel_capacity == 100 && o.send_timeout_ms == 1000);
  assert(!o.debug && o.log_file.empty());
}

static void test_validation_messages() {
  std::string err;
  ProgramOptions o;
  o.initial_width = 0;
  assert(!validate_options(o, err));
  assert(err == "initial width must be positive, got 0");

  o = ProgramOptions{};
  o.initial_height = -3;
  assert(!validate_options(o, err));
  assert(err == "initial height must be positive, got -3");

  o = ProgramOptions{};
  o.font_size = 0;
  assert(!validate_options(o, err));
  assert(err == "font size must be positive, got 0");

  o = ProgramOptions{};
  o.fps = -1;
  assert(!validate_options(o, err));
  assert(err == "FPS must be non-negative, got -1");

  o = ProgramOptions{};
  o.fps = 0; // uncapped
  assert(validate_options(o, err));

  o = ProgramOptions{};
  o.channel_capacity = 0;
  assert(!validate_options(o, err));

  o = ProgramOptions{};
  o.window_title.clear();
  assert(!validate_options(o, err));
  assert(err == "window title cannot be empty");

  o = ProgramOptions{};
  o.font_family.clear();
  assert(!validate_options(o, err));
  assert(err == "font family cannot be empty");

  // first violation wins
  o = ProgramOptions{};
  o.initial_width = -1;
  o.window_title.clear();
  assert(!validate_options(o, err));
  assert(err.find("initial width") == 0);
}

static void test_apply_option() {
  ProgramOptions o;
  std::string msg;
  assert(apply_option(o, "set fps=30", msg) && o.fps == 30);
  assert(apply_option(o, ":set width 100", msg) && o.initial_width == 100);
  assert(apply_option(o, "  set title=My App  ", msg) && o.window_title == "My App");
  assert(apply_option(o, "set debug", msg) && o.debug);
  assert(apply_option(o, "set debug off", msg) && !o.debug);
  assert(apply_option(o, "# comment", msg));
  assert(apply_option(o, "\" vim style comment", msg));
  assert(apply_option(o, "// c style comment", msg));
  assert(apply_option(o, "", msg));

  assert(!apply_option(o, "set fps=fast", msg));
  assert(msg.find("number") != std::string::npos);
  assert(o.fps == 30);
  assert(!apply_option(o, "set colour=red", msg));
  assert(msg.find("unknown option") != std::string::npos);
  assert(!apply_option(o, "map q :quit", msg));
  assert(!apply_option(o, "set debug maybe", msg));
}

static void test_load_rc() {
  auto p = write_rc("# tealoop\r\nset fps=24\nset fontsize=0\nset bogus=1\nset height 40\n");
  ProgramOptions o;
  std::string msg;
  assert(!load_options_rc(p, o, msg));
  // good lines still apply
  assert(o.fps == 24);
  assert(o.initial_height == 40);
  assert(o.font_size == 0);
  assert(msg.find(":4:") != std::string::npos);
  std::string err;
  assert(!validate_options(o, err));
  std::filesystem::remove(p);

  ProgramOptions none;
  assert(!load_options_rc("/nonexistent/tealooprc", none, msg));
  assert(msg.find("can not open") != std::string::npos);
}

static void test_env_overrides() {
  ::setenv("TEALOOP_DEBUG", "1", 1);
  ::setenv("TEALOOP_FPS", "15", 1);
  ::setenv("TEALOOP_LOG", "/tmp/tealoop-test.log", 1);
  ProgramOptions o;
  options_from_env(o);
  assert(o.debug && o.fps == 15 && o.log_file == "/tmp/tealoop-test.log");
  ::setenv("TEALOOP_FPS", "abc", 1);
  ProgramOptions k;
  options_from_env(k);
  assert(k.fps == 60);
  ::unsetenv("TEALOOP_DEBUG");
  ::unsetenv("TEALOOP_FPS");
  ::unsetenv("TEALOOP_LOG");
}

static void test_make_logger() {
  ProgramOptions o;
  std::string msg;
  LoggerPtr quiet = make_logger(o, LogTarget::Silent, msg);
  assert(quiet && msg.empty());
  assert(quiet->level() == spdlog::level::info);

  o.debug = true;
  o.log_file = "/dev/null/tealoop.log"; // parent is not a directory
  LoggerPtr fallback = make_logger(o, LogTarget::Silent, msg);
  assert(fallback);
  assert(!msg.empty());
  assert(fallback->level() == spdlog::level::debug);

  auto path = std::filesystem::temp_directory_path() / ("tealoop_log_" + std::to_string(::getpid()));
  o.log_file = path.string();
  msg.clear();
  LoggerPtr file = make_logger(o, LogTarget::Stderr, msg);
  assert(msg.empty());
  file->warn("written to file");
  file->flush();
  assert(std::filesystem::file_size(path) > 0);
  std::filesystem::remove(path);
}

int main() {
  test_defaults_are_valid();
  test_validation_messages();
  test_apply_option();
  test_load_rc();
  test_env_overrides();
  test_make_logger();
  return 0;
}
