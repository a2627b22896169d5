#include "config.hpp"
#include "cmd_registry.hpp"
#include "file_reader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

static bool parse_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  size_t i = (s[0] == '-') ? 1 : 0;
  if (i == s.size()) return false;
  if (!std::all_of(s.begin() + i, s.end(), [](unsigned char c){ return std::isdigit(c) != 0; })) return false;
  try { out = std::stoi(s); } catch (const std::out_of_range&) { return false; }
  return true;
}

static bool parse_switch(const std::string& s, bool& out) {
  if (s == "on" || s == "true" || s == "1") { out = true; return true; }
  if (s == "off" || s == "false" || s == "0") { out = false; return true; }
  return false;
}

static std::string join(const std::vector<std::string>& args) {
  std::string s;
  for (size_t i = 0; i < args.size(); ++i) { if (i) s += ' '; s += args[i]; }
  return s;
}

static CommandRegistry make_registry(ProgramOptions& o) {
  CommandRegistry r;
  auto int_opt = [&r](const std::string& name, int& field) {
    r.register_command("set " + name, [name, &field](const std::vector<std::string>& args, std::string& msg) {
      if (args.empty()) { msg = "set " + name + ": use :set " + name + "=<number>"; return false; }
      int v = 0;
      if (!parse_int(args[0], v)) { msg = "set " + name + ": value must be a number"; return false; }
      field = v;
      return true;
    });
  };
  auto str_opt = [&r](const std::string& name, std::string& field) {
    r.register_command("set " + name, [name, &field](const std::vector<std::string>& args, std::string& msg) {
      if (args.empty()) { msg = "set " + name + ": missing value"; return false; }
      field = join(args);
      return true;
    });
  };
  str_opt("title", o.window_title);
  int_opt("width", o.initial_width);
  int_opt("height", o.initial_height);
  str_opt("font", o.font_family);
  int_opt("fontsize", o.font_size);
  int_opt("fps", o.fps);
  int_opt("capacity", o.channel_capacity);
  int_opt("sendtimeout", o.send_timeout_ms);
  str_opt("logfile", o.log_file);
  r.register_command("set debug", [&o](const std::vector<std::string>& args, std::string& msg) {
    if (args.empty()) { o.debug = !o.debug; return true; }
    if (!parse_switch(args[0], o.debug)) { msg = "set debug: use :set debug on|off"; return false; }
    return true;
  });
  return r;
}

bool validate_options(const ProgramOptions& opts, std::string& err) {
  if (opts.initial_width <= 0) { err = "initial width must be positive, got " + std::to_string(opts.initial_width); return false; }
  if (opts.initial_height <= 0) { err = "initial height must be positive, got " + std::to_string(opts.initial_height); return false; }
  if (opts.font_size <= 0) { err = "font size must be positive, got " + std::to_string(opts.font_size); return false; }
  if (opts.fps < 0) { err = "FPS must be non-negative, got " + std::to_string(opts.fps); return false; }
  if (opts.channel_capacity <= 0) { err = "channel capacity must be positive, got " + std::to_string(opts.channel_capacity); return false; }
  if (opts.send_timeout_ms < 0) { err = "send timeout must be non-negative, got " + std::to_string(opts.send_timeout_ms); return false; }
  if (opts.window_title.empty()) { err = "window title cannot be empty"; return false; }
  if (opts.font_family.empty()) { err = "font family cannot be empty"; return false; }
  return true;
}

bool apply_option(ProgramOptions& opts, const std::string& line, std::string& msg) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  std::string s = line;
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  s = (j > i) ? s.substr(i, j - i) : std::string();
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s.erase(s.begin());

  std::istringstream iss(s);
  std::string cmd; iss >> cmd;
  std::vector<std::string> args; std::string a; while (iss >> a) args.push_back(a);
  if (cmd != "set" || args.empty()) { msg = "unknown directive: " + s; return false; }
  std::string name = args[0];
  std::string value;
  size_t eq = name.find('=');
  if (eq != std::string::npos) {
    value = name.substr(eq + 1);
    name = name.substr(0, eq);
  }
  std::vector<std::string> subargs;
  if (!value.empty()) subargs.push_back(value);
  for (size_t k = 1; k < args.size(); ++k) subargs.push_back(args[k]);
  CommandRegistry registry = make_registry(opts);
  return registry.execute("set " + name, subargs, msg);
}

bool load_options_rc(const std::filesystem::path& path, ProgramOptions& opts, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  bool ok = true;
  std::string errors;
  for (size_t n = 0; n < lines.size(); ++n) {
    std::string m;
    if (!apply_option(opts, lines[n], m)) {
      ok = false;
      if (!errors.empty()) errors += "; ";
      errors += path.filename().string() + ":" + std::to_string(n + 1) + ": " + m;
    }
  }
  if (!ok) msg = errors;
  return ok;
}

void options_from_env(ProgramOptions& opts) {
  if (const char* d = std::getenv("TEALOOP_DEBUG"); d && *d) opts.debug = true;
  if (const char* l = std::getenv("TEALOOP_LOG"); l && *l) opts.log_file = l;
  if (const char* f = std::getenv("TEALOOP_FPS"); f && *f) {
    int v = 0;
    if (parse_int(f, v)) opts.fps = v;
  }
}

std::filesystem::path default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home) return {};
  return std::filesystem::path(home) / TL_RC_NAME;
}
