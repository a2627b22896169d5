#include "terminal.hpp"
#include "ncurses_terminal.hpp"
#include "input.hpp"
#include "program.hpp"
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>

using namespace std::chrono_literals;

// Stopwatch: enter starts/stops, backspace resets, q/esc/ctrl+c quits.
class Stopwatch : public Model {
public:
  Transition update(const Msg& msg) override {
    if (const auto* k = std::get_if<KeyMsg>(&msg)) return on_key(*k);
    if (const auto* t = std::get_if<TickMsg>(&msg)) {
      if (!running_ || t->id != generation_) return stay();
      elapsed_ += std::chrono::duration_cast<std::chrono::milliseconds>(t->time - last_);
      last_ = t->time;
      return stay(next_tick());
    }
    if (const auto* w = std::get_if<WindowSizeMsg>(&msg)) { width_ = w->width; height_ = w->height; }
    if (const auto* m = std::get_if<MouseMsg>(&msg)) { mouse_x_ = m->x; mouse_y_ = m->y; }
    if (const auto* e = std::get_if<ErrorMsg>(&msg)) status_ = e->what;
    return stay();
  }

  std::string view() const override {
    long long ms = elapsed_.count();
    char clock[32];
    std::snprintf(clock, sizeof(clock), "%02lld:%02lld.%02lld", ms / 60000, (ms / 1000) % 60, (ms / 10) % 100);
    std::string v;
    v += "\x1b[1;38;2;95;175;255mtealoop stopwatch\x1b[0m\n\n";
    v += "  ";
    v += running_ ? "\x1b[1;32m" : "\x1b[1;33m";
    v += clock;
    v += "\x1b[0m  ";
    v += running_ ? "running" : "stopped";
    v += "\n\n\x1b[2;37m  enter start/stop   backspace reset   q quit\x1b[0m\n";
    v += "\x1b[90m  " + std::to_string(width_) + "x" + std::to_string(height_) +
         "  mouse " + std::to_string(mouse_x_) + "," + std::to_string(mouse_y_) + "\x1b[0m";
    if (!status_.empty()) v += "\n\x1b[31m  " + status_ + "\x1b[0m";
    return v;
  }

private:
  Transition on_key(const KeyMsg& k) {
    if (k.type == KeyType::CtrlC || k.type == KeyType::Esc || k.str() == "q") return stay(quit());
    if (k.type == KeyType::Enter) {
      running_ = !running_;
      generation_++;
      if (!running_) return stay();
      last_ = std::chrono::system_clock::now();
      return stay(next_tick());
    }
    if (k.type == KeyType::Backspace) {
      elapsed_ = 0ms;
      last_ = std::chrono::system_clock::now();
    }
    return stay();
  }

  Command next_tick() const {
    int gen = generation_;
    return tick(10ms, [gen](std::chrono::system_clock::time_point t) { return Msg(TickMsg{t, gen}); });
  }

  bool running_ = false;
  int generation_ = 0;
  std::chrono::milliseconds elapsed_{0};
  std::chrono::system_clock::time_point last_{};
  int width_ = 0;
  int height_ = 0;
  int mouse_x_ = 0;
  int mouse_y_ = 0;
  std::string status_;
};

int main() {
  ProgramOptions opts;
  opts.window_title = "tealoop stopwatch";
  std::string msg;
  std::filesystem::path rc = default_rc_path();
  std::error_code ec;
  if (!rc.empty() && std::filesystem::exists(rc, ec)) {
    if (!load_options_rc(rc, opts, msg)) { std::cerr << msg << "\n"; return 1; }
  }
  options_from_env(opts);

  std::string err;
  if (!validate_options(opts, err)) {
    std::cerr << "invalid configuration: " << err << "\n";
    return 1;
  }
  std::string log_msg;
  LoggerPtr logger = make_logger(opts, LogTarget::Silent, log_msg);
  if (!log_msg.empty()) std::cerr << log_msg << "\n";

  std::shared_ptr<Model> final_model;
  bool ok = false;
  {
    Terminal term;
    NcursesTerminal surface;
    NcursesInput input;
    Program program(std::make_shared<Stopwatch>(), opts, surface, &input, logger);
    ok = program.run(final_model, err);
  }
  if (!ok) {
    std::cerr << err << "\n";
    return 1;
  }
  return 0;
}
