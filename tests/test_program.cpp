#include "program.hpp"
#include "headless_terminal.hpp"
#include <cassert>
#include <chrono>
#include <climits>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

static bool eventually(const std::function<bool()>& pred, std::chrono::milliseconds t = 3000ms) {
  auto deadline = std::chrono::steady_clock::now() + t;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(2ms);
  }
  return pred();
}

static ProgramOptions test_options() {
  ProgramOptions o;
  o.window_title = "tealoop-test";
  o.fps = 120;
  return o;
}

struct Recorder : public Model {
  int count = 0;
  int quit_at = -1;
  int motions = 0;
  int mouse_x = -1;
  int mouse_y = -1;
  int width = 0;
  int height = 0;
  int updates = 0;
  std::string tags;
  std::string static_view;
  bool throw_in_init = false;
  bool throw_in_view = false;
  bool quit_on_init = false;
  Command init_cmd;

  Command init() override {
    if (throw_in_init) throw std::runtime_error("init boom");
    if (quit_on_init) return quit();
    return init_cmd;
  }

  Transition update(const Msg& msg) override {
    updates++;
    if (const auto* c = std::get_if<CustomMsg>(&msg)) {
      if (c->tag == "inc") {
        count++;
        if (count == quit_at) return stay(quit());
      } else if (c->tag == "boom") {
        throw std::runtime_error("update boom");
      } else if (c->tag == "swap") {
        auto next = std::make_shared<Recorder>(*this);
        next->count = count + 1000;
        return Transition{next, Command()};
      } else {
        tags += c->tag;
      }
    } else if (const auto* m = std::get_if<MouseMsg>(&msg)) {
      if (m->type == MouseEventType::Motion) { motions++; mouse_x = m->x; mouse_y = m->y; }
    } else if (const auto* w = std::get_if<WindowSizeMsg>(&msg)) {
      width = w->width;
      height = w->height;
    }
    return stay();
  }

  std::string view() const override {
    if (throw_in_view) throw std::logic_error("view boom");
    if (!static_view.empty()) return static_view;
    return "count: " + std::to_string(count) + "\n" + tags + "\n" +
           std::to_string(width) + "x" + std::to_string(height);
  }
};

// Runs a Program on its own thread against a headless surface.
struct Harness {
  HeadlessTerminal term;
  std::shared_ptr<Recorder> model;
  std::unique_ptr<Program> prog;
  std::shared_ptr<Model> final_model;
  std::string err;
  bool ok = false;
  std::thread th;

  explicit Harness(std::shared_ptr<Recorder> m, ProgramOptions o = test_options(), int cols = 20, int rows = 5)
    : term(cols, rows), model(std::move(m)) {
    prog = std::make_unique<Program>(model, o, term, &term, null_logger());
  }
  void start() { th = std::thread([this] { ok = prog->run(final_model, err); }); }
  void stop() {
    prog->quit();
    join();
  }
  void join() { if (th.joinable()) th.join(); }
  ~Harness() { if (th.joinable()) stop(); }
  std::shared_ptr<Recorder> result() const { return std::dynamic_pointer_cast<Recorder>(final_model); }
};

static void test_invalid_config_fails_before_start() {
  ProgramOptions o = test_options();
  o.fps = -1;
  HeadlessTerminal term(10, 3);
  Program p(std::make_shared<Recorder>(), o, term, &term, null_logger());
  std::shared_ptr<Model> out;
  std::string err;
  assert(!p.run(out, err));
  assert(err == "invalid configuration: FPS must be non-negative, got -1");
  assert(p.state() == Program::State::Terminated);
  assert(term.draws() == 0);
  assert(term.title().empty());

  o = test_options();
  o.window_title.clear();
  Program q(std::make_shared<Recorder>(), o, term, nullptr, null_logger());
  assert(!q.run(out, err));
  assert(err == "invalid configuration: window title cannot be empty");
}

static void test_init_update_view_cycle() {
  auto m = std::make_shared<Recorder>();
  m->init_cmd = cmd([] { return Msg(custom("inc", 0)); });
  Harness h(m);
  h.start();
  assert(eventually([&] { return h.term.row_text(0) == "count: 1"; }));
  assert(eventually([&] { return h.term.row_text(2) == "20x5"; }));
  assert(h.term.title() == "tealoop-test");
  assert(h.prog->state() == Program::State::Running);

  std::vector<std::thread> senders;
  for (int t = 0; t < 4; ++t)
    senders.emplace_back([&] { for (int i = 0; i < 25; ++i) h.prog->send(custom("inc", i)); });
  for (auto& s : senders) s.join();
  assert(eventually([&] { return h.term.row_text(0) == "count: 101"; }));

  h.stop();
  assert(h.ok);
  assert(h.prog->state() == Program::State::Terminated);
  assert(h.result() && h.result()->count == 101);
  assert(h.term.clears() >= 1);
  assert(h.term.row_text(0).empty());
}

static void test_updates_apply_in_order() {
  Harness h(std::make_shared<Recorder>());
  h.start();
  for (const char* t : {"a", "b", "c", "d"}) h.prog->send(custom(t, 0));
  assert(eventually([&] { return h.term.row_text(1) == "abcd"; }));
  h.prog->send(QuitMsg{});
  h.join();
  assert(h.ok);
  assert(h.result()->tags == "abcd");
}

static void test_model_replacement() {
  Harness h(std::make_shared<Recorder>());
  h.start();
  h.prog->send(custom("swap", 0));
  assert(eventually([&] { return h.term.row_text(0) == "count: 1000"; }));
  h.stop();
  assert(h.result() != h.model);
  assert(h.result()->count == 1000);
}

static void test_quit_command_from_update() {
  auto m = std::make_shared<Recorder>();
  m->quit_at = 3;
  Harness h(m);
  h.start();
  for (int i = 0; i < 3; ++i) h.prog->send(custom("inc", i));
  assert(eventually([&] { return h.prog->state() == Program::State::Terminated; }));
  h.join();
  assert(h.ok);
  assert(h.result()->count == 3);
  // messages after termination are dropped without blocking
  h.prog->send(custom("inc", 9));
  h.prog->quit();
}

static void test_quit_from_init() {
  auto m = std::make_shared<Recorder>();
  m->quit_on_init = true;
  HeadlessTerminal term(10, 3);
  Program p(m, test_options(), term, &term, null_logger());
  std::shared_ptr<Model> out;
  std::string err;
  assert(p.run(out, err));
  assert(p.state() == Program::State::Terminated);
  assert(out == m);
}

static void test_init_fault_quits() {
  auto m = std::make_shared<Recorder>();
  m->throw_in_init = true;
  HeadlessTerminal term(10, 3);
  Program p(m, test_options(), term, &term, null_logger());
  std::shared_ptr<Model> out;
  std::string err;
  assert(p.run(out, err));
  assert(err.empty());
  assert(m->updates == 0);
  assert(p.frames_rendered() == 0);
}

static void test_view_fault_quits() {
  auto m = std::make_shared<Recorder>();
  m->throw_in_view = true;
  HeadlessTerminal term(10, 3);
  Program p(m, test_options(), term, &term, null_logger());
  std::shared_ptr<Model> out;
  std::string err;
  assert(p.run(out, err));
  assert(p.state() == Program::State::Terminated);
}

static void test_update_fault_quits() {
  Harness h(std::make_shared<Recorder>());
  h.start();
  h.prog->send(custom("boom", 0));
  assert(eventually([&] { return h.prog->state() == Program::State::Terminated; }));
  h.join();
  assert(h.ok);
}

static void test_motion_is_coalesced() {
  Harness h(std::make_shared<Recorder>());
  h.term.push_motion(1, 1);
  h.term.push_motion(5, 2);
  h.term.push_motion(10, 3);
  h.start();
  assert(eventually([&] { return h.prog->frames_rendered() >= 1; }));
  std::this_thread::sleep_for(30ms);
  h.stop();
  auto r = h.result();
  assert(r->motions == 1);
  assert(r->mouse_x == 10 && r->mouse_y == 3);
}

static void test_unchanged_view_is_not_redrawn() {
  auto m = std::make_shared<Recorder>();
  m->static_view = "hello";
  ProgramOptions o = test_options();
  o.fps = 0;
  Harness h(m, o);
  h.start();
  assert(eventually([&] { return h.prog->frames_rendered() == 1; }));
  size_t draws = h.term.draws();
  size_t refreshes = h.term.refreshes();
  std::this_thread::sleep_for(60ms);
  assert(h.prog->frames_rendered() == 1);
  assert(h.term.refreshes() == refreshes);

  // a processed message forces a frame, but identical cells are not drawn again
  h.prog->send(custom("noop", 0));
  assert(eventually([&] { return h.prog->frames_rendered() == 2; }));
  assert(h.term.draws() == draws);
  assert(h.term.row_text(0) == "hello");
  h.stop();
}

static void test_partial_redraw_draws_changed_cells_only() {
  ProgramOptions o = test_options();
  o.fps = 0;
  Harness h(std::make_shared<Recorder>(), o);
  h.start();
  assert(eventually([&] { return h.term.row_text(0) == "count: 0"; }));
  size_t before = h.term.draws();
  h.prog->send(custom("inc", 0));
  assert(eventually([&] { return h.term.row_text(0) == "count: 1"; }));
  assert(h.term.draws() - before == 1);
  h.stop();
}

static void test_frame_cap_defers_render() {
  ProgramOptions o = test_options();
  o.fps = 1;
  Harness h(std::make_shared<Recorder>(), o);
  h.start();
  assert(eventually([&] { return h.prog->frames_rendered() == 1; }));
  h.prog->send(custom("inc", 0));
  std::this_thread::sleep_for(100ms);
  assert(h.prog->frames_rendered() == 1);
  assert(h.term.row_text(0) == "count: 0");
  assert(eventually([&] { return h.term.row_text(0) == "count: 1"; }));
  assert(h.prog->frames_rendered() == 2);
  h.stop();
}

static void test_resize_forces_full_redraw() {
  Harness h(std::make_shared<Recorder>());
  h.start();
  assert(eventually([&] { return h.term.row_text(2) == "20x5"; }));
  size_t clears = h.term.clears();
  h.term.resize(30, 6);
  assert(eventually([&] { return h.term.row_text(2) == "30x6"; }));
  assert(h.term.clears() > clears);
  h.stop();
  assert(h.result()->width == 30 && h.result()->height == 6);
}

static void test_render_fault_skips_frame() {
  Harness h(std::make_shared<Recorder>());
  h.term.set_fail_draws(true);
  h.start();
  std::this_thread::sleep_for(50ms);
  assert(h.prog->frames_rendered() == 0);
  assert(h.prog->state() == Program::State::Running);
  h.term.set_fail_draws(false);
  h.prog->send(custom("inc", 0));
  assert(eventually([&] { return h.term.row_text(0) == "count: 1"; }));
  assert(h.prog->frames_rendered() >= 1);
  h.stop();
  assert(h.ok);
}

static void test_commands_stop_with_program() {
  auto m = std::make_shared<Recorder>();
  m->init_cmd = every(5ms, [](std::chrono::system_clock::time_point) { return Msg(custom("inc", 0)); });
  Harness h(m);
  h.start();
  assert(eventually([&] { return h.term.row_text(0) != "count: 0" && !h.term.row_text(0).empty(); }));
  auto t0 = std::chrono::steady_clock::now();
  h.stop();
  assert(std::chrono::steady_clock::now() - t0 < 2s);
  int final_count = h.result()->count;
  std::this_thread::sleep_for(30ms);
  assert(h.result()->count == final_count);
}

static void test_input_burst_never_blocks_the_loop() {
  ProgramOptions o = test_options();
  o.channel_capacity = 10;
  Harness h(std::make_shared<Recorder>(), o);
  // one slot holds the initial WindowSizeMsg; input beyond the rest is dropped
  for (int i = 0; i < 30; ++i) h.term.push(custom("inc", i));
  auto t0 = std::chrono::steady_clock::now();
  h.start();
  assert(eventually([&] { return h.term.row_text(0) == "count: 9"; }, 500ms));
  assert(std::chrono::steady_clock::now() - t0 < 500ms);
  std::this_thread::sleep_for(30ms);
  assert(h.term.row_text(0) == "count: 9");
  h.stop();
  assert(h.result()->count == 9);
}

static void test_burst_then_quit_ends_promptly() {
  ProgramOptions o = test_options();
  HeadlessTerminal term(10, 3);
  for (int i = 0; i < o.channel_capacity + 4; ++i) term.push(KeyMsg{});
  term.push_quit();
  Program p(std::make_shared<Recorder>(), o, term, &term, null_logger());
  std::shared_ptr<Model> out;
  std::string err;
  auto t0 = std::chrono::steady_clock::now();
  assert(p.run(out, err));
  assert(std::chrono::steady_clock::now() - t0 < 500ms);
  assert(p.state() == Program::State::Terminated);
}

static void test_oversized_window_skips_frames() {
  ProgramOptions o = test_options();
  o.fps = 0;
  Harness h(std::make_shared<Recorder>(), o);
  h.start();
  assert(eventually([&] { return h.term.row_text(2) == "20x5"; }));
  size_t frames = h.prog->frames_rendered();
  h.prog->send(WindowSizeMsg{INT_MAX, INT_MAX});
  std::this_thread::sleep_for(50ms);
  assert(h.prog->state() == Program::State::Running);
  assert(h.prog->frames_rendered() == frames);
  h.prog->send(WindowSizeMsg{12, 4});
  assert(eventually([&] { return h.term.row_text(2) == "12x4"; }));
  h.stop();
  assert(h.ok);
}

int main() {
  test_invalid_config_fails_before_start();
  test_init_update_view_cycle();
  test_updates_apply_in_order();
  test_model_replacement();
  test_quit_command_from_update();
  test_quit_from_init();
  test_init_fault_quits();
  test_view_fault_quits();
  test_update_fault_quits();
  test_motion_is_coalesced();
  test_unchanged_view_is_not_redrawn();
  test_partial_redraw_draws_changed_cells_only();
  test_frame_cap_defers_render();
  test_resize_forces_full_redraw();
  test_render_fault_skips_frame();
  test_commands_stop_with_program();
  test_input_burst_never_blocks_the_loop();
  test_burst_then_quit_ends_promptly();
  test_oversized_window_skips_frames();
  return 0;
}
