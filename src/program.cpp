#include "program.hpp"
#include <algorithm>
#include <exception>
#include <optional>
#include <vector>
#include "ansi_parser.hpp"

// Loop wake-up period when the frame rate is uncapped.
static constexpr std::chrono::milliseconds kIdleWait{10};

static const char* state_name(Program::State s) {
  switch (s) {
    case Program::State::Starting: return "starting";
    case Program::State::Running: return "running";
    case Program::State::Terminating: return "terminating";
    case Program::State::Terminated: return "terminated";
  }
  return "?";
}

Program::Program(std::shared_ptr<Model> model,
                 ProgramOptions options,
                 ITerminal& surface,
                 IEventSource* events,
                 LoggerPtr logger)
  : model_(std::move(model)),
    opts_(std::move(options)),
    surface_(surface),
    events_(events),
    log_(logger ? std::move(logger) : null_logger()),
    channel_(static_cast<size_t>(std::max(1, opts_.channel_capacity))) {}

Program::~Program() {
  root_.cancel();
  if (exec_) exec_->shutdown();
}

template <typename F>
bool Program::guarded(const char* what, F&& f) {
  try {
    f();
    return true;
  } catch (const std::exception& e) {
    log_->error("fault in {}: {}", what, e.what());
  } catch (...) {
    log_->error("fault in {}: non-standard exception", what);
  }
  return false;
}

bool Program::run(std::shared_ptr<Model>& final_model, std::string& err) {
  std::string why;
  if (!validate_options(opts_, why)) {
    err = "invalid configuration: " + why;
    state_ = State::Terminated;
    return false;
  }
  if (!model_) {
    err = "invalid configuration: model is null";
    state_ = State::Terminated;
    return false;
  }

  log_->info("starting {}", opts_.window_title);
  log_->debug("options: {}x{} cells, fps {}, channel {}, send timeout {}ms",
              opts_.initial_width, opts_.initial_height, opts_.fps,
              opts_.channel_capacity, opts_.send_timeout_ms);

  surface_.set_title(opts_.window_title);
  exec_ = std::make_unique<CommandExecutor>(channel_, root_, log_,
                                            std::chrono::milliseconds(opts_.send_timeout_ms));

  TermSize sz = surface_.size();
  {
    std::lock_guard<std::mutex> lk(update_mu_);
    width_ = sz.cols > 0 ? sz.cols : opts_.initial_width;
    height_ = sz.rows > 0 ? sz.rows : opts_.initial_height;
  }
  if (!channel_.try_send(WindowSizeMsg{width_, height_}))
    log_->warn("message channel full, dropping initial WindowSizeMsg");

  Command init_cmd;
  {
    std::lock_guard<std::mutex> lk(update_mu_);
    if (!guarded("init", [&] { init_cmd = model_->init(); })) quit();
  }
  exec_->execute(std::move(init_cmd));

  State expected = State::Starting;
  state_.compare_exchange_strong(expected, State::Running);
  log_->debug("state: {}", state_name(state_.load()));

  const auto interval = frame_interval();
  while (!quit_requested_.load()) {
    if (events_) events_->pump(*this, 0);
    if (quit_requested_.load()) break;
    channel_.wait(interval);
    if (!tick()) break;
  }

  terminate();
  final_model = model();
  log_->info("exited after {} frames", frames_.load());
  return true;
}

void Program::terminate() {
  state_ = State::Terminating;
  log_->debug("state: {}", state_name(state_.load()));
  quit_requested_ = true;
  root_.cancel();
  if (exec_) exec_->shutdown();
  if (!guarded("clear", [&] { surface_.clear(); surface_.refresh(); }))
    log_->warn("surface clear failed during shutdown");
  state_ = State::Terminated;
  log_->debug("state: {}", state_name(state_.load()));
}

std::chrono::steady_clock::duration Program::frame_interval() const {
  if (opts_.fps <= 0) return kIdleWait;
  return std::chrono::duration_cast<std::chrono::steady_clock::duration>(std::chrono::seconds(1)) / opts_.fps;
}

void Program::send(Msg msg) {
  if (root_.cancelled()) {
    log_->debug("program stopped, dropping {}", describe(msg));
    return;
  }
  if (!channel_.send(std::move(msg), root_, std::chrono::milliseconds(opts_.send_timeout_ms))) {
    if (!root_.cancelled()) log_->warn("message channel full, dropping message");
    return;
  }
  schedule_redraw();
}

void Program::post(Msg msg) {
  if (root_.cancelled()) return;
  std::string what = describe(msg);
  if (!channel_.try_send(std::move(msg))) {
    log_->warn("message channel full, dropping {}", what);
    return;
  }
  schedule_redraw();
}

void Program::post_motion(int x, int y) {
  bool was_pending = false;
  {
    std::lock_guard<std::mutex> lk(motion_mu_);
    was_pending = motion_pending_;
    motion_pending_ = true;
    motion_x_ = x;
    motion_y_ = y;
  }
  if (!was_pending) schedule_redraw();
}

void Program::quit() {
  if (quit_requested_.exchange(true)) return;
  log_->info("quit requested");
  root_.cancel();
  channel_.wake();
}

void Program::schedule_redraw() { channel_.wake(); }

std::shared_ptr<Model> Program::model() const {
  std::lock_guard<std::mutex> lk(update_mu_);
  return model_;
}

bool Program::apply(const Msg& msg) {
  if (const auto* ws = std::get_if<WindowSizeMsg>(&msg)) {
    if (ws->width != width_ || ws->height != height_) {
      log_->debug("resize {}x{} -> {}x{}", width_, height_, ws->width, ws->height);
      width_ = ws->width;
      height_ = ws->height;
      force_full_ = true;
    }
  }
  log_->debug("update: {}", describe(msg));
  Transition t;
  if (!guarded("update", [&] { t = model_->update(msg); })) {
    quit();
    return false;
  }
  if (t.model) model_ = std::move(t.model);
  exec_->execute(std::move(t.cmd));
  return true;
}

bool Program::tick() {
  std::lock_guard<std::mutex> lk(update_mu_);

  std::optional<MouseMsg> motion;
  {
    std::lock_guard<std::mutex> mlk(motion_mu_);
    if (motion_pending_) {
      motion = MouseMsg{motion_x_, motion_y_, MouseEventType::Motion, MouseButton::None};
      motion_pending_ = false;
    }
  }
  if (motion && !apply(*motion)) return false;

  bool had_messages = false;
  std::vector<Msg> pending;
  while (auto m = channel_.try_recv()) {
    had_messages = true;
    if (is_quit(*m)) {
      log_->info("quit message received");
      quit();
      return false;
    }
    pending.push_back(std::move(*m));
  }
  for (const auto& m : pending) {
    if (!apply(m)) return false;
  }

  render_frame(had_messages || frame_owed_);

  bool more_motion = false;
  {
    std::lock_guard<std::mutex> mlk(motion_mu_);
    more_motion = motion_pending_;
  }
  if (motion && more_motion) schedule_redraw();
  return !quit_requested_.load();
}

void Program::render_frame(bool had_messages) {
  auto now = std::chrono::steady_clock::now();
  if (opts_.fps > 0 && rendered_once_ && now - last_render_ < frame_interval()) {
    if (had_messages) frame_owed_ = true;
    log_->debug("frame skipped: frame cap");
    return;
  }

  std::string view;
  if (!guarded("view", [&] { view = model_->view(); })) {
    view.clear();
    quit();
  }

  if (view == last_view_ && !last_view_.empty() && !had_messages && !force_full_) return;

  Grid grid;
  if (!guarded("parse", [&] { grid = parse_ansi(view, width_, height_); })) {
    log_->warn("cannot build a {}x{} grid, skipping frame", width_, height_);
    return;
  }
  if (grid.empty()) {
    log_->warn("empty grid for {}x{}, skipping render", width_, height_);
    return;
  }

  bool full = force_full_ || !rendered_once_ ||
              prev_grid_.width() != grid.width() || prev_grid_.height() != grid.height();
  std::vector<Region> regions;
  if (!full) regions = diff(prev_grid_, grid);

  std::string msg;
  bool ok = false;
  if (!guarded("render", [&] { ok = renderer_.render(surface_, grid, regions, full, msg); })) {
    msg = "surface fault";
  }
  if (!ok) {
    log_->warn("render failed: {}, skipping frame", msg);
    return;
  }

  log_->debug("rendered frame: {} region(s){}", regions.size(), full ? " (full)" : "");
  prev_grid_ = std::move(grid);
  last_view_ = std::move(view);
  last_render_ = now;
  rendered_once_ = true;
  force_full_ = false;
  frame_owed_ = false;
  frames_.fetch_add(1);
}
