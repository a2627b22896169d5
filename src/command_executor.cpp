#include "command_executor.hpp"
#include <algorithm>
#include <exception>
#include <system_error>

static bool is_ready(const std::future<void>& f) {
  return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

CommandExecutor::CommandExecutor(MsgChannel& channel, const CancelToken& parent, LoggerPtr logger,
                                 std::chrono::milliseconds send_timeout)
  : channel_(channel), token_(parent.child()), log_(logger ? std::move(logger) : null_logger()),
    send_timeout_(send_timeout) {}

CommandExecutor::~CommandExecutor() { shutdown(); }

void CommandExecutor::execute(Command cmd) {
  if (!cmd) return;
  std::lock_guard<std::mutex> lk(mu_);
  if (stopping_) {
    log_->debug("executor stopping, command ignored");
    return;
  }
  tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(), is_ready), tasks_.end());
  try {
    tasks_.push_back(std::async(std::launch::async, [this, c = std::move(cmd)] { run_task(c); }));
  } catch (const std::system_error& e) {
    log_->error("can not start command task: {}", e.what());
  }
}

bool CommandExecutor::deliver(Msg msg) {
  if (stopping() || token_.cancelled()) return false;
  if (channel_.send(std::move(msg), token_, send_timeout_)) return true;
  if (!token_.cancelled())
    log_->warn("message channel full for {}ms, dropping message", send_timeout_.count());
  return false;
}

void CommandExecutor::run_task(const Command& cmd) {
  try {
    std::visit([this](const auto& c) {
      using T = std::decay_t<decltype(c)>;
      if constexpr (std::is_same_v<T, RunCmd>) {
        if (auto m = c.task->run()) deliver(std::move(*m));
      } else if constexpr (std::is_same_v<T, BatchCmd>) {
        for (const auto& sub : c.cmds) execute(sub);
      } else if constexpr (std::is_same_v<T, TickCmd>) {
        if (token_.wait_for(c.interval)) return;
        deliver(c.fn(std::chrono::system_clock::now()));
      } else if constexpr (std::is_same_v<T, EveryCmd>) {
        run_every(c);
      } else if constexpr (std::is_same_v<T, QuitCmd>) {
        deliver(QuitMsg{});
      }
    }, cmd.variant());
  } catch (const std::exception& e) {
    log_->error("command failed: {}", e.what());
    deliver(ErrorMsg{e.what()});
  } catch (...) {
    log_->error("command failed with a non-standard exception");
    deliver(ErrorMsg{"unknown error in command"});
  }
}

void CommandExecutor::run_every(const EveryCmd& e) {
  CancelToken timer = token_.child();
  uint64_t slot = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    slot = next_slot_++;
  }
  if (!register_timer(slot, e.id, timer)) return;
  struct Unregister {
    CommandExecutor* self; uint64_t slot;
    ~Unregister() { self->unregister_timer(slot); }
  } guard{this, slot};
  log_->debug("timer {} started, interval {}ms", e.id,
              std::chrono::duration_cast<std::chrono::milliseconds>(e.interval).count());
  // Ticks follow a fixed schedule; a tick missed while delivering is skipped, not queued.
  using steady = std::chrono::steady_clock;
  const auto period = std::chrono::duration_cast<steady::duration>(e.interval);
  auto next = steady::now() + period;
  while (!timer.wait_for(std::max(steady::duration::zero(), next - steady::now()))) {
    deliver(e.fn(std::chrono::system_clock::now()));
    if (period <= steady::duration::zero()) continue;
    auto now = steady::now();
    next += period;
    while (next <= now) next += period;
  }
  log_->debug("timer {} stopped", e.id);
}

bool CommandExecutor::register_timer(uint64_t slot, int id, const CancelToken& token) {
  std::lock_guard<std::mutex> lk(mu_);
  if (stopping_) return false;
  timers_.emplace(slot, Timer{id, token});
  return true;
}

void CommandExecutor::unregister_timer(uint64_t slot) {
  std::lock_guard<std::mutex> lk(mu_);
  timers_.erase(slot);
}

bool CommandExecutor::cancel_timer(int id) {
  std::vector<CancelToken> hit;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [slot, t] : timers_) if (t.id == id) hit.push_back(t.token);
  }
  for (const auto& t : hit) t.cancel();
  return !hit.empty();
}

size_t CommandExecutor::active_timers() const {
  std::lock_guard<std::mutex> lk(mu_);
  return timers_.size();
}

size_t CommandExecutor::pending_tasks() const {
  std::lock_guard<std::mutex> lk(mu_);
  return static_cast<size_t>(std::count_if(tasks_.begin(), tasks_.end(),
                                           [](const std::future<void>& f) { return !is_ready(f); }));
}

bool CommandExecutor::stopping() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stopping_;
}

void CommandExecutor::shutdown() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopping_ && tasks_.empty()) return;
    stopping_ = true;
  }
  token_.cancel();
  for (;;) {
    std::vector<std::future<void>> batch;
    {
      std::lock_guard<std::mutex> lk(mu_);
      batch.swap(tasks_);
    }
    if (batch.empty()) break;
    for (auto& f : batch) f.wait();
  }
  log_->debug("executor shut down");
}
