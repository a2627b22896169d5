#include "command.hpp"
#include <atomic>

static std::atomic<int> g_next_timer_id{1};

int Command::timer_id() const {
  if (auto* e = std::get_if<EveryCmd>(&v_)) return e->id;
  return 0;
}

Command quit() { return Command(QuitCmd{}); }

Command batch(std::vector<Command> cmds) {
  std::vector<Command> valid;
  valid.reserve(cmds.size());
  for (auto& c : cmds) if (c) valid.push_back(std::move(c));
  if (valid.empty()) return Command();
  if (valid.size() == 1) return std::move(valid.front());
  return Command(BatchCmd{std::move(valid)});
}

Command tick(Clock::duration d, TimerFn fn) {
  if (!fn) return Command();
  return Command(TickCmd{d, std::move(fn)});
}

Command every(Clock::duration d, TimerFn fn) {
  if (!fn) return Command();
  return Command(EveryCmd{d, std::move(fn), g_next_timer_id.fetch_add(1)});
}
