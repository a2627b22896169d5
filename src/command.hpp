#pragma once
/*
 * Command
 *
 * Purpose: deferred unit of work returned by Model::init/update.
 * Design: value type over an explicit variant; the executor dispatches on it.
 *   Run   - a Task object producing zero or one Msg
 *   Batch - sub-commands run concurrently, unordered
 *   Tick  - one message after an interval
 *   Every - one message per interval until cancelled
 *   Quit  - asks the runtime to terminate
 */
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <type_traits>
#include <variant>
#include <vector>
#include "messages.hpp"

class Task {
public:
  virtual ~Task() = default;
  virtual std::optional<Msg> run() = 0;
};

using Clock = std::chrono::steady_clock;
using TimerFn = std::function<Msg(std::chrono::system_clock::time_point)>;

class Command;

struct RunCmd { std::shared_ptr<Task> task; };
struct BatchCmd { std::vector<Command> cmds; };
struct TickCmd { Clock::duration interval{}; TimerFn fn; };
struct EveryCmd { Clock::duration interval{}; TimerFn fn; int id = 0; };
struct QuitCmd {};

class Command {
public:
  using Variant = std::variant<std::monostate, RunCmd, BatchCmd, TickCmd, EveryCmd, QuitCmd>;

  Command() = default;
  Command(RunCmd c) : v_(std::move(c)) {}
  Command(BatchCmd c) : v_(std::move(c)) {}
  Command(TickCmd c) : v_(std::move(c)) {}
  Command(EveryCmd c) : v_(std::move(c)) {}
  Command(QuitCmd c) : v_(c) {}

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(v_); }
  const Variant& variant() const { return v_; }
  // Registry id of an Every command, 0 otherwise.
  int timer_id() const;

private:
  Variant v_;
};

template <typename F>
class FnTask : public Task {
public:
  explicit FnTask(F f) : f_(std::move(f)) {}
  std::optional<Msg> run() override {
    using R = std::invoke_result_t<F&>;
    if constexpr (std::is_same_v<R, std::optional<Msg>>) return f_();
    else return Msg(f_());
  }
private:
  F f_;
};

template <typename F>
Command cmd(F f) { return Command(RunCmd{std::make_shared<FnTask<F>>(std::move(f))}); }

inline Command run(std::shared_ptr<Task> task) {
  if (!task) return Command();
  return Command(RunCmd{std::move(task)});
}

Command quit();
Command batch(std::vector<Command> cmds);
Command tick(Clock::duration d, TimerFn fn);
Command every(Clock::duration d, TimerFn fn);

template <typename... Cmds>
Command batch(Command first, Cmds... rest) {
  std::vector<Command> v;
  v.reserve(1 + sizeof...(rest));
  v.push_back(std::move(first));
  (v.push_back(std::move(rest)), ...);
  return batch(std::move(v));
}
