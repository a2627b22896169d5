#pragma once
/*
 * CancelToken
 *
 * Purpose: cooperative, hierarchical cancellation shared by runtime, executor and timers.
 * Usage: tasks check cancelled() or sleep through wait_for(); cancelling a token
 * cancels every child and wakes every waiter. Nothing is ever force-killed.
 */
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <vector>

class CancelToken {
public:
  CancelToken();

  void cancel() const;
  bool cancelled() const;
  // true if the token fired before `d` elapsed
  bool wait_for(std::chrono::steady_clock::duration d) const;
  CancelToken child() const;

private:
  struct State {
    mutable std::mutex mu;
    std::condition_variable cv;
    bool cancelled = false;
    std::vector<std::weak_ptr<State>> children;
  };
  explicit CancelToken(std::shared_ptr<State> s) : s_(std::move(s)) {}
  static void cancel_state(const std::shared_ptr<State>& s);

  std::shared_ptr<State> s_;
};
