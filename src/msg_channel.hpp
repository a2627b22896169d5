#pragma once
/*
 * MsgChannel
 *
 * Purpose: bounded multi-producer FIFO feeding the runtime's update loop.
 * Note: producers never block forever; send() gives up on cancellation or timeout
 * and the caller decides whether to log the drop.
 */
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include "cancel_token.hpp"
#include "messages.hpp"

class MsgChannel {
public:
  explicit MsgChannel(size_t capacity = 100);

  bool try_send(Msg msg);
  bool send(Msg msg, const CancelToken& token, std::chrono::steady_clock::duration timeout);
  std::optional<Msg> try_recv();
  // Blocks until a message is queued, wake() is called, or `timeout` passes.
  bool wait(std::chrono::steady_clock::duration timeout);
  void wake();

  size_t size() const;
  size_t capacity() const { return capacity_; }

private:
  mutable std::mutex mu_;
  std::condition_variable readable_;
  std::condition_variable writable_;
  std::deque<Msg> q_;
  size_t capacity_;
  bool woken_ = false;
};
