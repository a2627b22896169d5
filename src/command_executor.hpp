#pragma once
/*
 * CommandExecutor
 *
 * Purpose: run Commands concurrently and feed their messages into the MsgChannel.
 * Lifetime: every task is tracked as a future; shutdown() cancels and joins them all,
 * so no task outlives the executor and nothing is delivered after shutdown returns.
 * Faults: an exception from a command body becomes an ErrorMsg, never a crash.
 */
#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <vector>
#include "cancel_token.hpp"
#include "command.hpp"
#include "log.hpp"
#include "msg_channel.hpp"

class CommandExecutor {
public:
  CommandExecutor(MsgChannel& channel, const CancelToken& parent, LoggerPtr logger,
                  std::chrono::milliseconds send_timeout = std::chrono::milliseconds(TL_SEND_TIMEOUT_MS));
  ~CommandExecutor();
  CommandExecutor(const CommandExecutor&) = delete;
  CommandExecutor& operator=(const CommandExecutor&) = delete;

  void execute(Command cmd);
  // false when the message was dropped (stopped, cancelled or channel stayed full)
  bool deliver(Msg msg);
  void shutdown();

  bool cancel_timer(int id);
  size_t active_timers() const;
  size_t pending_tasks() const;
  bool stopping() const;

private:
  void run_task(const Command& cmd);
  void run_every(const EveryCmd& e);
  bool register_timer(uint64_t slot, int id, const CancelToken& token);
  void unregister_timer(uint64_t slot);

  struct Timer { int id; CancelToken token; };

  MsgChannel& channel_;
  CancelToken token_;
  LoggerPtr log_;
  std::chrono::milliseconds send_timeout_;

  mutable std::mutex mu_;
  bool stopping_ = false;
  std::vector<std::future<void>> tasks_;
  std::map<uint64_t, Timer> timers_;
  uint64_t next_slot_ = 1;
};
