#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal + IEventSource for tests and headless runs.
 * Records: every drawn cell (into its own Grid), draw/refresh/clear counts, the title.
 * Events: scripted messages/motion/quit are handed to the sink on the next pump().
 */
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include "grid.hpp"
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal, public IEventSource {
public:
  HeadlessTerminal(int cols, int rows);

  TermSize size() const override;
  void clear() override;
  void draw_cell(int row, int col, const Cell& cell) override;
  void refresh() override;
  void set_title(const std::string& title) override;

  void pump(EventSink& sink, int timeout_ms) override;

  void push(Msg msg);
  void push_motion(int x, int y);
  void push_quit();
  // Changes the reported size and queues the matching WindowSizeMsg.
  void resize(int cols, int rows);
  // While set, draw_cell throws std::runtime_error.
  void set_fail_draws(bool fail);

  // Copy of the recorded cell; nullopt outside the surface.
  std::optional<Cell> cell(int row, int col) const;
  std::string row_text(int row) const; // UTF-8, trailing blanks trimmed
  std::string title() const;
  size_t draws() const;
  size_t refreshes() const;
  size_t clears() const;
  void reset_counters();

private:
  mutable std::mutex mu_;
  Grid screen_;
  std::string title_;
  size_t draws_ = 0;
  size_t refreshes_ = 0;
  size_t clears_ = 0;
  bool fail_draws_ = false;
  std::deque<std::function<void(EventSink&)>> script_;
};
