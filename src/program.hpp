#pragma once
/*
 * Program
 *
 * Purpose: the runtime. Owns the message channel, the command executor and the
 * previous frame; drives Model init/update/view and pushes changed cells to the surface.
 *
 * Loop: pump input -> wait for a message, a redraw request or one frame interval -> tick.
 * Tick: pending motion, then queued messages (QuitMsg stops at once), then the frame
 *       cap, then view/parse/diff/render.
 * Faults: init/update/view exceptions are logged and end the program in order;
 *         render faults skip the frame.
 */
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include "cancel_token.hpp"
#include "command_executor.hpp"
#include "config.hpp"
#include "grid.hpp"
#include "iterminal.hpp"
#include "log.hpp"
#include "model.hpp"
#include "msg_channel.hpp"
#include "renderer.hpp"

class Program : public EventSink {
public:
  enum class State { Starting, Running, Terminating, Terminated };

  Program(std::shared_ptr<Model> model,
          ProgramOptions options,
          ITerminal& surface,
          IEventSource* events = nullptr,
          LoggerPtr logger = nullptr);
  ~Program() override;
  Program(const Program&) = delete;
  Program& operator=(const Program&) = delete;

  // Blocks until quit. false (with err) only for configuration errors.
  bool run(std::shared_ptr<Model>& final_model, std::string& err);

  void send(Msg msg) override;
  void post(Msg msg) override;
  void post_motion(int x, int y) override;
  void quit() override;
  void schedule_redraw();

  State state() const { return state_.load(); }
  std::shared_ptr<Model> model() const;
  size_t frames_rendered() const { return frames_.load(); }

private:
  bool tick();
  bool apply(const Msg& msg);
  void render_frame(bool had_messages);
  std::chrono::steady_clock::duration frame_interval() const;
  void terminate();

  template <typename F>
  bool guarded(const char* what, F&& f);

  std::shared_ptr<Model> model_;
  ProgramOptions opts_;
  ITerminal& surface_;
  IEventSource* events_;
  LoggerPtr log_;

  MsgChannel channel_;
  CancelToken root_;
  std::unique_ptr<CommandExecutor> exec_;
  Renderer renderer_;

  mutable std::mutex update_mu_;
  int width_ = 0;
  int height_ = 0;
  Grid prev_grid_;
  std::string last_view_;
  bool force_full_ = true;
  bool frame_owed_ = false;
  bool rendered_once_ = false;
  std::chrono::steady_clock::time_point last_render_{};

  std::mutex motion_mu_;
  bool motion_pending_ = false;
  int motion_x_ = 0;
  int motion_y_ = 0;

  std::atomic<State> state_{State::Starting};
  std::atomic<bool> quit_requested_{false};
  std::atomic<size_t> frames_{0};
};
