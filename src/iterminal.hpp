#pragma once
/*
 * ITerminal / IEventSource
 *
 * Purpose: the two seams between the runtime and the outside world.
 * ITerminal is the drawing surface (ncurses, headless, ...); IEventSource pumps
 * external input into an EventSink, which the Program implements.
 */
#include <string>
#include "messages.hpp"
#include "types.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize size() const = 0;
  virtual void clear() = 0;
  virtual void draw_cell(int row, int col, const Cell& cell) = 0;
  virtual void refresh() = 0;
  virtual void set_title(const std::string& title) = 0;
};

class EventSink {
public:
  virtual ~EventSink() = default;
  // Blocking send for producers off the loop thread; bounded by the send timeout.
  virtual void send(Msg msg) = 0;
  // Never blocks; input sources pumped on the loop thread use this and drop when full.
  virtual void post(Msg msg) = 0;
  virtual void post_motion(int x, int y) = 0;
  virtual void quit() = 0;
};

class IEventSource {
public:
  virtual ~IEventSource() = default;
  // Reads whatever input is pending, waiting at most timeout_ms for the first event.
  virtual void pump(EventSink& sink, int timeout_ms) = 0;
};
