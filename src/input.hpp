#pragma once
/*
 * NcursesInput
 *
 * Purpose: translate ncurses key/mouse/resize input into runtime messages.
 * Note: ncurses is not thread-safe, so pump() runs on the loop thread between ticks.
 */
#include <ncurses.h>
#include "iterminal.hpp"

class NcursesInput : public IEventSource {
public:
  void pump(EventSink& sink, int timeout_ms) override;

private:
  void translate(EventSink& sink, int rc, wint_t wch);
  void translate_key(EventSink& sink, int code);
  void translate_char(EventSink& sink, wint_t ch);
  void translate_mouse(EventSink& sink);
};

// Key message for a plain character (control codes map to named keys); false if ignored.
bool key_for_char(wint_t ch, KeyMsg& out);
// Key message for an ncurses KEY_* code; false if not a key we report.
bool key_for_code(int code, KeyMsg& out);
