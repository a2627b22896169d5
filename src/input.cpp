#include "input.hpp"

static constexpr wint_t ESC = 27;
static constexpr wint_t DEL = 127;

bool key_for_char(wint_t ch, KeyMsg& out) {
  out = KeyMsg{};
  switch (ch) {
    case '\r': case '\n': out.type = KeyType::Enter; return true;
    case '\t': out.type = KeyType::Tab; return true;
    case ESC: out.type = KeyType::Esc; return true;
    case DEL: case 8: out.type = KeyType::Backspace; return true;
    case 3: out.type = KeyType::CtrlC; return true;
    case 4: out.type = KeyType::CtrlD; return true;
    case 12: out.type = KeyType::CtrlL; return true;
    case 26: out.type = KeyType::CtrlZ; return true;
    default: break;
  }
  if (ch < 0x20) return false;
  out.type = KeyType::Runes;
  out.runes.push_back(static_cast<char32_t>(ch));
  return true;
}

bool key_for_code(int code, KeyMsg& out) {
  out = KeyMsg{};
  switch (code) {
    case KEY_UP: out.type = KeyType::Up; return true;
    case KEY_DOWN: out.type = KeyType::Down; return true;
    case KEY_LEFT: out.type = KeyType::Left; return true;
    case KEY_RIGHT: out.type = KeyType::Right; return true;
    case KEY_HOME: out.type = KeyType::Home; return true;
    case KEY_END: out.type = KeyType::End; return true;
    case KEY_PPAGE: out.type = KeyType::PgUp; return true;
    case KEY_NPAGE: out.type = KeyType::PgDown; return true;
    case KEY_DC: out.type = KeyType::Delete; return true;
    case KEY_IC: out.type = KeyType::Insert; return true;
    case KEY_BACKSPACE: out.type = KeyType::Backspace; return true;
    case KEY_ENTER: out.type = KeyType::Enter; return true;
    default: break;
  }
  if (code >= KEY_F(1) && code <= KEY_F(12)) {
    out.type = static_cast<KeyType>(static_cast<int>(KeyType::F1) + (code - KEY_F(1)));
    return true;
  }
  return false;
}

void NcursesInput::pump(EventSink& sink, int timeout_ms) {
  wtimeout(stdscr, timeout_ms);
  wint_t wch = 0;
  int rc = wget_wch(stdscr, &wch);
  wtimeout(stdscr, 0);
  while (rc != ERR) {
    translate(sink, rc, wch);
    rc = wget_wch(stdscr, &wch);
  }
}

void NcursesInput::translate(EventSink& sink, int rc, wint_t wch) {
  if (rc == KEY_CODE_YES) translate_key(sink, static_cast<int>(wch));
  else translate_char(sink, wch);
}

void NcursesInput::translate_key(EventSink& sink, int code) {
  if (code == KEY_MOUSE) { translate_mouse(sink); return; }
  if (code == KEY_RESIZE) {
    int rows, cols; getmaxyx(stdscr, rows, cols);
    sink.post(WindowSizeMsg{cols, rows});
    return;
  }
  KeyMsg k;
  if (key_for_code(code, k)) sink.post(k);
}

void NcursesInput::translate_char(EventSink& sink, wint_t ch) {
  if (ch == ESC) {
    // ESC followed immediately by a printable key is an alt chord.
    wint_t next = 0;
    int rc = wget_wch(stdscr, &next);
    if (rc == OK && next >= 0x20 && next != DEL) {
      KeyMsg k;
      key_for_char(next, k);
      k.alt = true;
      sink.post(k);
      return;
    }
    KeyMsg esc;
    key_for_char(ESC, esc);
    sink.post(esc);
    if (rc != ERR) translate(sink, rc, next);
    return;
  }
  KeyMsg k;
  if (key_for_char(ch, k)) sink.post(k);
}

void NcursesInput::translate_mouse(EventSink& sink) {
  MEVENT me;
  if (getmouse(&me) != OK) return;
  auto press = [&](MouseButton b, MouseEventType t) { sink.post(MouseMsg{me.x, me.y, t, b}); };
  if (me.bstate & BUTTON1_PRESSED) press(MouseButton::Left, MouseEventType::Press);
  if (me.bstate & BUTTON1_RELEASED) press(MouseButton::Left, MouseEventType::Release);
  if (me.bstate & BUTTON2_PRESSED) press(MouseButton::Middle, MouseEventType::Press);
  if (me.bstate & BUTTON2_RELEASED) press(MouseButton::Middle, MouseEventType::Release);
  if (me.bstate & BUTTON3_PRESSED) press(MouseButton::Right, MouseEventType::Press);
  if (me.bstate & BUTTON3_RELEASED) press(MouseButton::Right, MouseEventType::Release);
  #ifdef BUTTON4_PRESSED
  if (me.bstate & BUTTON4_PRESSED) press(MouseButton::WheelUp, MouseEventType::Wheel);
  #endif
  #ifdef BUTTON5_PRESSED
  if (me.bstate & BUTTON5_PRESSED) press(MouseButton::WheelDown, MouseEventType::Wheel);
  #endif
  if (me.bstate & REPORT_MOUSE_POSITION) sink.post_motion(me.x, me.y);
}
