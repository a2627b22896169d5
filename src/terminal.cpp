#include "terminal.hpp"
#include <locale.h>
#include <cstdio>

// xterm "any event" mouse tracking, needed for motion reports.
static const char* kMotionOn = "\033[?1003h";
static const char* kMotionOff = "\033[?1003l";

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  curs_set(0);
  ESCDELAY = 25;
  mmask_t mask = ALL_MOUSE_EVENTS | REPORT_MOUSE_POSITION;
  mouseinterval(0);
  mousemask(mask, nullptr);
  std::fputs(kMotionOn, stdout);
  std::fflush(stdout);
}

Terminal::~Terminal() {
  std::fputs(kMotionOff, stdout);
  std::fflush(stdout);
  mousemask(0, nullptr);
  curs_set(1);
  endwin();
}
