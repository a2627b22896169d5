#include "ncurses_terminal.hpp"
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include "ansi_parser.hpp"

static int dist2(int r1, int g1, int b1, int r2, int g2, int b2) {
  int dr = r1 - r2, dg = g1 - g2, db = b1 - b2;
  return dr * dr + dg * dg + db * db;
}

static int cube_step(int v) {
  static const int levels[6] = {0, 95, 135, 175, 215, 255};
  int best = 0;
  for (int i = 1; i < 6; ++i)
    if (std::abs(levels[i] - v) < std::abs(levels[best] - v)) best = i;
  return best;
}

int nearest_xterm256(int r, int g, int b) {
  static const int levels[6] = {0, 95, 135, 175, 215, 255};
  int ri = cube_step(r), gi = cube_step(g), bi = cube_step(b);
  int cube = 16 + 36 * ri + 6 * gi + bi;
  int cube_d = dist2(r, g, b, levels[ri], levels[gi], levels[bi]);

  int avg = (r + g + b) / 3;
  int gi_idx = avg <= 8 ? 0 : (avg >= 238 ? 23 : (avg - 8 + 5) / 10);
  if (gi_idx > 23) gi_idx = 23;
  int gv = 8 + gi_idx * 10;
  int gray_d = dist2(r, g, b, gv, gv, gv);
  return gray_d < cube_d ? 232 + gi_idx : cube;
}

int nearest_ansi8(int r, int g, int b) {
  int best = 0, best_d = -1;
  for (int i = 0; i < 8; ++i) {
    Color c = ansi16_color(i);
    int d = dist2(r, g, b, c.r, c.g, c.b);
    if (best_d < 0 || d < best_d) { best = i; best_d = d; }
  }
  return best;
}

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    colors_ = true;
    default_colors_ = (use_default_colors() == OK);
    palette_ = COLORS >= 256 ? 256 : 8;
  }
}

TermSize NcursesTerminal::size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

short NcursesTerminal::color_index(const Color& c, bool foreground) const {
  if (c.is_default) {
    if (default_colors_) return -1;
    return foreground ? COLOR_WHITE : COLOR_BLACK;
  }
  if (palette_ >= 256) return static_cast<short>(nearest_xterm256(c.r, c.g, c.b));
  return static_cast<short>(nearest_ansi8(c.r, c.g, c.b));
}

short NcursesTerminal::pair_for(short fg, short bg) {
  auto key = std::make_pair(fg, bg);
  auto it = pairs_.find(key);
  if (it != pairs_.end()) return it->second;
  if (next_pair_ >= COLOR_PAIRS) return 0; // out of pairs: terminal default
  short id = next_pair_++;
  if (init_pair(id, fg, bg) == ERR) return 0;
  pairs_.emplace(key, id);
  return id;
}

void NcursesTerminal::draw_cell(int row, int col, const Cell& cell) {
  attr_t attrs = A_NORMAL;
  if (cell.bold) attrs |= A_BOLD;
  if (cell.underline) attrs |= A_UNDERLINE;
  #ifdef A_ITALIC
  if (cell.italic) attrs |= A_ITALIC;
  #endif
  if (cell.strikethrough) attrs |= A_DIM; // no strike attribute in curses
  short pair = 0;
  if (colors_) pair = pair_for(color_index(cell.fg, true), color_index(cell.bg, false));

  wchar_t wch[2] = {static_cast<wchar_t>(cell.ch), L'\0'};
  cchar_t cc;
  if (setcchar(&cc, wch, attrs, pair, nullptr) == ERR)
    throw std::runtime_error("setcchar failed at " + std::to_string(row) + "," + std::to_string(col));
  int rows, cols; getmaxyx(stdscr, rows, cols);
  // Writing the bottom-right cell reports ERR after the cursor wraps; the cell is drawn.
  if (mvadd_wch(row, col, &cc) == ERR && !(row == rows - 1 && col == cols - 1))
    throw std::runtime_error("draw failed at " + std::to_string(row) + "," + std::to_string(col));
}

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::set_title(const std::string& title) {
  std::fprintf(stdout, "\033]0;%s\007", title.c_str());
  std::fflush(stdout);
}
