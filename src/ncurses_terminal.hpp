#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation drawing styled cells with ncursesw.
 * Colors: default -> -1 (use_default_colors); RGB -> nearest xterm-256 index, or
 * nearest of the 8 base colors on smaller terminals. Pairs are allocated lazily.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"
#include <map>
#include <utility>
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  TermSize size() const override;
  void clear() override;
  void draw_cell(int row, int col, const Cell& cell) override;
  void refresh() override;
  void set_title(const std::string& title) override;

  int pairs_in_use() const { return static_cast<int>(pairs_.size()); }

private:
  short color_index(const Color& c, bool foreground) const;
  short pair_for(short fg, short bg);

  bool colors_ = false;
  bool default_colors_ = false;
  int palette_ = 8;
  std::map<std::pair<short, short>, short> pairs_;
  short next_pair_ = 1;
};

// Nearest xterm-256 palette index (16..255) for an RGB triple.
int nearest_xterm256(int r, int g, int b);
// Nearest of the 8 base ANSI colors.
int nearest_ansi8(int r, int g, int b);
