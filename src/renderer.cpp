#include "renderer.hpp"
#include <algorithm>

static void draw_region(ITerminal& term, const Grid& grid, const Region& r, int rows, int cols) {
  int y_end = std::min({r.y + r.height, grid.height(), rows});
  int x_end = std::min({r.x + r.width, grid.width(), cols});
  for (int y = std::max(0, r.y); y < y_end; ++y) {
    for (int x = std::max(0, r.x); x < x_end; ++x) {
      if (const Cell* c = grid.at(x, y)) term.draw_cell(y, x, *c);
    }
  }
}

bool Renderer::render(ITerminal& term,
                      const Grid& grid,
                      const std::vector<Region>& regions,
                      bool full,
                      std::string& msg) {
  if (grid.empty()) { msg = "render: empty grid"; return false; }
  TermSize sz = term.size();
  if (sz.rows <= 0 || sz.cols <= 0) { msg = "render: surface has no area"; return false; }
  if (full) {
    term.clear();
    draw_region(term, grid, Region{0, 0, grid.width(), grid.height()}, sz.rows, sz.cols);
  } else {
    if (regions.empty()) return true;
    for (const auto& r : regions) draw_region(term, grid, r, sz.rows, sz.cols);
  }
  term.refresh();
  return true;
}
