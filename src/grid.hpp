#pragma once
/*
 * Grid
 *
 * Purpose: fixed-size 2D array of styled cells plus row-granular diffing.
 * Constraint: dimensions are immutable; every access is bounds-checked and
 * out-of-range writes are ignored.
 */
#include <cstddef>
#include <vector>
#include "types.hpp"

class Grid {
public:
  Grid() = default;
  Grid(int width, int height);

  int width() const { return width_; }
  int height() const { return height_; }
  bool empty() const { return width_ == 0 || height_ == 0; }

  const Cell* at(int x, int y) const;
  Cell* at(int x, int y);
  void set(int x, int y, const Cell& cell);

  void clear();
  void clear_line(int y);
  void clear_from(int x, int y); // cursor..end of row
  void clear_to(int x, int y);   // start of row..cursor, inclusive

private:
  bool in_bounds(int x, int y) const { return x >= 0 && x < width_ && y >= 0 && y < height_; }
  int width_ = 0;
  int height_ = 0;
  std::vector<Cell> cells_;
};

// Maximal per-row runs of differing cells between `prev` and `next`.
// Mismatched dimensions yield a single region covering `next`.
std::vector<Region> diff(const Grid& prev, const Grid& next);
bool covers(const std::vector<Region>& regions, int x, int y);
