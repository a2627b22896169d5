#include "grid.hpp"

Grid::Grid(int width, int height) {
  if (width <= 0 || height <= 0) return;
  width_ = width;
  height_ = height;
  cells_.assign(static_cast<size_t>(width) * static_cast<size_t>(height), Cell{});
}

const Cell* Grid::at(int x, int y) const {
  if (!in_bounds(x, y)) return nullptr;
  return &cells_[static_cast<size_t>(y) * width_ + x];
}

Cell* Grid::at(int x, int y) {
  if (!in_bounds(x, y)) return nullptr;
  return &cells_[static_cast<size_t>(y) * width_ + x];
}

void Grid::set(int x, int y, const Cell& cell) {
  if (Cell* c = at(x, y)) *c = cell;
}

void Grid::clear() {
  for (auto& c : cells_) c = Cell{};
}

void Grid::clear_line(int y) {
  if (y < 0 || y >= height_) return;
  for (int x = 0; x < width_; ++x) cells_[static_cast<size_t>(y) * width_ + x] = Cell{};
}

void Grid::clear_from(int x, int y) {
  if (y < 0 || y >= height_) return;
  for (int i = x < 0 ? 0 : x; i < width_; ++i) cells_[static_cast<size_t>(y) * width_ + i] = Cell{};
}

void Grid::clear_to(int x, int y) {
  if (y < 0 || y >= height_) return;
  for (int i = 0; i <= x && i < width_; ++i) cells_[static_cast<size_t>(y) * width_ + i] = Cell{};
}

std::vector<Region> diff(const Grid& prev, const Grid& next) {
  if (prev.width() != next.width() || prev.height() != next.height()) {
    return {Region{0, 0, next.width(), next.height()}};
  }
  std::vector<Region> out;
  for (int y = 0; y < next.height(); ++y) {
    int start = -1;
    for (int x = 0; x < next.width(); ++x) {
      bool changed = !(*prev.at(x, y) == *next.at(x, y));
      if (changed && start < 0) {
        start = x;
      } else if (!changed && start >= 0) {
        out.push_back({start, y, x - start, 1});
        start = -1;
      }
    }
    if (start >= 0) out.push_back({start, y, next.width() - start, 1});
  }
  return out;
}

bool covers(const std::vector<Region>& regions, int x, int y) {
  for (const auto& r : regions) {
    if (x >= r.x && x < r.x + r.width && y >= r.y && y < r.y + r.height) return true;
  }
  return false;
}
